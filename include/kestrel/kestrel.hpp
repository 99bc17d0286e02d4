#pragma once

// Kestrel - Main include file
// Include this header to access the whole library

// Core foundation
#include "kestrel/core/types.hpp"
#include "kestrel/core/logging.hpp"
#include "kestrel/core/finally.hpp"
#include "kestrel/core/pool.hpp"
#include "kestrel/core/signal.hpp"
#include "kestrel/core/vfs.hpp"

// Math and images
#include "kestrel/math/geom.hpp"
#include "kestrel/math/matrix.hpp"
#include "kestrel/image/color.hpp"
#include "kestrel/image/bitmap.hpp"

// Accelerated graphics
#include "kestrel/ag/uniforms.hpp"
#include "kestrel/ag/ag.hpp"
#include "kestrel/ag/log_ag.hpp"

// Rendering
#include "kestrel/render/shaders.hpp"
#include "kestrel/render/stats.hpp"
#include "kestrel/render/texture.hpp"
#include "kestrel/render/render_context.hpp"

// Views and scenes
#include "kestrel/view/length.hpp"
#include "kestrel/view/view.hpp"
#include "kestrel/view/container.hpp"
#include "kestrel/view/rect_base.hpp"
#include "kestrel/view/ellipse.hpp"
#include "kestrel/view/image.hpp"
#include "kestrel/view/views.hpp"
#include "kestrel/ktree/xml.hpp"
#include "kestrel/ktree/ktree.hpp"

// Fonts
#include "kestrel/font/font.hpp"
#include "kestrel/font/ttf_font.hpp"
#include "kestrel/font/system_font.hpp"
#include "kestrel/font/font_registry.hpp"

// Frame loop
#include "kestrel/engine/frame_clock.hpp"
#include "kestrel/engine/game_loop.hpp"
