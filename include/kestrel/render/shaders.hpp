#pragma once

#include "kestrel/ag/ag.hpp"
#include "kestrel/ag/uniforms.hpp"

namespace kestrel {

/**
 * @brief Uniforms, vertex layout and program shared by all 2D rendering
 */
struct DefaultShaders {
    static inline const Uniform u_ProjMat{"u_ProjMat", VarType::Mat4};
    static inline const Uniform u_ViewMat{"u_ViewMat", VarType::Mat4};
    static inline const Uniform u_Tex{"u_Tex", VarType::Sampler2D};

    /// a_Pos (2 floats), a_Tex (2 floats), a_Col (4 normalized bytes)
    static inline const AGVertexLayout LAYOUT_DEFAULT{{
        {"a_Pos", 2, AGVertexAttribute::Type::Float},
        {"a_Tex", 2, AGVertexAttribute::Type::Float},
        {"a_Col", 4, AGVertexAttribute::Type::UByteNormalized},
    }};

    static inline const AGProgram PROGRAM_DEFAULT{"default", {u_ProjMat, u_ViewMat, u_Tex}};
};

} // namespace kestrel
