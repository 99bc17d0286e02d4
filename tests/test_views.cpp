/**
 * @file test_views.cpp
 * @brief View tree tests - hierarchy, length bindings, rendering and the frame loop
 *
 * This test verifies:
 * - Container ownership and child access
 * - Percent length bindings against the parent size
 * - Updaters scaled by speed through the hierarchy
 * - Rendering of rects, ellipses, clipped containers and skipped views
 * - Views frame sequence and invalidation tracking
 * - GameLoop frames, listeners and error handling
 */

#include <kestrel/kestrel.hpp>

#include <cassert>
#include <cmath>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace kestrel;

namespace {

bool near(double a, double b, double eps = 1e-6) {
    return std::abs(a - b) < eps;
}

bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

std::vector<TexturedVertex> verticesOf(const LogAG::DrawRecord& draw) {
    std::vector<TexturedVertex> out(draw.vertices.size() / sizeof(TexturedVertex));
    std::memcpy(out.data(), draw.vertices.data(), out.size() * sizeof(TexturedVertex));
    return out;
}

size_t countLines(const LogAG& ag, const std::string& prefix) {
    size_t count = 0;
    for (const auto& line : ag.log()) {
        if (line.compare(0, prefix.size(), prefix) == 0) {
            count++;
        }
    }
    return count;
}

} // namespace

// ============================================================================
// Hierarchy
// ============================================================================

void test_view_defaults() {
    std::cout << "Testing: View property defaults... ";

    SolidRect rect(10, 20);
    assert(!rect.name());
    assert(rect.colorMul() == Colors::WHITE);
    assert(rect.alpha() == 1.0 && rect.speed() == 1.0 && rect.ratio() == 0.0);
    assert(rect.x() == 0.0 && rect.y() == 0.0 && rect.rotation() == 0.0);
    assert(rect.scaleX() == 1.0 && rect.scaleY() == 1.0);
    assert(rect.skewX() == 0.0 && rect.skewY() == 0.0);
    assert(rect.visible());
    assert(rect.anchorX() == 0.0 && rect.anchorY() == 0.0);
    assert(rect.width() == 10.0 && rect.height() == 20.0);

    rect.setRotationDegrees(90.0);
    assert(near(rect.rotation(), std::acos(-1.0) / 2.0));
    assert(near(rect.rotationDegrees(), 90.0));

    SolidRect red(1, 1, Colors::RED);
    assert(red.color() == Colors::RED);
    assert(red.colorMul() == Colors::RED);

    Ellipse ellipse(50, 25);
    assert(ellipse.width() == 100.0 && ellipse.height() == 50.0);
    assert(ellipse.radiusX() == 50.0);

    Container container;
    assert(container.width() == 0.0);

    std::cout << "PASSED\n";
}

void test_container_children() {
    std::cout << "Testing: Container child ownership... ";

    Container root;
    SolidRect& a = root.add<SolidRect>(10, 10, Colors::RED);
    Ellipse& b = root.add<Ellipse>(5, 5);
    assert(root.numChildren() == 2);
    assert(&root.getChildAt(0) == &a);
    assert(&root.getChildAt(1) == &b);
    assert(a.parent() == &root);

    std::vector<std::string> types;
    root.forEachChildren([&](View& child) { types.emplace_back(child.typeName()); });
    assert((types == std::vector<std::string>{"SolidRect", "Ellipse"}));

    bool thrown = false;
    try {
        root.getChildAt(2);
    } catch (const std::out_of_range&) {
        thrown = true;
    }
    assert(thrown);

    thrown = false;
    try {
        root.addChild(ViewPtr());
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    ViewPtr removed = a.removeFromParent();
    assert(removed.get() == &a);
    assert(a.parent() == nullptr);
    assert(root.numChildren() == 1);
    assert(!a.removeFromParent());
    assert(!root.removeChild(removed.get()));

    root.addChild(std::move(removed));
    assert(&root.getChildAt(1) == &a);
    root.removeChildren();
    assert(root.numChildren() == 0);

    std::cout << "PASSED\n";
}

void test_global_matrix_and_color() {
    std::cout << "Testing: Global matrix and render color... ";

    Container root;
    root.xy(100, 0);
    root.setAlpha(0.5);
    Container& inner = root.add<Container>();
    inner.setScaleX(2.0);
    SolidRect& rect = inner.add<SolidRect>(10, 10, Colors::RED);
    rect.xy(10, 20);

    Point p = rect.globalMatrix().transform(Point(0, 0));
    assert(near(p.x, 120.0) && near(p.y, 20.0));

    RGBA color = rect.renderColorMul();
    assert(color == RGBA(255, 0, 0, 128));

    std::cout << "PASSED\n";
}

// ============================================================================
// Update
// ============================================================================

void test_percent_lengths() {
    std::cout << "Testing: Percent lengths resolve against the parent... ";

    LogAG ag;
    Views views(ag);
    FixedSizeContainer& box = views.stage().add<FixedSizeContainer>(300, 500);
    SolidRect& rect = box.add<SolidRect>(10, 10, Colors::RED);

    rect.lengths([](LengthBindings& l) {
        l.x = Length::percent(50);
        l.y = Length::percent(50);
        l.width = Length::percent(10);
        l.height = Length::px(7);
    });
    assert(rect.hasLengthBindings());
    // Bindings apply on the next update
    assert(rect.x() == 0.0);

    views.update(0.016);
    assert(near(rect.x(), 150.0));
    assert(near(rect.y(), 250.0));
    assert(near(rect.width(), 30.0));
    assert(near(rect.height(), 7.0));

    // Active bindings override manual changes
    rect.setX(5.0);
    views.update(0.016);
    assert(near(rect.x(), 150.0));

    // Parent resize is picked up
    box.setWidth(100);
    views.update(0.016);
    assert(near(rect.x(), 50.0));

    // Without bindings manual values persist
    rect.lengths([](LengthBindings& l) {
        l.x.reset();
        l.y.reset();
        l.width.reset();
        l.height.reset();
    });
    assert(!rect.hasLengthBindings());
    rect.setX(5.0);
    views.update(0.016);
    assert(rect.x() == 5.0);

    assert(Length::percent(25).resolve(200) == 50.0);
    assert(Length::px(12).resolve(200) == 12.0);

    std::cout << "PASSED\n";
}

void test_updaters_and_speed() {
    std::cout << "Testing: Updaters receive speed-scaled deltas... ";

    Container root;
    root.setSpeed(0.5);
    SolidRect& rect = root.add<SolidRect>(1, 1);
    rect.setSpeed(4.0);

    double rootDt = 0.0;
    double rectDt = 0.0;
    root.addUpdater([&](double dt) { rootDt = dt; });
    size_t id = rect.addUpdater([&](double dt) { rectDt = dt; });

    root.update(0.25);
    assert(near(rootDt, 0.125));
    assert(near(rectDt, 0.5));

    assert(rect.removeUpdater(id));
    rectDt = 0.0;
    root.update(0.25);
    assert(rectDt == 0.0);

    // A child removed by a sibling's updater is not updated
    Container parent;
    SolidRect& first = parent.add<SolidRect>(1, 1);
    SolidRect& second = parent.add<SolidRect>(1, 1);
    int secondUpdates = 0;
    ViewPtr detached;
    first.addUpdater([&](double) { detached = second.removeFromParent(); });
    second.addUpdater([&](double) { secondUpdates++; });
    parent.update(0.1);
    assert(secondUpdates == 0);
    assert(parent.numChildren() == 1);

    std::cout << "PASSED\n";
}

// ============================================================================
// Rendering
// ============================================================================

void test_rect_rendering() {
    std::cout << "Testing: Rects render as quads offset by the anchor... ";

    LogAG ag;
    Views views(ag);
    SolidRect& a = views.stage().add<SolidRect>(20, 20, Colors::RED);
    a.xy(100, 50);
    a.anchor(0.5, 0.5);
    views.stage().add<SolidRect>(10, 10, Colors::BLUE).xy(0, 0);

    views.render();

    // Both rects use the white texture and share one draw
    assert(ag.drawCount() == 1);
    std::vector<TexturedVertex> vertices = verticesOf(ag.draws()[0]);
    assert(vertices.size() == 8);
    assert(vertices[0].x == 90.0f && vertices[0].y == 40.0f);
    assert(vertices[2].x == 110.0f && vertices[2].y == 60.0f);
    assert(vertices[0].colorMul == Colors::RED.packed());
    assert(vertices[4].colorMul == Colors::BLUE.packed());

    std::cout << "PASSED\n";
}

void test_skipped_views() {
    std::cout << "Testing: Invisible and transparent views are skipped... ";

    LogAG ag;
    Views views(ag);
    views.stage().add<SolidRect>(10, 10).setVisible(false);
    views.stage().add<SolidRect>(10, 10).setAlpha(0.0);
    Container& hidden = views.stage().add<Container>();
    hidden.add<SolidRect>(10, 10);
    hidden.setVisible(false);

    views.render();
    assert(ag.drawCount() == 0);

    std::cout << "PASSED\n";
}

void test_ellipse_rendering() {
    std::cout << "Testing: Ellipses render as a triangle fan... ";

    LogAG ag;
    Views views(ag);
    Ellipse& ellipse = views.stage().add<Ellipse>(10, 10, Colors::GREEN);
    ellipse.setColorMul(RGBA(255, 255, 255, 128));
    assert(ellipse.segmentCount() == 16);

    views.render();

    assert(ag.drawCount() == 1);
    assert(ag.draws()[0].vertexCount == 16 * 3);
    std::vector<TexturedVertex> vertices = verticesOf(ag.draws()[0]);
    assert(vertices.size() == 17);
    assert(vertices[0].x == 10.0f && vertices[0].y == 10.0f);
    assert(near(vertices[1].x, 20.0, 1e-4) && near(vertices[1].y, 10.0, 1e-4));
    assert(vertices[0].colorMul == RGBA(0, 128, 0, 128).packed());

    std::cout << "PASSED\n";
}

void test_clipped_container() {
    std::cout << "Testing: Clipping containers scissor their children... ";

    LogAG ag;
    Views views(ag);
    FixedSizeContainer& clip = views.stage().add<FixedSizeContainer>(50, 40, true);
    clip.xy(5, 5);
    clip.add<SolidRect>(100, 100);
    views.stage().add<SolidRect>(10, 10);

    views.render();

    assert(ag.drawCount() == 2);
    assert(ag.draws()[0].scissor == AGScissor({5, 5, 50, 40}));
    assert(!ag.draws()[1].scissor);

    std::cout << "PASSED\n";
}

void test_image_view() {
    std::cout << "Testing: Image views draw their bitmap... ";

    LogAG ag;
    Views views(ag);
    BitmapRef bmp = Bitmap32::create(8, 4, Colors::BLUE);
    Image& image = views.stage().add<Image>(bmp);
    assert(image.width() == 8.0 && image.height() == 4.0);
    assert(!image.sourceImage());

    views.render();
    assert(ag.drawCount() == 1);
    assert(contains(ag.logAsString(), ".upload(8x4, mipmaps=false)"));

    image.setBitmap(BmpSlice(bmp).slice(0, 0, 2, 2));
    assert(image.width() == 2.0);

    // Missing files keep a transparent bitmap
    image.forceLoadSourceImage(VfsFile::memory(), std::string("missing.png"));
    assert(image.sourceImage() == std::optional<std::string>("missing.png"));
    assert(image.bitmap().bmp()->get(0, 0) == Colors::TRANSPARENT_BLACK);
    assert(image.width() == 1.0);

    image.forceLoadSourceImage(VfsFile::memory(), std::nullopt);
    assert(!image.sourceImage());

    std::cout << "PASSED\n";
}

// ============================================================================
// Views
// ============================================================================

void test_views_frame_sequence() {
    std::cout << "Testing: Views frame clears, draws and flips... ";

    LogAG ag;
    ViewsConfig config;
    config.virtualWidth = 320;
    config.virtualHeight = 200;
    config.clearColor = Colors::BLUE;
    Views views(ag, config);
    assert(views.stage().width() == 320.0 && views.stage().height() == 200.0);
    assert(views.stage().name() == std::optional<std::string>("stage"));
    assert(views.currentVfs().path() == "/");
    assert(views.renderContext().views() == &views);

    double elapsed = 0.0;
    views.stage().add<SolidRect>(10, 10).addUpdater([&](double dt) { elapsed += dt; });

    ag.clearLog();
    views.frame(0.5);
    assert(near(elapsed, 0.5));
    assert(views.frameCount() == 1);

    const auto& log = ag.log();
    assert(log.front() == "clear(color=#0000ffff, depth=1, stencil=0)");
    assert(log.back() == "flip()");
    assert(contains(log[log.size() - 2], "draw(program=default"));
    assert(views.renderContext().stats().drawCalls == 1);

    views.frame(0.5);
    assert(views.frameCount() == 2);
    assert(countLines(ag, "clear(") == 2);
    assert(countLines(ag, "flip()") == 2);

    std::cout << "PASSED\n";
}

void test_views_no_clear() {
    std::cout << "Testing: Views without per-frame clear... ";

    LogAG ag;
    ViewsConfig config;
    config.clearEachFrame = false;
    config.vfs = VfsFile::memory();
    (*config.vfs)["a.txt"].writeString("x");
    Views views(ag, config);
    assert(views.currentVfs()["a.txt"].readString() == "x");

    views.render();
    assert(countLines(ag, "clear(") == 0);
    assert(ag.log().back() == "flip()");

    std::cout << "PASSED\n";
}

void test_invalidation() {
    std::cout << "Testing: Invalidation tracking... ";

    LogAG ag;
    Views views(ag);
    SolidRect& rect = views.stage().add<SolidRect>(10, 10);

    std::vector<View*> seen;
    views.onInvalidated().add([&](View* view) { seen.push_back(view); });

    views.invalidatedView(&rect);
    assert(views.invalidationCount() == 1);
    assert(views.lastInvalidatedView() == &rect);

    // Changing the debug view invalidates the old and the new one
    views.renderContext().setDebugAnnotateView(&views.stage());
    assert(views.invalidationCount() == 3);
    assert((seen == std::vector<View*>{&rect, nullptr, &views.stage()}));
    assert(views.renderContext().debugAnnotateView() == &views.stage());

    std::cout << "PASSED\n";
}

// ============================================================================
// GameLoop
// ============================================================================

void test_game_loop_run_frame() {
    std::cout << "Testing: GameLoop runs frames with listeners... ";

    LogAG ag;
    Views views(ag);
    GameLoop loop(views);

    std::vector<std::string> order;
    loop.setUpdateListener([&](double dt) {
        assert(near(dt, 0.1));
        order.emplace_back("update");
    });
    loop.setRenderListener([&](RenderContext& ctx) {
        order.emplace_back("render");
        ctx.useCtx2d([](RenderContext2D& c2d) { c2d.rect(0, 0, 4, 4, Colors::RED); });
    });
    loop.setFrameEndListener([&] { order.emplace_back("end"); });

    ag.clearLog();
    assert(loop.runFrame(0.1));
    assert(loop.frameNumber() == 1);
    assert((order == std::vector<std::string>{"update", "render", "end"}));

    // The listener's quad is flushed before the flip
    assert(ag.drawCount() == 1);
    assert(ag.log().back() == "flip()");
    assert(views.frameCount() == 1);

    loop.setTargetFramerate(50.0);
    assert(near(loop.targetFrameTime(), 0.02));
    loop.setTargetFramerate(0.0);
    assert(loop.targetFrameTime() == 0.0);

    std::cout << "PASSED\n";
}

void test_game_loop_errors() {
    std::cout << "Testing: GameLoop error listener decides to continue... ";

    std::vector<std::string> errors;
    Logger::global().setSink([&](LogLevel level, LogCategory category, std::string_view message) {
        if (level == LogLevel::Error && category == LogCategory::Core) {
            errors.emplace_back(message);
        }
    });

    LogAG ag;
    Views views(ag);
    GameLoop loop(views);
    loop.setUpdateListener([](double) { throw std::runtime_error("update failed"); });

    // No listener: logged and the loop keeps going
    assert(loop.runFrame(0.1));
    assert(loop.frameNumber() == 1);

    int seen = 0;
    loop.setErrorListener([&](const std::exception& e) {
        seen++;
        assert(std::string(e.what()) == "update failed");
        return false;
    });
    assert(!loop.runFrame(0.1));
    assert(seen == 1);
    assert(loop.frameNumber() == 1);

    Logger::global().setSink(nullptr);
    assert(errors.size() == 2);
    assert(contains(errors[0], "update failed"));

    std::cout << "PASSED\n";
}

void test_game_loop_run_until_quit() {
    std::cout << "Testing: GameLoop::run stops on quit()... ";

    LogAG ag;
    Views views(ag);
    GameLoop loop(views);

    bool runningInside = false;
    loop.setUpdateListener([&](double dt) {
        assert(dt >= 0.0 && dt <= views.clock().maxDelta());
        runningInside = loop.isRunning();
        if (loop.frameNumber() >= 2) {
            loop.quit();
        }
    });
    loop.run();

    assert(runningInside);
    assert(!loop.isRunning());
    assert(loop.frameNumber() == 3);
    assert(views.frameCount() == 3);
    assert(views.clock().frameCount() == 3);

    std::cout << "PASSED\n";
}

void test_frame_clock() {
    std::cout << "Testing: FrameClock deltas are clamped... ";

    FrameClock clock;
    assert(clock.advance(0.1) == 0.1);
    assert(clock.advance(5.0) == clock.maxDelta());
    assert(clock.advance(-1.0) == 0.0);
    assert(clock.frameCount() == 3);
    assert(near(clock.totalTime(), 0.35));

    clock.start();
    assert(clock.totalTime() == 0.0 && clock.frameCount() == 0);

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n========================================\n";
    std::cout << "Kestrel - View Tests\n";
    std::cout << "========================================\n\n";

    try {
        test_view_defaults();
        test_container_children();
        test_global_matrix_and_color();
        test_percent_lengths();
        test_updaters_and_speed();
        test_rect_rendering();
        test_skipped_views();
        test_ellipse_rendering();
        test_clipped_container();
        test_image_view();
        test_views_frame_sequence();
        test_views_no_clear();
        test_invalidation();
        test_game_loop_run_frame();
        test_game_loop_errors();
        test_game_loop_run_until_quit();
        test_frame_clock();

        std::cout << "\n========================================\n";
        std::cout << "All view tests PASSED!\n";
        std::cout << "========================================\n\n";
    }
    catch (const std::exception& e) {
        std::cerr << "\nTest FAILED with exception: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
