/**
 * @file main.cpp
 * @brief KTree viewer example - loads a scene and renders it on a LogAG
 *
 * Demonstrates:
 * - Views setup over a recording graphics backend
 * - Loading a KTree scene from a directory or from memory
 * - Driving frames with GameLoop
 * - Writing the scene back as KTree XML
 *
 * Usage: ktree_viewer [scene.ktree]
 */

#include <kestrel/kestrel.hpp>

#include <iostream>
#include <string>

namespace {

const char* DEMO_SCENE =
    "<container name='root'>"
    "<solidrect name='background' width='320' height='240' colorMul='#203040'/>"
    "<ellipse name='ball' x='160' y='120' width='40' height='40' anchorX='0.5' anchorY='0.5'/>"
    "<container name='panel' x='20' y='20'>"
    "<solidrect width='80' height='30' colorMul='#ff8000' alpha='0.75'/>"
    "</container>"
    "</container>";

} // namespace

int main(int argc, char** argv) {
    std::cout << "Kestrel - KTree Viewer\n\n";

    try {
        kestrel::Logger::global().setMinLevel(kestrel::LogLevel::Info);

        kestrel::LogAG ag(320, 240);

        kestrel::ViewsConfig config;
        config.virtualWidth = 320;
        config.virtualHeight = 240;
        config.clearColor = kestrel::Colors::BLACK;

        // Scene source: a file on disk, or the built-in demo in memory
        kestrel::VfsFile sceneFile = kestrel::VfsFile::memory()["scene.ktree"];
        if (argc > 1) {
            std::string path = argv[1];
            auto slash = path.find_last_of('/');
            std::string dir = (slash == std::string::npos) ? "." : path.substr(0, slash);
            std::string name = (slash == std::string::npos) ? path : path.substr(slash + 1);
            sceneFile = kestrel::VfsFile::local(dir)[name];
        } else {
            sceneFile.writeString(DEMO_SCENE);
        }
        config.vfs = sceneFile.parent();

        kestrel::Views views(ag, config);

        kestrel::ViewPtr scene = kestrel::readKTree(sceneFile, views);
        kestrel::View& root = views.stage().addChild(std::move(scene));
        std::cout << "Loaded scene from " << sceneFile.vfs().describe(sceneFile.path()) << "\n";

        // Spin the whole scene slowly
        root.addUpdater([&root](double dt) {
            root.setRotationDegrees(root.rotationDegrees() + 30.0 * dt);
        });

        kestrel::GameLoop loop(views);
        loop.setRenderListener([](kestrel::RenderContext& ctx) {
            ctx.flush();
            std::cout << "Frame: " << ctx.stats().toString() << "\n";
        });
        loop.setErrorListener([](const std::exception& e) {
            std::cerr << "Frame error: " << e.what() << "\n";
            return false;
        });

        for (int i = 0; i < 3; i++) {
            if (!loop.runFrame(1.0 / 60.0)) {
                break;
            }
        }

        std::cout << "\nRendered " << views.frameCount() << " frames, "
                  << ag.log().size() << " backend commands:\n";
        std::cout << ag.logAsString() << "\n";

        std::cout << "\nScene as KTree:\n";
        std::cout << kestrel::viewTreeToKTree(root, views).toXmlString(true) << "\n";
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
