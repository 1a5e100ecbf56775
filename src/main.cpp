/*
 * tabwright - remote tab extractor
 *
 * Drives an already-running browser over its DevTools channel: keeps the
 * tab scrolled, focused and "active" while reading items off the page.
 *
 * Usage:
 *   ./tabwright [options] [search terms]
 */

#include <tabwright/app/application.hpp>

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[]) {
    tabwright::Application& app = tabwright::Application::instance();

    if (!app.init(argc, argv)) {
        // init returns false for --help/--version or fatal errors
        app.shutdown();
        return app.exit_code();
    }

    int result = app.run();
    app.shutdown();

    return result;
}
