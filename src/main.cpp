/*
 * ClawSuite - Gateway dashboard server
 *
 * Keeps one connection to the agent gateway and serves terminals and the
 * live activity feed to browser tabs.
 *
 * Usage:
 *   ./clawsuite [config.json]
 */

#include <clawsuite/core/application.hpp>

int main(int argc, char* argv[]) {
    clawsuite::Application& app = clawsuite::Application::instance();

    if (!app.init(argc, argv)) {
        // --help/--version or a fatal startup error
        int code = app.exit_code();
        app.shutdown();
        return code;
    }

    int result = app.run();
    app.shutdown();

    return result;
}
