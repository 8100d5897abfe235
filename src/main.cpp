#include "WebAuthApp.hpp"
#include <iostream>
#include <csignal>

namespace {

webauth::WebAuthApp* runningApp = nullptr;

void onShutdownSignal(int signal) {
    std::cout << "\n[main] Signal " << signal << ", stopping WebAuth Service" << std::endl;
    if (runningApp) {
        runningApp->stop();
    }
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        webauth::WebAuthApp app;
        runningApp = &app;

        std::signal(SIGINT, onShutdownSignal);
        std::signal(SIGTERM, onShutdownSignal);

        std::cout << "[main] WebAuth Service v1.0.0" << std::endl;

        app.run(argc, argv);

        runningApp = nullptr;
        std::cout << "[main] Stopped" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        runningApp = nullptr;
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
