#include "EventStoreApp.hpp"
#include <iostream>
#include <csignal>

// Global pointer for signal handler
eventstore::EventStoreApp* g_app = nullptr;

void signalHandler(int signal) {
    (void)signal;
    if (g_app) {
        g_app->stop();
    }
}

int main(int argc, char* argv[]) {
    try {
        eventstore::EventStoreApp app;
        g_app = &app;

        // Ctrl+C прерывает перестроение проекций между событиями
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        // Template Method вызывает:
        // 1. loadEnvironment()
        // 2. configureInjection()
        // 3. команду из argv
        int code = app.run(argc, argv);

        g_app = nullptr;
        return code;

    } catch (const std::exception& e) {
        g_app = nullptr;
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
