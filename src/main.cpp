#include "application.hpp"
#include "core/config.hpp"
#include "utils/logger.hpp"
#include <cstring>
#include <iostream>

using namespace lazyverdi::tui;

namespace {

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--config PATH] [--debug]\n"
              << "  --config PATH   configuration file (default: " << Config::default_path() << ")\n"
              << "  --debug         keep debug messages in the log\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path = Config::default_path();
    Logger::instance().set_min_level(LogLevel::INFO);

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--debug") == 0) {
            Logger::instance().set_min_level(LogLevel::DEBUG);
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    LOG_INFO("main", "lazyverdi starting...");

    try {
        Application app(config_path);
        app.init();
        app.run();
        app.shutdown();
    } catch (const std::exception& e) {
        LOG_CRITICAL("main", std::string("Fatal error: ") + e.what());
        std::cerr << "lazyverdi: " << e.what() << "\n";
        return 1;
    }

    LOG_INFO("main", "lazyverdi shutting down...");
    return 0;
}
