#include "Logger.hpp"
#include "TrapWatchService.hpp"
#include <csignal>
#include <curl/curl.h>
#include <iostream>

namespace {

TrapWatch::TrapWatchService* g_service = nullptr;

void signalHandler(int) {
    if (g_service) {
        g_service->requestStop();
    }
}

void printHelp(const char* programName) {
    std::cout << "Usage: " << programName << " [OPTIONS] [FOLDER...]\n\n";
    std::cout << "Camera trap watcher\n";
    std::cout << "Classifies new images in the watched folders and tracks camera and plug liveness.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE                   Path to configuration JSON file\n";
    std::cout << "  --watch-method {inotify,os,polling} How new files are detected (default: polling)\n";
    std::cout << "  -h, --help                          Display this help message and exit\n\n";
    std::cout << "Folders given on the command line replace watchFolders from the config file.\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << programName << " -c /etc/trapwatch/trapwatch.json\n";
    std::cout << "  " << programName << " --watch-method inotify /srv/ftp/camera1 /srv/ftp/camera2\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configFile;
    TrapWatch::CommandLineOverrides overrides;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printHelp(argv[0]);
            return 0;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 < argc) {
                configFile = argv[++i];
            } else {
                std::cerr << "Error: " << arg << " requires a file path argument." << std::endl;
                return 1;
            }
        } else if (arg == "--watch-method") {
            if (i + 1 < argc) {
                overrides.watchMethod = argv[++i];
            } else {
                std::cerr << "Error: " << arg << " requires inotify, os or polling." << std::endl;
                return 1;
            }
            if (overrides.watchMethod != "inotify" && overrides.watchMethod != "os" &&
                overrides.watchMethod != "polling") {
                std::cerr << "Error: Invalid watch method: " << overrides.watchMethod << std::endl;
                return 1;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown argument: " << arg << std::endl;
            std::cerr << "Use -h or --help for usage information." << std::endl;
            return 1;
        } else {
            overrides.watchFolders.push_back(arg);
        }
    }

    curl_global_init(CURL_GLOBAL_DEFAULT);

    LOG_INFO("Trapwatch starting...");
    if (!configFile.empty()) {
        LOG_INFO("Config: " + configFile);
    }

    int exitCode = 0;
    {
        TrapWatch::TrapWatchService service;
        g_service = &service;
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        if (!service.initialize(configFile, overrides)) {
            std::cerr << "Error: Failed to initialize trapwatch service" << std::endl;
            exitCode = 1;
        } else {
            try {
                service.run();
            } catch (const std::exception& e) {
                LOG_ERROR("Exception in trapwatch service: " + std::string(e.what()));
                exitCode = 1;
            }
        }

        service.shutdown();
        g_service = nullptr;
    }

    curl_global_cleanup();
    LOG_INFO("Trapwatch stopped");
    return exitCode;
}
