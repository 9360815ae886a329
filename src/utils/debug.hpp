#pragma once
#include <cstdlib>
#include <iostream>
#include <string>
#include "config/app_config.hpp"
#include "logging.hpp"

namespace debug
{

    // Print application startup banner
    inline void printStartup(const std::string &appName, const std::string &version)
    {
        std::cout << "=====================================\n";
        std::cout << "  " << appName << " v" << version << " starting...\n";
        std::cout << "=====================================\n";
    }

    // Print configuration details
    inline void printConfig(const AppConfig &config)
    {
        std::cout << "Configuration:\n";
        std::cout << "  - Source: " << config.capture.source << "\n";
        std::cout << "  - Resolution: " << config.capture.width << "x" << config.capture.height << "\n";
        std::cout << "  - FPS: " << config.capture.fps << "\n";
        if (!config.capture.crop.empty())
            std::cout << "  - Crop: " << config.capture.crop.toString() << "\n";
        std::cout << "  - Model: " << config.vision.model_path << "\n";
        std::cout << "  - OCR language: " << config.ocr.language << "\n";
        std::cout << "  - Database: " << config.database.path << "\n";
        std::cout << "  - Error log: " << config.database.error_db_path << "\n";
        if (config.dashboard.enabled)
            std::cout << "  - Dashboard: http://0.0.0.0:" << config.dashboard.port << "/\n";
        std::cout << "  - Regions (" << config.regions.size() << "):\n";
        for (const auto &entry : config.regions)
        {
            std::cout << "      " << entry.first << ": " << entry.second.toString() << std::endl;
        }
        std::cout << "-------------------------------------" << std::endl;
    }

    // Print version information and exit
    inline void printVersionAndExit(const std::string &version)
    {
        std::cout << "pokervision runtime version: " << version << std::endl;
        exit(0);
    }

    // Print help message and exit
    inline void printHelpAndExit()
    {
        std::cout << "Usage: pokervision [options]\n";
        std::cout << "Options:\n";
        std::cout << "  --config <path>      Settings file (default: config/settings.json)\n";
        std::cout << "  --source <src>       V4L2 device, video file or image sequence (overrides config)\n";
        std::cout << "  --fps <fps>          Target capture rate (overrides config)\n";
        std::cout << "  --model <path>       ONNX card detector model (overrides config)\n";
        std::cout << "  --port <port>        Dashboard port (overrides config)\n";
        std::cout << "  --write-config       Write the effective settings to the config path and exit\n";
        std::cout << "  --export <dir>       Export the session to a JSON file in <dir> on shutdown\n";
        std::cout << "  --debug, -d          Show all log messages and log to file\n";
        std::cout << "  --quiet, -q          Quiet mode (only show errors)\n";
        std::cout << "  --version            Show version information\n";
        std::cout << "  --help               Show this help message\n";
        exit(0);
    }

} // namespace debug
