#include "core/poco_config_manager.hpp"
#include "core/report_writer.hpp"
#include "core/scan_coordinator.hpp"
#include "core/scan_error.hpp"
#include "core/scan_limits.hpp"
#include "core/shutdown_manager.hpp"
#include "core/volume_inspector.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace
{
    constexpr int EXIT_CLEAN = 0;
    constexpr int EXIT_ERRORS_FOUND = 1;
    constexpr int EXIT_USAGE = 2;

    const char *DEFAULT_CONFIG_PATH = "config/config.json";

    struct Options
    {
        std::string root;
        std::string mount;
        std::string config_path;
        std::string csv_path;
        std::string json_path;
        std::string log_level;
        std::string log_file;
        int workers = -1; // -1: not given on the command line
    };

    void printUsage(const char *program)
    {
        std::cout << "USB Drive Verifier - checks a music drive against the player's limits" << std::endl;
        std::cout << "Usage: " << program << " <root> [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --mount <path>       Mount point of the drive (default: <root>)" << std::endl;
        std::cout << "  --workers <n>        Analysis workers, 0 for twice the CPU count" << std::endl;
        std::cout << "  --config <file>      JSON configuration (default: " << DEFAULT_CONFIG_PATH
                  << " if present)" << std::endl;
        std::cout << "  --csv <file>         CSV report (default: logs/drive_verify_<timestamp>.csv)" << std::endl;
        std::cout << "  --json <file>        Also write a JSON report" << std::endl;
        std::cout << "  --log-level <level>  TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
        std::cout << "  --log-file <file>    Copy the log output into a file" << std::endl;
        std::cout << "  --help, -h           Show this help message" << std::endl;
        std::cout << "Exit code: 0 no errors, 1 errors found, 2 usage error or unreadable root" << std::endl;
    }

    std::string timestamp()
    {
        std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
#ifdef _WIN32
        localtime_s(&local, &now);
#else
        localtime_r(&now, &local);
#endif
        std::ostringstream out;
        out << std::put_time(&local, "%Y%m%d_%H%M%S");
        return out.str();
    }

    // Returns false on a usage error (message already printed)
    bool parseArguments(int argc, char *argv[], Options &options, bool &show_help)
    {
        for (int i = 1; i < argc; i++)
        {
            std::string arg = argv[i];
            auto next = [&](std::string &target)
            {
                if (i + 1 >= argc)
                {
                    std::cerr << "Error: " << arg << " requires a value" << std::endl;
                    return false;
                }
                target = argv[++i];
                return true;
            };

            if (arg == "--help" || arg == "-h")
            {
                show_help = true;
                return true;
            }
            else if (arg == "--mount")
            {
                if (!next(options.mount))
                    return false;
            }
            else if (arg == "--config")
            {
                if (!next(options.config_path))
                    return false;
            }
            else if (arg == "--csv")
            {
                if (!next(options.csv_path))
                    return false;
            }
            else if (arg == "--json")
            {
                if (!next(options.json_path))
                    return false;
            }
            else if (arg == "--log-level")
            {
                if (!next(options.log_level))
                    return false;
            }
            else if (arg == "--log-file")
            {
                if (!next(options.log_file))
                    return false;
            }
            else if (arg == "--workers")
            {
                std::string value;
                if (!next(value))
                    return false;
                try
                {
                    size_t consumed = 0;
                    options.workers = std::stoi(value, &consumed);
                    if (consumed != value.size() || options.workers < 0)
                        throw std::invalid_argument(value);
                }
                catch (const std::exception &)
                {
                    std::cerr << "Error: invalid worker count: " << value << std::endl;
                    return false;
                }
            }
            else if (!arg.empty() && arg[0] == '-')
            {
                std::cerr << "Error: unknown option " << arg << std::endl;
                return false;
            }
            else if (options.root.empty())
            {
                options.root = arg;
            }
            else
            {
                std::cerr << "Error: more than one root given" << std::endl;
                return false;
            }
        }

        if (options.root.empty())
        {
            std::cerr << "Error: no root path given" << std::endl;
            return false;
        }
        return true;
    }
}

int main(int argc, char *argv[])
{
    Options options;
    bool show_help = false;
    if (!parseArguments(argc, argv, options, show_help))
    {
        printUsage(argv[0]);
        return EXIT_USAGE;
    }
    if (show_help)
    {
        printUsage(argv[0]);
        return EXIT_CLEAN;
    }

    auto &config_manager = PocoConfigManager::getInstance();
    std::string config_path = options.config_path;
    if (config_path.empty() && fs::exists(DEFAULT_CONFIG_PATH))
        config_path = DEFAULT_CONFIG_PATH;
    if (!config_path.empty() && !config_manager.load(config_path))
    {
        if (!options.config_path.empty())
        {
            std::cerr << "Error: could not load configuration from " << config_path << std::endl;
            return EXIT_USAGE;
        }
        Logger::warn("Using built-in defaults, " + config_path + " could not be loaded");
    }
    if (!config_manager.validateConfig())
    {
        Logger::warn("Configuration has invalid values, using built-in defaults");
        config_manager.resetToDefaults();
    }

    Logger::init(config_manager.getLogLevel());
    if (!options.log_level.empty())
        Logger::setLevel(options.log_level);
    if (!options.log_file.empty() && !Logger::addFileSink(options.log_file))
    {
        std::cerr << "Error: cannot open log file " << options.log_file << std::endl;
        return EXIT_USAGE;
    }

    ScanLimits limits = ScanLimits::fromConfig(config_manager);
    auto coordinator = std::make_shared<ScanCoordinator>(limits, VolumeInspector::createPlatformProvider());

    // The callback runs on the signal watcher thread and may outlive main's scope
    auto &shutdown_manager = ShutdownManager::getInstance();
    std::weak_ptr<ScanCoordinator> cancel_target = coordinator;
    shutdown_manager.onShutdown([cancel_target]()
                                {
        if (auto target = cancel_target.lock())
            target->cancel(); });
    shutdown_manager.installSignalHandlers();

    int requested_workers = options.workers >= 0 ? options.workers : config_manager.getWorkerCount();
    std::string mount = options.mount.empty() ? options.root : options.mount;

    Logger::info("Verifying " + options.root + " (mount " + mount + ")");

    ScanReport report;
    try
    {
        report = coordinator->scan(options.root, mount, requested_workers > 0 ? static_cast<size_t>(requested_workers) : 0);
    }
    catch (const ScanError &e)
    {
        std::cerr << "Error: cannot scan " << options.root << ": " << e.what() << std::endl;
        return EXIT_USAGE;
    }

    std::string csv_path = options.csv_path.empty() ? "logs/drive_verify_" + timestamp() + ".csv" : options.csv_path;
    bool written = ReportWriter::writeCsvFile(csv_path, report);
    if (!options.json_path.empty())
        written = ReportWriter::writeJsonFile(options.json_path, report) && written;

    if (report.summary.cancelled && shutdown_manager.isShutdownRequested())
    {
        Logger::warn("Scan interrupted (" + shutdown_manager.getReason() + "), the report is incomplete");
    }

    std::cout << std::endl;
    ReportWriter::printSummary(std::cout, report);
    if (written)
        std::cout << "\nReport: " << csv_path << std::endl;
    else
        Logger::error("One or more report files could not be written");

    return report.hasErrors() ? EXIT_ERRORS_FOUND : EXIT_CLEAN;
}
