#include "core/signal_fusion_engine.hpp"
#include "core/report_formatter.hpp"
#include "core/thread_pool_manager.hpp"
#include "core/poco_config_adapter.hpp"
#include "core/logger_observer.hpp"
#include "logging/logger.hpp"
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{
    void printUsage(std::ostream &out, const char *program)
    {
        out << "Document Forensics - tamper detection for scanned documents" << std::endl;
        out << "Usage: " << program << " [options] <document_id> <image_path> [<document_id> <image_path> ...]"
            << std::endl;
        out << "Options:" << std::endl;
        out << "  --config <file>       Load configuration from a JSON file" << std::endl;
        out << "  --output <file>       Write the report to a file instead of stdout" << std::endl;
        out << "  --log-level <level>   TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
        out << "  --stats               Print processing statistics to stderr" << std::endl;
        out << "  --help, -h            Show this help message" << std::endl;
    }

    struct CliOptions
    {
        std::string config_path;
        std::string output_path;
        std::string log_level;
        bool print_stats = false;
        bool show_help = false;
        std::vector<SignalFusionEngine::DocumentRequest> documents;
    };

    // Throws std::invalid_argument on malformed command lines
    CliOptions parseArguments(int argc, char *argv[])
    {
        CliOptions options;
        std::vector<std::string> positional;

        for (int i = 1; i < argc; i++)
        {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                options.show_help = true;
            }
            else if (arg == "--stats")
            {
                options.print_stats = true;
            }
            else if (arg == "--config" || arg == "--output" || arg == "--log-level")
            {
                if (i + 1 >= argc)
                {
                    throw std::invalid_argument("Missing value for " + arg);
                }
                std::string value = argv[++i];
                if (arg == "--config")
                    options.config_path = value;
                else if (arg == "--output")
                    options.output_path = value;
                else
                    options.log_level = value;
            }
            else if (arg.rfind("--", 0) == 0)
            {
                throw std::invalid_argument("Unknown option: " + arg);
            }
            else
            {
                positional.push_back(arg);
            }
        }

        if (options.show_help)
            return options;

        if (positional.empty() || positional.size() % 2 != 0)
        {
            throw std::invalid_argument("Expected one or more <document_id> <image_path> pairs");
        }

        for (size_t i = 0; i < positional.size(); i += 2)
        {
            options.documents.emplace_back(positional[i], positional[i + 1]);
        }
        return options;
    }
}

int main(int argc, char *argv[])
{
    CliOptions options;
    try
    {
        options = parseArguments(argc, argv);
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        printUsage(std::cerr, argv[0]);
        return 1;
    }

    if (options.show_help)
    {
        printUsage(std::cout, argv[0]);
        return 0;
    }

    // Initialize configuration manager
    auto &config_manager = PocoConfigAdapter::getInstance();
    Logger::init(config_manager.getLogLevel());

    auto logger_observer = std::make_unique<LoggerObserver>();
    config_manager.subscribe(logger_observer.get());

    if (!options.config_path.empty() && !config_manager.loadConfig(options.config_path))
    {
        std::cerr << "Error: could not load configuration from " << options.config_path << std::endl;
        config_manager.unsubscribe(logger_observer.get());
        return 1;
    }

    ForensicsConfig config;
    try
    {
        if (!options.log_level.empty())
        {
            config_manager.setLogLevel(options.log_level);
        }
        else
        {
            Logger::init(config_manager.getLogLevel());
        }

        config = config_manager.getForensicsConfig();
        config.validate();
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        config_manager.unsubscribe(logger_observer.get());
        return 1;
    }

    ThreadPoolManager::initialize(static_cast<size_t>(config.max_processing_threads));

    int exit_code = 0;
    try
    {
        auto engine = SignalFusionEngine::createDefault(config);

        nlohmann::json output;
        if (options.documents.size() == 1)
        {
            const auto &document = options.documents.front();
            output = ReportFormatter::buildReport(engine->process(document.first, document.second));
        }
        else
        {
            output = nlohmann::json::array();
            for (const auto &result : engine->processBatch(options.documents))
            {
                output.push_back(ReportFormatter::buildReport(result));
            }
        }

        if (options.output_path.empty())
        {
            std::cout << output.dump(2) << std::endl;
        }
        else
        {
            std::ofstream file(options.output_path);
            if (!file.is_open())
            {
                throw std::runtime_error("Cannot open output file: " + options.output_path);
            }
            file << output.dump(2) << std::endl;
            Logger::info("Report written to " + options.output_path);
        }

        if (options.print_stats)
        {
            std::cerr << engine->getProcessingStats().toJson().dump(2) << std::endl;
        }
    }
    catch (const std::exception &e)
    {
        Logger::error("Document forensics failed: " + std::string(e.what()));
        exit_code = 1;
    }

    ThreadPoolManager::shutdown();
    config_manager.unsubscribe(logger_observer.get());
    return exit_code;
}
