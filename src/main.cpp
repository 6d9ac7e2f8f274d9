#include "core/authenticity_engine.hpp"
#include "core/batch_analyzer.hpp"
#include "core/file_utils.hpp"
#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <vector>

namespace
{
    constexpr int kExitOk = 0;
    constexpr int kExitUsage = 1;
    constexpr int kExitRejected = 2;

    void printUsage(const char *program)
    {
        std::cout << "authscore - content authenticity scoring" << std::endl;
        std::cout << "Usage: " << program << " [options] <file>..." << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config, -c <path>   Load configuration from a JSON file" << std::endl;
        std::cout << "  --mime, -m <type>     Declared MIME type for every file (default: from extension)" << std::endl;
        std::cout << "  --remote, -r          Merge in the remote detector score" << std::endl;
        std::cout << "  --dir, -d <path>      Analyze every file in a directory" << std::endl;
        std::cout << "  --recursive           Descend into subdirectories with --dir" << std::endl;
        std::cout << "  --log-level <level>   TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
        std::cout << "  --help, -h            Show this help message" << std::endl;
    }
}

int main(int argc, char *argv[])
{
    std::string config_path;
    std::string mime_override;
    std::string dir_path;
    std::string log_level;
    bool use_remote = false;
    bool recursive = false;
    std::vector<std::string> files;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        auto next_value = [&](std::string &target) -> bool
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
            printUsage(argv[0]);
            return kExitOk;
        }
        else if (arg == "--config" || arg == "-c")
        {
            if (!next_value(config_path))
                return kExitUsage;
        }
        else if (arg == "--mime" || arg == "-m")
        {
            if (!next_value(mime_override))
                return kExitUsage;
        }
        else if (arg == "--dir" || arg == "-d")
        {
            if (!next_value(dir_path))
                return kExitUsage;
        }
        else if (arg == "--log-level")
        {
            if (!next_value(log_level))
                return kExitUsage;
        }
        else if (arg == "--remote" || arg == "-r")
        {
            use_remote = true;
        }
        else if (arg == "--recursive")
        {
            recursive = true;
        }
        else if (!arg.empty() && arg[0] == '-')
        {
            std::cerr << "Error: unknown option " << arg << std::endl;
            printUsage(argv[0]);
            return kExitUsage;
        }
        else
        {
            files.push_back(arg);
        }
    }

    PocoConfigManager config;
    if (!config_path.empty() && !config.load(config_path))
    {
        std::cerr << "Error: could not load configuration from " << config_path << std::endl;
        return kExitUsage;
    }

    Logger::init(log_level.empty() ? config.getLogLevel() : log_level);

    if (!config.validateConfig())
    {
        std::cerr << "Error: invalid configuration" << std::endl;
        return kExitUsage;
    }

    if (!dir_path.empty())
    {
        if (!FileUtils::isValidDirectory(dir_path))
        {
            std::cerr << "Error: not a directory: " << dir_path << std::endl;
            return kExitUsage;
        }
        auto listed = BatchAnalyzer::collectFiles(dir_path, recursive);
        files.insert(files.end(), listed.begin(), listed.end());
    }

    if (files.empty())
    {
        std::cerr << "Error: no input files" << std::endl;
        printUsage(argv[0]);
        return kExitUsage;
    }

    EngineOptions options = EngineOptions::fromConfig(config);
    if (use_remote)
    {
        options.remote.enabled = true;
    }
    auto engine = AuthenticityEngine::create(std::move(options));

    BatchAnalyzer analyzer(*engine, UploadLimits::fromConfig(config), config.getMaxAnalysisThreads(), use_remote);
    auto results = analyzer.analyzeFiles(files, mime_override);

    int exit_code = kExitOk;
    const bool single = results.size() == 1 && dir_path.empty();
    for (const auto &item : results)
    {
        if (!item.success)
        {
            exit_code = kExitRejected;
        }

        if (single)
        {
            if (item.success)
                std::cout << nlohmann::json(*item.result).dump(2) << std::endl;
            else
                std::cout << nlohmann::json{{"file", item.file_path}, {"error", item.error_message}}.dump(2) << std::endl;
            continue;
        }

        nlohmann::json line;
        line["file"] = item.file_path;
        if (item.success)
        {
            line["sha256"] = item.content_hash;
            line["result"] = *item.result;
        }
        else
        {
            line["error"] = item.error_message;
        }
        std::cout << line.dump() << std::endl;
    }

    return exit_code;
}
