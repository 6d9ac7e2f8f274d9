#include "core/authenticity_engine.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <iostream>
#include <string>
#include <vector>

/**
 * Example showing the engine API directly
 *
 * Builds an engine asynchronously, analyzes an in-memory JPEG-like buffer and
 * then every file given on the command line.
 */

int main(int argc, char *argv[])
{
    std::cout << "=== AuthenticityEngine Example ===" << std::endl;
    Logger::init("WARN");

    auto pending = AuthenticityEngine::createAsync();
    auto engine = pending.get();

    // Example 1: in-memory buffer with JPEG start/end markers
    std::vector<uint8_t> jpeg = {0xFF, 0xD8, 0xFF, 0xDB, 0x00, 0x43, 0x00, 0x10, 0x20, 0xFF, 0xD9};
    AnalysisResult result = engine->analyze(jpeg, "image/jpeg");
    std::cout << "\n1. In-memory JPEG:" << std::endl;
    std::cout << "  Score: " << result.score << " (" << result.category << ")" << std::endl;
    for (const auto &feature : result.feature_contributions)
    {
        std::cout << "  " << feature.first << ": " << feature.second << std::endl;
    }

    // Example 2: files from the command line
    std::cout << "\n2. Files:" << std::endl;
    for (int i = 1; i < argc; i++)
    {
        std::string path = argv[i];
        auto contents = FileUtils::readFile(path);
        if (!contents)
        {
            std::cerr << "  Could not read " << path << std::endl;
            continue;
        }
        std::string mime = MediaTypes::mimeTypeForPath(path);
        AnalysisResult file_result = engine->analyze(*contents, mime);
        std::cout << "  " << path << ": " << nlohmann::json(file_result).dump() << std::endl;
    }

    return 0;
}
