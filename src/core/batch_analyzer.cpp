#include "core/batch_analyzer.hpp"
#include "core/content_hash.hpp"
#include "core/file_utils.hpp"
#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <algorithm>
#include <exception>
#include <utility>

UploadLimits UploadLimits::fromConfig(const PocoConfigManager &config)
{
    UploadLimits limits;
    limits.max_file_size_bytes = static_cast<uint64_t>(config.getMaxFileSizeMB()) * 1024 * 1024;
    limits.accepted_mime_types = config.getAcceptedMimeTypes();
    return limits;
}

std::string UploadLimits::check(const std::string &mime_type, uint64_t size_bytes) const
{
    const std::string mime = MediaTypes::normalizeMimeType(mime_type);
    if (mime.empty())
    {
        return "Unsupported file type";
    }
    if (std::find(accepted_mime_types.begin(), accepted_mime_types.end(), mime) == accepted_mime_types.end())
    {
        return "Unsupported media type: " + mime;
    }
    if (size_bytes > max_file_size_bytes)
    {
        return "File too large: " + std::to_string(size_bytes) + " bytes (limit " +
               std::to_string(max_file_size_bytes) + " bytes)";
    }
    return "";
}

BatchAnalyzer::BatchAnalyzer(const AuthenticityEngine &engine, UploadLimits limits, int max_threads, bool use_remote)
    : engine_(engine), limits_(std::move(limits)), max_threads_(max_threads), use_remote_(use_remote)
{
    if (max_threads_ <= 0)
    {
        Logger::warn("BatchAnalyzer: invalid thread count " + std::to_string(max_threads_) + ", using 1");
        max_threads_ = 1;
    }
}

BatchItemResult BatchAnalyzer::analyzeFile(const std::string &file_path, const std::string &mime_override) const
{
    BatchItemResult item;
    item.file_path = file_path;

    const std::string mime_type = mime_override.empty() ? MediaTypes::mimeTypeForPath(file_path) : mime_override;

    auto size = FileUtils::getFileSize(file_path);
    if (!size)
    {
        item.error_message = "File not found: " + file_path;
        Logger::warn("BatchAnalyzer: " + item.error_message);
        return item;
    }

    std::string rejection = limits_.check(mime_type, *size);
    if (!rejection.empty())
    {
        item.error_message = rejection;
        Logger::warn("BatchAnalyzer: rejected " + file_path + ": " + rejection);
        return item;
    }

    auto contents = FileUtils::readFile(file_path);
    if (!contents)
    {
        item.error_message = "Could not read file: " + file_path;
        return item;
    }

    try
    {
        item.content_hash = ContentHash::sha256Hex(*contents);
        item.result = use_remote_ ? engine_.analyzeWithRemote(*contents, mime_type)
                                  : engine_.analyze(*contents, mime_type);
        item.success = true;
    }
    catch (const std::exception &e)
    {
        item.error_message = "Analysis failed: " + std::string(e.what());
        Logger::error("BatchAnalyzer: " + file_path + ": " + item.error_message);
    }
    return item;
}

std::vector<BatchItemResult> BatchAnalyzer::analyzeFiles(const std::vector<std::string> &file_paths,
                                                         const std::string &mime_override) const
{
    std::vector<BatchItemResult> results(file_paths.size());
    if (file_paths.empty())
    {
        return results;
    }

    Logger::info("BatchAnalyzer: analyzing " + std::to_string(file_paths.size()) + " files on up to " +
                 std::to_string(max_threads_) + " threads");

    // Each index is written by exactly one task, so results need no locking
    tbb::task_arena arena(max_threads_);
    arena.execute([&]()
                  { tbb::parallel_for(tbb::blocked_range<size_t>(0, file_paths.size()),
                                      [&](const tbb::blocked_range<size_t> &range)
                                      {
                                          for (size_t i = range.begin(); i != range.end(); ++i)
                                          {
                                              results[i] = analyzeFile(file_paths[i], mime_override);
                                          }
                                      }); });

    size_t failed = std::count_if(results.begin(), results.end(), [](const BatchItemResult &item)
                                  { return !item.success; });
    Logger::info("BatchAnalyzer: finished, " + std::to_string(results.size() - failed) + " analyzed, " +
                 std::to_string(failed) + " rejected");
    return results;
}

std::vector<std::string> BatchAnalyzer::collectFiles(const std::string &dir_path, bool recursive)
{
    std::vector<std::string> files;
    FileUtils::listFilesAsObservable(dir_path, recursive)
        .subscribe(
            [&files](const std::string &file_path)
            {
                files.push_back(file_path);
            },
            [&dir_path](const std::exception &e)
            {
                Logger::error("BatchAnalyzer: could not list " + dir_path + ": " + e.what());
            },
            nullptr);
    std::sort(files.begin(), files.end());
    return files;
}
