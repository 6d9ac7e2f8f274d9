#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/analysis_result.hpp"
#include "core/authenticity_engine.hpp"

class PocoConfigManager;

/**
 * @brief Upload boundary rules applied before a file reaches the engine
 */
struct UploadLimits
{
    uint64_t max_file_size_bytes = 100ull * 1024 * 1024;
    std::vector<std::string> accepted_mime_types = MediaTypes::defaultAcceptedMimeTypes();

    static UploadLimits fromConfig(const PocoConfigManager &config);

    /**
     * @brief Check a declared MIME type and size against the limits
     * @return Empty string when accepted, otherwise the rejection reason
     */
    std::string check(const std::string &mime_type, uint64_t size_bytes) const;
};

/**
 * @brief Outcome for one file of a batch
 */
struct BatchItemResult
{
    std::string file_path;
    bool success = false;
    std::string error_message;
    std::string content_hash; // SHA-256 of the file bytes, set when the file was read
    std::optional<AnalysisResult> result;
};

/**
 * @brief Analyzes many files concurrently on a bounded TBB arena
 */
class BatchAnalyzer
{
public:
    BatchAnalyzer(const AuthenticityEngine &engine, UploadLimits limits, int max_threads, bool use_remote = false);

    /**
     * @brief Analyze files in parallel
     * @param file_paths Files to analyze
     * @param mime_override MIME type to use for every file; derived from the extension when empty
     * @return One entry per input path, in input order
     */
    std::vector<BatchItemResult> analyzeFiles(const std::vector<std::string> &file_paths,
                                              const std::string &mime_override = "") const;

    /**
     * @brief Validate, read and analyze a single file; never throws
     */
    BatchItemResult analyzeFile(const std::string &file_path, const std::string &mime_override = "") const;

    /**
     * @brief Regular files under a directory, sorted by path
     */
    static std::vector<std::string> collectFiles(const std::string &dir_path, bool recursive);

    int maxThreads() const { return max_threads_; }

private:
    const AuthenticityEngine &engine_;
    UploadLimits limits_;
    int max_threads_;
    bool use_remote_;
};
