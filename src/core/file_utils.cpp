#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <stdexcept>

std::string FileUtils::getFileExtension(const std::string &file_path)
{
    const std::string file_name = fs::path(file_path).filename().string();
    size_t dot_pos = file_name.find_last_of('.');
    if (dot_pos == std::string::npos)
    {
        return "";
    }

    std::string extension = file_name.substr(dot_pos + 1);
    std::transform(extension.begin(), extension.end(), extension.begin(), ::tolower);
    return extension;
}

std::optional<std::vector<uint8_t>> FileUtils::readFile(const std::string &file_path)
{
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open())
    {
        Logger::warn("Could not open file: " + file_path);
        return std::nullopt;
    }

    std::vector<uint8_t> contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad())
    {
        Logger::warn("Error reading file: " + file_path);
        return std::nullopt;
    }
    return contents;
}

std::optional<uint64_t> FileUtils::getFileSize(const std::string &file_path)
{
    std::error_code ec;
    if (!fs::is_regular_file(file_path, ec))
        return std::nullopt;

    auto size = fs::file_size(file_path, ec);
    if (ec)
        return std::nullopt;
    return static_cast<uint64_t>(size);
}

SimpleObservable<std::string> FileUtils::listFilesAsObservable(const std::string &dir_path, bool recursive)
{
    using Observer = std::function<void(const std::string &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;
    return SimpleObservable<std::string>(
        std::function<void(Observer, ErrorHandler, CompleteHandler)>(
            [dir_path, recursive](Observer onNext, ErrorHandler onError, CompleteHandler onComplete)
            {
                try
                {
                    if (!isValidDirectory(dir_path))
                    {
                        std::string msg = "Invalid directory path: " + dir_path;
                        Logger::warn(msg);
                        if (onError)
                        {
                            onError(std::runtime_error(msg));
                        }
                        return;
                    }
                    if (recursive)
                    {
                        scanDirectoryRecursively(dir_path, onNext);
                    }
                    else
                    {
                        for (const auto &entry : fs::directory_iterator(dir_path))
                        {
                            if (entry.is_regular_file())
                            {
                                onNext(entry.path().string());
                            }
                        }
                    }
                    if (onComplete)
                    {
                        onComplete();
                    }
                }
                catch (const std::exception &e)
                {
                    std::string msg = "Error listing files in directory: " + dir_path + ": " + e.what();
                    Logger::warn(msg);
                    if (onError)
                    {
                        onError(std::runtime_error(msg));
                    }
                }
            }));
}

bool FileUtils::isValidDirectory(const std::string &path)
{
    std::error_code ec;
    return fs::is_directory(fs::path(path), ec);
}

void FileUtils::scanDirectoryRecursively(const std::string &dir_path,
                                         std::function<void(const std::string &)> onNext)
{
    std::function<void(const fs::path &)> scanDirectory = [&](const fs::path &current_path)
    {
        try
        {
            for (const auto &entry : fs::directory_iterator(current_path))
            {
                try
                {
                    if (entry.is_regular_file())
                    {
                        onNext(entry.path().string());
                    }
                    else if (entry.is_directory())
                    {
                        scanDirectory(entry.path());
                    }
                }
                catch (const fs::filesystem_error &e)
                {
                    Logger::warn("Skipping entry due to permission error: " + entry.path().string() + " - " + e.what());
                    continue;
                }
            }
        }
        catch (const fs::filesystem_error &e)
        {
            // Keep scanning siblings
            Logger::warn("Error accessing directory " + current_path.string() + ": " + e.what());
        }
    };
    scanDirectory(fs::path(dir_path));
}
