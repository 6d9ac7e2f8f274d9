#include "core/analysis_result.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

bool AnalysisResult::operator==(const AnalysisResult &other) const
{
    return score == other.score &&
           category == other.category &&
           is_deepfake == other.is_deepfake &&
           file_type == other.file_type &&
           feature_contributions == other.feature_contributions &&
           frame_scores == other.frame_scores &&
           frames_analyzed == other.frames_analyzed &&
           timestamp == other.timestamp;
}

std::string formatTimestamp(const std::chrono::system_clock::time_point &time_point)
{
    const auto since_epoch = std::chrono::duration_cast<std::chrono::milliseconds>(time_point.time_since_epoch());
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto millis = since_epoch - seconds;
    if (millis.count() < 0)
    {
        seconds -= std::chrono::seconds(1);
        millis += std::chrono::seconds(1);
    }

    const std::time_t time = static_cast<std::time_t>(seconds.count());
    std::tm utc{};
    gmtime_r(&time, &utc);

    std::stringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << millis.count() << 'Z';
    return ss.str();
}

std::chrono::system_clock::time_point parseTimestamp(const std::string &timestamp)
{
    std::tm utc{};
    std::istringstream ss(timestamp);
    ss >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail())
    {
        throw std::invalid_argument("Invalid timestamp: " + timestamp);
    }

    long millis = 0;
    if (ss.peek() == '.')
    {
        ss.get();
        std::string digits;
        while (std::isdigit(ss.peek()))
        {
            digits.push_back(static_cast<char>(ss.get()));
        }
        // Only millisecond precision is kept
        digits.resize(3, '0');
        millis = std::stol(digits);
    }

    const std::time_t seconds = timegm(&utc);
    return std::chrono::system_clock::time_point(std::chrono::seconds(seconds)) +
           std::chrono::milliseconds(millis);
}

void to_json(json &j, const AnalysisResult &result)
{
    j = json{
        {"score", result.score},
        {"category", result.category},
        {"is_deepfake", result.is_deepfake},
        {"file_type", MediaTypes::getKindName(result.file_type)},
        {"feature_contributions", result.feature_contributions},
        {"timestamp", formatTimestamp(result.timestamp)}};

    if (result.frame_scores)
    {
        j["frame_scores"] = *result.frame_scores;
        j["frames_analyzed"] = result.frames_analyzed.value_or(static_cast<int>(result.frame_scores->size()));
    }
}

void from_json(const json &j, AnalysisResult &result)
{
    result.score = j.at("score").get<double>();
    result.category = j.at("category").get<std::string>();
    result.is_deepfake = j.at("is_deepfake").get<bool>();
    result.file_type = MediaTypes::kindFromString(j.at("file_type").get<std::string>());
    result.feature_contributions = j.at("feature_contributions").get<FeatureSet>();
    result.timestamp = parseTimestamp(j.at("timestamp").get<std::string>());

    if (j.contains("frame_scores"))
    {
        result.frame_scores = j.at("frame_scores").get<std::vector<double>>();
        result.frames_analyzed = j.value("frames_analyzed", static_cast<int>(result.frame_scores->size()));
    }
    else
    {
        result.frame_scores.reset();
        result.frames_analyzed.reset();
    }
}

void to_json(json &j, const RemoteResult &result)
{
    j = json{
        {"score", result.score},
        {"analysis_details", result.analysis_details}};
}

void from_json(const json &j, RemoteResult &result)
{
    result.score = j.at("score").get<double>();
    result.analysis_details.clear();

    auto details = j.find("analysis_details");
    if (details != j.end() && details->is_object())
    {
        // Remote detectors add free-form details; only numbers are kept
        for (auto it = details->begin(); it != details->end(); ++it)
        {
            if (it.value().is_number())
            {
                result.analysis_details[it.key()] = it.value().get<double>();
            }
        }
    }
}
