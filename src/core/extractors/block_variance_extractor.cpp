#include "core/extractors/block_variance_extractor.hpp"
#include "core/content_hash.hpp"
#include <algorithm>
#include <array>
#include <cmath>

double BlockVarianceExtractor::metaVariance(BufferView buffer)
{
    const std::size_t section_size = buffer.size / kSectionCount;
    if (section_size == 0)
        return 0.0;

    std::array<double, kSectionCount> variances{};
    for (std::size_t section = 0; section < kSectionCount; ++section)
    {
        const std::size_t start = section * section_size;
        double sum = 0.0;
        double sum_squares = 0.0;
        for (std::size_t i = start; i < start + section_size; ++i)
        {
            const double value = buffer[i];
            sum += value;
            sum_squares += value * value;
        }

        const double mean = sum / static_cast<double>(section_size);
        // Guard against tiny negative results from cancellation
        variances[section] = std::max(0.0, sum_squares / static_cast<double>(section_size) - mean * mean);
    }

    double mean_variance = 0.0;
    for (double variance : variances)
        mean_variance += variance;
    mean_variance /= static_cast<double>(kSectionCount);

    double meta_variance = 0.0;
    for (double variance : variances)
        meta_variance += (variance - mean_variance) * (variance - mean_variance);
    return meta_variance / static_cast<double>(kSectionCount);
}

double BlockVarianceExtractor::compute(BufferView buffer, MediaFormat /*format*/) const
{
    const double normalized = std::min(100.0, std::sqrt(metaVariance(buffer)) / 100.0);
    const double hash_term = ContentHash::score(buffer, 30);
    return 30.0 + normalized * 0.4 + hash_term;
}
