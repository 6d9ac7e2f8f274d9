#include "core/extractors/entropy_extractor.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>

namespace
{
    template <typename Count>
    double shannonEntropy(const std::array<Count, 256> &histogram, uint64_t total)
    {
        if (total == 0)
            return 0.0;

        double entropy = 0.0;
        for (Count count : histogram)
        {
            if (count > 0)
            {
                const double p = static_cast<double>(count) / static_cast<double>(total);
                entropy -= p * std::log2(p);
            }
        }
        return entropy;
    }
}

EntropyStats EntropyExtractor::computeStats(BufferView buffer)
{
    EntropyStats stats;
    if (buffer.empty())
        return stats;

    std::array<uint64_t, 256> global_histogram{};
    std::array<uint32_t, 256> window_histogram{};
    std::size_t window_fill = 0;

    // Welford accumulation keeps the local entropy series out of memory
    double mean = 0.0;
    double m2 = 0.0;

    for (std::size_t i = 0; i < buffer.size; ++i)
    {
        const uint8_t value = buffer[i];
        ++global_histogram[value];
        ++window_histogram[value];

        if (++window_fill == kWindowSize)
        {
            const double local = shannonEntropy(window_histogram, kWindowSize);
            ++stats.window_count;
            const double delta = local - mean;
            mean += delta / static_cast<double>(stats.window_count);
            m2 += delta * (local - mean);

            window_histogram.fill(0);
            window_fill = 0;
        }
    }

    stats.global_entropy = shannonEntropy(global_histogram, buffer.size);
    if (stats.window_count > 0)
    {
        stats.entropy_variance = m2 / static_cast<double>(stats.window_count);
    }
    return stats;
}

double EntropyExtractor::compute(BufferView buffer, MediaFormat /*format*/) const
{
    const EntropyStats stats = computeStats(buffer);

    const double norm_global = (stats.global_entropy / 8.0) * 100.0;
    double norm_variance = 0.0;
    if (stats.window_count > 0)
    {
        norm_variance = std::min(100.0, std::sqrt(stats.entropy_variance) * 20.0);
    }

    return 40.0 + std::abs(norm_global - 78.0) * 1.5 + norm_variance * 0.5;
}
