#pragma once

#include <vector>

/**
 * @brief Per-frame score sequence for video results
 *
 * Frames follow a half-sine swell around the composite score and each frame
 * carries 70% of the previous one, so neighbouring frames never jump. The
 * sequence length is 8 + (round(base) mod 10).
 */
class FrameScoreSimulator
{
public:
    static constexpr int kBaseFrameCount = 8;
    static constexpr int kFrameCountSpread = 10;
    static constexpr double kVariationAmplitude = 15.0;
    static constexpr double kCarryOver = 0.7;
    static constexpr double kBasePull = 0.3;
    static constexpr double kMinFrameScore = 5.0;
    static constexpr double kMaxFrameScore = 95.0;

    static int frameCount(double base_score);

    /**
     * @brief Simulate frame scores for a composite score
     * @param base_score Composite score in [0, 100]
     * @return frameCount(base_score) values, each in [5, 95]
     */
    static std::vector<double> simulate(double base_score);
};
