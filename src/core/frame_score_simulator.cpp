#include "core/frame_score_simulator.hpp"
#include <algorithm>
#include <cmath>

namespace
{
    constexpr double kPi = 3.14159265358979323846;
}

int FrameScoreSimulator::frameCount(double base_score)
{
    const long rounded = std::lround(std::max(0.0, base_score));
    return kBaseFrameCount + static_cast<int>(rounded % kFrameCountSpread);
}

std::vector<double> FrameScoreSimulator::simulate(double base_score)
{
    const int count = frameCount(base_score);
    std::vector<double> scores;
    scores.reserve(count);

    double previous = base_score;
    for (int i = 0; i < count; ++i)
    {
        const double variation = std::sin(static_cast<double>(i) / count * kPi) * kVariationAmplitude;
        const double frame_score = std::max(kMinFrameScore, std::min(kMaxFrameScore, previous + variation));
        scores.push_back(frame_score);

        previous = frame_score * kCarryOver + base_score * kBasePull;
    }
    return scores;
}
