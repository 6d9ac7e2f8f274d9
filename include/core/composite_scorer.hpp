#pragma once

#include <map>
#include <string>
#include "core/feature_extractor.hpp"

/**
 * @brief Weighted average of feature scores
 *
 * The average is renormalized over the weights of the features actually
 * present, so a missing feature never drags the score towards zero.
 */
class CompositeScorer
{
public:
    using WeightTable = std::map<std::string, double>;

    static constexpr double kNeutralScore = 50.0;

    CompositeScorer();
    explicit CompositeScorer(WeightTable weights);

    /**
     * @brief Combine feature scores into one score
     * @param features Feature scores; keys without a positive weight and non-finite values are ignored
     * @return Score in [0, 100] rounded to one decimal, kNeutralScore when nothing contributes
     */
    double score(const FeatureSet &features) const;

    const WeightTable &weights() const { return weights_; }

    /**
     * @brief Default weight table (sums to 1.0)
     */
    static const WeightTable &defaultWeights();

    /**
     * @brief Round half away from zero to one decimal place
     */
    static double roundToTenth(double value);

private:
    WeightTable weights_;
};
