#include "core/category_classifier.hpp"
#include "logging/logger.hpp"
#include <utility>

CategoryPolicy CategoryPolicy::defaults()
{
    CategoryPolicy policy;
    policy.bands = {
        {80.0, "Likely Manipulated"},
        {60.0, "Potentially Manipulated"},
        {40.0, "Uncertain"},
        {0.0, "Likely Authentic"}};
    policy.deepfake_threshold = 60.0;
    return policy;
}

bool CategoryPolicy::isValid() const
{
    if (bands.empty())
        return false;

    for (std::size_t i = 1; i < bands.size(); ++i)
    {
        if (!(bands[i].lower_bound < bands[i - 1].lower_bound))
            return false;
    }
    return true;
}

CategoryClassifier::CategoryClassifier() : policy_(CategoryPolicy::defaults())
{
}

CategoryClassifier::CategoryClassifier(CategoryPolicy policy) : policy_(std::move(policy))
{
    if (!policy_.isValid())
    {
        Logger::warn("CategoryClassifier: invalid category policy, falling back to default bands");
        policy_ = CategoryPolicy::defaults();
    }
}

std::string CategoryClassifier::categorize(double score) const
{
    for (const auto &band : policy_.bands)
    {
        if (score >= band.lower_bound)
            return band.label;
    }
    return policy_.bands.back().label;
}

bool CategoryClassifier::isDeepfake(double score) const
{
    return score >= policy_.deepfake_threshold;
}
