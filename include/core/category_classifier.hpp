#pragma once

#include <string>
#include <vector>

/**
 * @brief One score band: scores at or above lower_bound (and below the next band) get label
 */
struct CategoryBand
{
    double lower_bound;
    std::string label;
};

/**
 * @brief Band boundaries, labels and the manipulation flag threshold
 *
 * Bands are ordered by strictly descending lower bound; the last band also
 * catches every score below its bound.
 */
struct CategoryPolicy
{
    std::vector<CategoryBand> bands;
    double deepfake_threshold = 60.0;

    /**
     * @brief 80 / 60 / 40 bands, flag at 60
     */
    static CategoryPolicy defaults();

    bool isValid() const;
};

/**
 * @brief Maps a score to its category band and manipulation flag; no state beyond the policy
 */
class CategoryClassifier
{
public:
    CategoryClassifier();
    explicit CategoryClassifier(CategoryPolicy policy);

    std::string categorize(double score) const;
    bool isDeepfake(double score) const;

    const CategoryPolicy &policy() const { return policy_; }

private:
    CategoryPolicy policy_;
};
