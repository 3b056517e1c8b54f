#ifndef RISKSCORE_FEATURE_SCHEMA_HPP
#define RISKSCORE_FEATURE_SCHEMA_HPP

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace riskscore {

// Order is part of the artifact contract: weights, dataset columns and
// summaries are all reported in this order.
enum class Feature : std::size_t {
    kGiniCoefficient,
    kTop10Percentage,
    kTotalHolders,
    kLiquidityUsd,
    kHasMintAuthority,
    kHasFreezeAuthority,
    kVerified,
    kAudited,
    kCommunityTrustScore,
    kSentimentScore,
    kTokenAgeDays,
    kVolume24h,
    kPriceVolatility,
};

constexpr std::size_t kFeatureCount = 13;

constexpr const char* kLabelColumn = "is_rug_pull";

using FeatureValues = std::array<double, kFeatureCount>;
using FeatureVector = std::map<std::string, double>;

const std::array<Feature, kFeatureCount>& all_features();
const std::string& feature_name(Feature feature);
std::optional<Feature> feature_from_name(std::string_view name);
bool is_boolean_feature(Feature feature);

constexpr std::size_t feature_index(Feature feature) {
    return static_cast<std::size_t>(feature);
}

// Names absent from `features`, in schema order.
std::vector<std::string> missing_features(const FeatureVector& features);

// Extra names in `features` are ignored. Throws FeatureError for missing
// names, non-finite values and boolean features that are not 0.0/1.0.
FeatureValues to_feature_values(const FeatureVector& features);
FeatureVector to_feature_vector(const FeatureValues& values);

}  // namespace riskscore

#endif  // RISKSCORE_FEATURE_SCHEMA_HPP
