#include "riskscore/feature_schema.hpp"

#include <cmath>

#include "riskscore/common.hpp"
#include "riskscore/errors.hpp"

namespace riskscore {

namespace {

const std::array<std::string, kFeatureCount>& names() {
    static const std::array<std::string, kFeatureCount> kNames = {
        "gini_coefficient",
        "top_10_percentage",
        "total_holders",
        "liquidity_usd",
        "has_mint_authority",
        "has_freeze_authority",
        "verified",
        "audited",
        "community_trust_score",
        "sentiment_score",
        "token_age_days",
        "volume_24h",
        "price_volatility",
    };
    return kNames;
}

}  // namespace

const std::array<Feature, kFeatureCount>& all_features() {
    static const std::array<Feature, kFeatureCount> kFeatures = {
        Feature::kGiniCoefficient,     Feature::kTop10Percentage, Feature::kTotalHolders,
        Feature::kLiquidityUsd,        Feature::kHasMintAuthority, Feature::kHasFreezeAuthority,
        Feature::kVerified,            Feature::kAudited,          Feature::kCommunityTrustScore,
        Feature::kSentimentScore,      Feature::kTokenAgeDays,     Feature::kVolume24h,
        Feature::kPriceVolatility,
    };
    return kFeatures;
}

const std::string& feature_name(Feature feature) {
    return names()[feature_index(feature)];
}

std::optional<Feature> feature_from_name(std::string_view name) {
    for (Feature feature : all_features()) {
        if (feature_name(feature) == name) {
            return feature;
        }
    }
    return std::nullopt;
}

bool is_boolean_feature(Feature feature) {
    switch (feature) {
        case Feature::kHasMintAuthority:
        case Feature::kHasFreezeAuthority:
        case Feature::kVerified:
        case Feature::kAudited:
            return true;
        default:
            return false;
    }
}

std::vector<std::string> missing_features(const FeatureVector& features) {
    std::vector<std::string> missing;
    for (Feature feature : all_features()) {
        if (features.find(feature_name(feature)) == features.end()) {
            missing.push_back(feature_name(feature));
        }
    }
    return missing;
}

FeatureValues to_feature_values(const FeatureVector& features) {
    auto missing = missing_features(features);
    if (!missing.empty()) {
        throw FeatureError("missing required features: " + join(missing, ", "), missing);
    }

    FeatureValues values{};
    for (Feature feature : all_features()) {
        const auto& name = feature_name(feature);
        const double value = features.at(name);
        if (!std::isfinite(value)) {
            throw FeatureError("feature " + name + " is not finite", {name});
        }
        if (is_boolean_feature(feature) && value != 0.0 && value != 1.0) {
            throw FeatureError("boolean feature " + name + " must be 0 or 1", {name});
        }
        values[feature_index(feature)] = value;
    }
    return values;
}

FeatureVector to_feature_vector(const FeatureValues& values) {
    FeatureVector output;
    for (Feature feature : all_features()) {
        output[feature_name(feature)] = values[feature_index(feature)];
    }
    return output;
}

}  // namespace riskscore
