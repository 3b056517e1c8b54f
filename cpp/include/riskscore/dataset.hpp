#ifndef RISKSCORE_DATASET_HPP
#define RISKSCORE_DATASET_HPP

#include <cstddef>
#include <istream>
#include <string>
#include <vector>

#include "riskscore/feature_schema.hpp"

namespace riskscore {

struct LabeledExample {
    FeatureValues features{};
    int label = 0;
};

struct Dataset {
    std::vector<LabeledExample> examples;

    std::size_t size() const { return examples.size(); }
    std::size_t positives() const;
    std::size_t negatives() const { return size() - positives(); }
};

// CSV with a header row naming every schema feature plus `is_rug_pull`.
// Missing columns, malformed cells and bad labels raise SchemaError.
Dataset parse_dataset_csv(std::istream& input, const std::string& source = "<stream>");
Dataset load_dataset_csv(const std::string& path);

}  // namespace riskscore

#endif  // RISKSCORE_DATASET_HPP
