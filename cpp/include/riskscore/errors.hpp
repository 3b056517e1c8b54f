#ifndef RISKSCORE_ERRORS_HPP
#define RISKSCORE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace riskscore {

// Required dataset columns are absent or the dataset cannot be trained on.
class SchemaError : public std::runtime_error {
public:
    explicit SchemaError(const std::string& message, std::vector<std::string> columns = {})
        : std::runtime_error(message), columns_(std::move(columns)) {}

    const std::vector<std::string>& columns() const { return columns_; }

private:
    std::vector<std::string> columns_;
};

// Malformed or inconsistent model artifact.
class ArtifactError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A scoring call supplied an unusable feature vector.
class FeatureError : public std::runtime_error {
public:
    explicit FeatureError(const std::string& message, std::vector<std::string> features = {})
        : std::runtime_error(message), features_(std::move(features)) {}

    const std::vector<std::string>& features() const { return features_; }

private:
    std::vector<std::string> features_;
};

class NoPriorVersionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace riskscore

#endif  // RISKSCORE_ERRORS_HPP
