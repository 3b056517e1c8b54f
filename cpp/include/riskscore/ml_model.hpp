#ifndef RISKSCORE_ML_MODEL_HPP
#define RISKSCORE_ML_MODEL_HPP

#include <vector>

#include "riskscore/dataset.hpp"
#include "riskscore/feature_schema.hpp"

namespace riskscore {

double sigmoid(double z);

struct LogisticFitOptions {
    double inverse_regularization = 1.0;
    int max_iterations = 100;
    double tolerance = 1e-8;
};

// L2-regularised logistic regression on features in their natural units.
// The intercept is not penalised.
struct LogisticRegressionModel {
    FeatureValues weights{};
    double intercept = 0.0;
    int iterations = 0;
    bool converged = false;

    double decision_function(const FeatureValues& features) const;
    double predict_probability(const FeatureValues& features) const;
    std::vector<double> predict_probabilities(const std::vector<LabeledExample>& examples) const;

    void fit(const std::vector<LabeledExample>& examples, const LogisticFitOptions& options = {});
};

}  // namespace riskscore

#endif  // RISKSCORE_ML_MODEL_HPP
