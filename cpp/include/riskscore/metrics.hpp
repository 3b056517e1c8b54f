#ifndef RISKSCORE_METRICS_HPP
#define RISKSCORE_METRICS_HPP

#include <cstddef>
#include <vector>

namespace riskscore {

struct PrecisionRecallPoint {
    double threshold = 0.0;
    double precision = 0.0;
    double recall = 0.0;
};

struct ConfusionMatrix {
    std::size_t true_negative = 0;
    std::size_t false_positive = 0;
    std::size_t false_negative = 0;
    std::size_t true_positive = 0;

    double precision() const;
    double recall() const;
};

// Mann-Whitney formulation; tied scores share their average rank.
double auc_roc(const std::vector<int>& labels, const std::vector<double>& scores);

// Ascending thresholds (so recall is non-increasing), starting at the highest
// threshold that still captures every positive.
std::vector<PrecisionRecallPoint> precision_recall_curve(const std::vector<int>& labels,
                                                         const std::vector<double>& scores);

// Precision at the smallest curve threshold reaching `target_recall`; falls
// back to the best-recall point when no threshold reaches it.
double precision_at_recall(const std::vector<int>& labels, const std::vector<double>& scores,
                           double target_recall = 0.9);

ConfusionMatrix confusion_matrix(const std::vector<int>& labels, const std::vector<double>& scores,
                                 double threshold = 0.5);

double mean(const std::vector<double>& values);
double population_stddev(const std::vector<double>& values);

}  // namespace riskscore

#endif  // RISKSCORE_METRICS_HPP
