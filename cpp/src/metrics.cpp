#include "riskscore/metrics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace riskscore {

namespace {

void check_inputs(const std::vector<int>& labels, const std::vector<double>& scores) {
    if (labels.size() != scores.size()) {
        throw std::runtime_error("labels and scores must have the same length");
    }
    if (labels.empty()) {
        throw std::runtime_error("labels must be non-empty");
    }
}

}  // namespace

double ConfusionMatrix::precision() const {
    const auto predicted = true_positive + false_positive;
    return predicted == 0 ? 0.0 : static_cast<double>(true_positive) / static_cast<double>(predicted);
}

double ConfusionMatrix::recall() const {
    const auto actual = true_positive + false_negative;
    return actual == 0 ? 0.0 : static_cast<double>(true_positive) / static_cast<double>(actual);
}

double auc_roc(const std::vector<int>& labels, const std::vector<double>& scores) {
    check_inputs(labels, scores);

    std::vector<size_t> order(scores.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) { return scores[a] < scores[b]; });

    std::vector<double> ranks(scores.size());
    for (size_t i = 0; i < order.size();) {
        size_t j = i;
        while (j + 1 < order.size() && scores[order[j + 1]] == scores[order[i]]) {
            ++j;
        }
        const double average_rank = 0.5 * static_cast<double>(i + j) + 1.0;
        for (size_t k = i; k <= j; ++k) {
            ranks[order[k]] = average_rank;
        }
        i = j + 1;
    }

    double positive_rank_sum = 0.0;
    double positives = 0.0;
    for (size_t i = 0; i < labels.size(); ++i) {
        if (labels[i] == 1) {
            positive_rank_sum += ranks[i];
            positives += 1.0;
        }
    }
    const double negatives = static_cast<double>(labels.size()) - positives;
    if (positives == 0.0 || negatives == 0.0) {
        throw std::runtime_error("AUC-ROC is undefined when only one class is present");
    }
    return (positive_rank_sum - positives * (positives + 1.0) / 2.0) / (positives * negatives);
}

std::vector<PrecisionRecallPoint> precision_recall_curve(const std::vector<int>& labels,
                                                         const std::vector<double>& scores) {
    check_inputs(labels, scores);

    std::vector<size_t> order(scores.size());
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) { return scores[a] > scores[b]; });

    const auto total_positives = static_cast<double>(std::count(labels.begin(), labels.end(), 1));
    if (total_positives == 0.0) {
        throw std::runtime_error("precision-recall curve requires at least one positive label");
    }

    // Sweep from the highest threshold down; stop once recall reaches 1.
    std::vector<PrecisionRecallPoint> descending;
    double true_positives = 0.0;
    double predicted = 0.0;
    for (size_t i = 0; i < order.size();) {
        const double threshold = scores[order[i]];
        while (i < order.size() && scores[order[i]] == threshold) {
            true_positives += labels[order[i]] == 1 ? 1.0 : 0.0;
            predicted += 1.0;
            ++i;
        }
        descending.push_back({threshold, true_positives / predicted, true_positives / total_positives});
        if (true_positives == total_positives) {
            break;
        }
    }
    return {descending.rbegin(), descending.rend()};
}

double precision_at_recall(const std::vector<int>& labels, const std::vector<double>& scores,
                           double target_recall) {
    const auto curve = precision_recall_curve(labels, scores);
    for (const auto& point : curve) {
        if (point.recall >= target_recall) {
            return point.precision;
        }
    }
    auto best = std::max_element(curve.begin(), curve.end(), [](const auto& a, const auto& b) {
        return a.recall < b.recall;
    });
    return best->precision;
}

ConfusionMatrix confusion_matrix(const std::vector<int>& labels, const std::vector<double>& scores,
                                 double threshold) {
    check_inputs(labels, scores);
    ConfusionMatrix matrix;
    for (size_t i = 0; i < labels.size(); ++i) {
        const bool predicted = scores[i] > threshold;
        if (labels[i] == 1) {
            predicted ? ++matrix.true_positive : ++matrix.false_negative;
        } else {
            predicted ? ++matrix.false_positive : ++matrix.true_negative;
        }
    }
    return matrix;
}

double mean(const std::vector<double>& values) {
    if (values.empty()) {
        throw std::runtime_error("values must be non-empty");
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double population_stddev(const std::vector<double>& values) {
    const double center = mean(values);
    double sum_sq = 0.0;
    for (double value : values) {
        sum_sq += (value - center) * (value - center);
    }
    return std::sqrt(sum_sq / static_cast<double>(values.size()));
}

}  // namespace riskscore
