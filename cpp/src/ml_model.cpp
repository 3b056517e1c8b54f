#include "riskscore/ml_model.hpp"

#include <Eigen/Dense>

#include <cmath>
#include <stdexcept>

namespace riskscore {

namespace {

// log(1 + exp(z)) without overflow.
double softplus(double z) {
    if (z > 0.0) {
        return z + std::log1p(std::exp(-z));
    }
    return std::log1p(std::exp(z));
}

struct Problem {
    Eigen::MatrixXd x;
    Eigen::VectorXd y;
    Eigen::VectorXd penalty;
    double lambda = 1.0;
};

double objective(const Problem& problem, const Eigen::VectorXd& beta) {
    const Eigen::VectorXd z = problem.x * beta;
    double loss = 0.0;
    for (Eigen::Index i = 0; i < z.size(); ++i) {
        loss += softplus(z(i)) - problem.y(i) * z(i);
    }
    return loss + 0.5 * problem.lambda * beta.cwiseProduct(problem.penalty).dot(beta);
}

}  // namespace

double sigmoid(double z) {
    if (z >= 0.0) {
        return 1.0 / (1.0 + std::exp(-z));
    }
    const double e = std::exp(z);
    return e / (1.0 + e);
}

double LogisticRegressionModel::decision_function(const FeatureValues& features) const {
    double z = intercept;
    for (size_t i = 0; i < kFeatureCount; ++i) {
        z += weights[i] * features[i];
    }
    return z;
}

double LogisticRegressionModel::predict_probability(const FeatureValues& features) const {
    return sigmoid(decision_function(features));
}

std::vector<double> LogisticRegressionModel::predict_probabilities(
    const std::vector<LabeledExample>& examples) const {
    std::vector<double> output;
    output.reserve(examples.size());
    for (const auto& example : examples) {
        output.push_back(predict_probability(example.features));
    }
    return output;
}

void LogisticRegressionModel::fit(const std::vector<LabeledExample>& examples, const LogisticFitOptions& options) {
    if (options.inverse_regularization <= 0.0) {
        throw std::invalid_argument("inverse_regularization must be positive");
    }
    if (options.max_iterations <= 0) {
        throw std::invalid_argument("max_iterations must be positive");
    }

    const auto n = static_cast<Eigen::Index>(examples.size());
    const auto p = static_cast<Eigen::Index>(kFeatureCount) + 1;

    Problem problem;
    problem.x.resize(n, p);
    problem.y.resize(n);
    size_t positives = 0;
    for (Eigen::Index i = 0; i < n; ++i) {
        const auto& example = examples[static_cast<size_t>(i)];
        for (Eigen::Index j = 0; j + 1 < p; ++j) {
            problem.x(i, j) = example.features[static_cast<size_t>(j)];
        }
        problem.x(i, p - 1) = 1.0;
        problem.y(i) = example.label;
        positives += example.label == 1 ? 1 : 0;
    }
    if (positives == 0 || positives == examples.size()) {
        throw std::runtime_error("logistic regression requires examples of both classes");
    }
    problem.penalty = Eigen::VectorXd::Ones(p);
    problem.penalty(p - 1) = 0.0;
    problem.lambda = 1.0 / options.inverse_regularization;

    Eigen::VectorXd beta = Eigen::VectorXd::Zero(p);
    double current = objective(problem, beta);
    converged = false;
    iterations = 0;

    for (int iteration = 0; iteration < options.max_iterations; ++iteration) {
        iterations = iteration + 1;
        const Eigen::VectorXd z = problem.x * beta;
        Eigen::VectorXd prob(n);
        Eigen::VectorXd curvature(n);
        for (Eigen::Index i = 0; i < n; ++i) {
            prob(i) = sigmoid(z(i));
            curvature(i) = prob(i) * (1.0 - prob(i));
        }

        const Eigen::VectorXd gradient =
            problem.x.transpose() * (prob - problem.y) + problem.lambda * problem.penalty.cwiseProduct(beta);
        Eigen::MatrixXd hessian = problem.x.transpose() * curvature.asDiagonal() * problem.x;
        hessian.diagonal() += problem.lambda * problem.penalty;
        hessian.diagonal().array() += 1e-12;

        // Features span many orders of magnitude (flags vs. USD volumes), so
        // solve in the Jacobi-scaled system.
        const Eigen::VectorXd scale = hessian.diagonal().cwiseSqrt().cwiseInverse();
        const Eigen::MatrixXd scaled = scale.asDiagonal() * hessian * scale.asDiagonal();
        Eigen::LDLT<Eigen::MatrixXd> solver(scaled);
        if (solver.info() != Eigen::Success) {
            throw std::runtime_error("logistic regression hessian factorisation failed");
        }
        const Eigen::VectorXd step = scale.cwiseProduct(solver.solve(scale.cwiseProduct(gradient)));

        const double decrement = gradient.dot(step);
        if (!std::isfinite(decrement)) {
            throw std::runtime_error("logistic regression diverged");
        }
        if (0.5 * decrement < options.tolerance) {
            converged = true;
            break;
        }

        double t = 1.0;
        Eigen::VectorXd candidate = beta - step;
        double next = objective(problem, candidate);
        while (next > current - 1e-4 * t * decrement && t > 1e-10) {
            t *= 0.5;
            candidate = beta - t * step;
            next = objective(problem, candidate);
        }
        beta = candidate;
        current = next;
    }

    for (size_t j = 0; j < kFeatureCount; ++j) {
        weights[j] = beta(static_cast<Eigen::Index>(j));
    }
    intercept = beta(p - 1);
}

}  // namespace riskscore
