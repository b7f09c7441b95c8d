#pragma once
#include <vector>
#include "Linalg/Linalg.hpp"

// Scores comparing predictions with targets. Higher is always better.
namespace score {
    // Fraction of outputs equal to their target.
    double Accuracy(const std::vector<double>& outputs, const std::vector<double>& targets);

    // Fraction of rows equal to their target row.
    double RowAccuracy(const linalg::Matrix& outputs, const linalg::Matrix& targets);

    // Two-class scores: 1 is the positive class, 0 or -1 the negative one.
    // Any other value throws std::invalid_argument.
    double Precision(const std::vector<double>& outputs, const std::vector<double>& targets);
    double Recall(const std::vector<double>& outputs, const std::vector<double>& targets);
    double F1(const std::vector<double>& outputs, const std::vector<double>& targets);

    // -sum of squared row differences / rows
    double NegMeanSquaredError(const linalg::Matrix& outputs, const linalg::Matrix& targets);
}
