#include "Score.hpp"
#include "Error/Error.hpp"
#include <functional>
#include <numeric>
#include <string>

namespace {
    struct confusion {
        double m_tp = 0.0;
        double m_fp = 0.0;
        double m_fn = 0.0;
    };

    bool IsPositive(double value, const char* where) {
        if (value == 1.0) {
            return true;
        }

        if (value == 0.0 || value == -1.0) {
            return false;
        }

        throw std::invalid_argument(std::string(where) + ": must be used for 2 class classification");
    }

    confusion Count(const std::vector<double>& outputs, const std::vector<double>& targets, const char* where) {
        if (outputs.size() != targets.size()) {
            throw error::DimensionMismatch(where, long(targets.size()), long(outputs.size()));
        }

        confusion counts;
        for (size_t i = 0; i < outputs.size(); ++i) {
            const bool o = IsPositive(outputs[i], where);
            const bool t = IsPositive(targets[i], where);

            if (o && t) {
                counts.m_tp += 1.0;
            }
            else if (o) {
                counts.m_fp += 1.0;
            }
            else if (t) {
                counts.m_fn += 1.0;
            }
        }

        return counts;
    }
}

namespace score {
    double Accuracy(const std::vector<double>& outputs, const std::vector<double>& targets) {
        if (outputs.size() != targets.size()) {
            throw error::DimensionMismatch("Score::Accuracy()", long(targets.size()), long(outputs.size()));
        }

        const auto correct = std::inner_product(outputs.begin(), outputs.end(), targets.begin(), 0, std::plus<>(),
            [](double o, double t) { return int(o == t); });

        return double(correct) / double(outputs.size());
    }

    double RowAccuracy(const linalg::Matrix& outputs, const linalg::Matrix& targets) {
        if (outputs.rows() != targets.rows()) {
            throw error::DimensionMismatch("Score::RowAccuracy(): rows", long(targets.rows()), long(outputs.rows()));
        }

        if (outputs.cols() != targets.cols()) {
            throw error::DimensionMismatch("Score::RowAccuracy(): cols", long(targets.cols()), long(outputs.cols()));
        }

        int correct = 0;
        for (Eigen::Index r = 0; r < outputs.rows(); ++r) {
            correct += int(outputs.row(r) == targets.row(r));
        }

        return double(correct) / double(outputs.rows());
    }

    double Precision(const std::vector<double>& outputs, const std::vector<double>& targets) {
        const auto counts = Count(outputs, targets, "Score::Precision()");
        return counts.m_tp / (counts.m_tp + counts.m_fp);
    }

    double Recall(const std::vector<double>& outputs, const std::vector<double>& targets) {
        const auto counts = Count(outputs, targets, "Score::Recall()");
        return counts.m_tp / (counts.m_tp + counts.m_fn);
    }

    double F1(const std::vector<double>& outputs, const std::vector<double>& targets) {
        const auto counts = Count(outputs, targets, "Score::F1()");

        const double p = counts.m_tp / (counts.m_tp + counts.m_fp);
        const double r = counts.m_tp / (counts.m_tp + counts.m_fn);

        return 2.0 * p * r / (p + r);
    }

    double NegMeanSquaredError(const linalg::Matrix& outputs, const linalg::Matrix& targets) {
        return -linalg::Subtract(outputs, targets).squaredNorm() / double(outputs.rows());
    }
}
