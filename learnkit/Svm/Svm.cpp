#include "Svm.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

namespace {
    constexpr double tau = 1e-12;
    constexpr double inf = std::numeric_limits<double>::infinity();

    linalg::Matrix GramMatrix(const data::Dataset& dataset, const kernel::Kernel& kernel) {
        const int n = dataset.Size();
        linalg::Matrix gram(n, n);

        for (int i = 0; i < n; ++i) {
            for (int j = i; j < n; ++j) {
                gram(i, j) = kernel.Evaluate(dataset[i].first, dataset[j].first);
                gram(j, i) = gram(i, j);
            }
        }

        return gram;
    }

    // Dual problem
    //   min 0.5 * a'Qa - e'a   s.t.  0 <= a_i <= C,  y'a = 0,  Q_ij = y_i y_j K_ij
    // solved two coefficients at a time. m_grad holds Qa - e.
    class Solver {
    public:
        Solver(linalg::Matrix&& gram, const std::vector<double>& y, double penalty);

        // false once the maximal violating pair is within tolerance
        bool SelectWorkingSet(double tolerance, int& out_i, int& out_j) const;
        void Update(int i, int j);

        double Bias() const;
        double Objective() const;

        const std::vector<double>& Alpha() const { return m_alpha; }

    private:
        double Q(int i, int j) const { return m_y[i] * m_y[j] * m_gram(i, j); }

        bool IsUpperBound(int t) const { return m_alpha[t] >= m_penalty; }
        bool IsLowerBound(int t) const { return m_alpha[t] <= 0.0; }

        const linalg::Matrix m_gram;
        const std::vector<double> m_y;
        const double m_penalty;

        std::vector<double> m_alpha;
        std::vector<double> m_grad;
    };

    Solver::Solver(linalg::Matrix&& gram, const std::vector<double>& y, double penalty)
        : m_gram{ std::move(gram) }
        , m_y{ y }
        , m_penalty{ penalty }
        , m_alpha(y.size(), 0.0)
        , m_grad(y.size(), -1.0)
    {
    }

    bool Solver::SelectWorkingSet(double tolerance, int& out_i, int& out_j) const {
        const int n = int(m_y.size());

        double gmax = -inf;
        int gmax_idx = -1;

        for (int t = 0; t < n; ++t) {
            if (m_y[t] > 0) {
                if (!IsUpperBound(t) && -m_grad[t] >= gmax) {
                    gmax = -m_grad[t];
                    gmax_idx = t;
                }
            }
            else {
                if (!IsLowerBound(t) && m_grad[t] >= gmax) {
                    gmax = m_grad[t];
                    gmax_idx = t;
                }
            }
        }

        if (gmax_idx == -1) {
            return false;
        }

        const int i = gmax_idx;

        double gmax2 = -inf;
        int gmin_idx = -1;
        double obj_diff_min = inf;

        for (int j = 0; j < n; ++j) {
            double grad_diff = 0.0;
            double quad_coef = 0.0;

            if (m_y[j] > 0) {
                if (IsLowerBound(j)) {
                    continue;
                }

                gmax2 = std::max(gmax2, m_grad[j]);
                grad_diff = gmax + m_grad[j];
                quad_coef = m_gram(i, i) + m_gram(j, j) - 2.0 * m_y[i] * Q(i, j);
            }
            else {
                if (IsUpperBound(j)) {
                    continue;
                }

                gmax2 = std::max(gmax2, -m_grad[j]);
                grad_diff = gmax - m_grad[j];
                quad_coef = m_gram(i, i) + m_gram(j, j) + 2.0 * m_y[i] * Q(i, j);
            }

            if (grad_diff > 0) {
                const double obj_diff = -(grad_diff * grad_diff) / (quad_coef > 0 ? quad_coef : tau);

                if (obj_diff <= obj_diff_min) {
                    gmin_idx = j;
                    obj_diff_min = obj_diff;
                }
            }
        }

        if (gmax + gmax2 < tolerance || gmin_idx == -1) {
            return false;
        }

        out_i = i;
        out_j = gmin_idx;
        return true;
    }

    void Solver::Update(int i, int j) {
        const double c = m_penalty;
        const double old_alpha_i = m_alpha[i];
        const double old_alpha_j = m_alpha[j];

        double& alpha_i = m_alpha[i];
        double& alpha_j = m_alpha[j];

        if (m_y[i] != m_y[j]) {
            double quad_coef = m_gram(i, i) + m_gram(j, j) + 2.0 * Q(i, j);
            if (quad_coef <= 0) {
                quad_coef = tau;
            }

            const double delta = (-m_grad[i] - m_grad[j]) / quad_coef;
            const double diff = alpha_i - alpha_j;
            alpha_i += delta;
            alpha_j += delta;

            if (diff > 0) {
                if (alpha_j < 0) {
                    alpha_j = 0;
                    alpha_i = diff;
                }
            }
            else {
                if (alpha_i < 0) {
                    alpha_i = 0;
                    alpha_j = -diff;
                }
            }

            if (diff > 0) {
                if (alpha_i > c) {
                    alpha_i = c;
                    alpha_j = c - diff;
                }
            }
            else {
                if (alpha_j > c) {
                    alpha_j = c;
                    alpha_i = c + diff;
                }
            }
        }
        else {
            double quad_coef = m_gram(i, i) + m_gram(j, j) - 2.0 * Q(i, j);
            if (quad_coef <= 0) {
                quad_coef = tau;
            }

            const double delta = (m_grad[i] - m_grad[j]) / quad_coef;
            const double sum = alpha_i + alpha_j;
            alpha_i -= delta;
            alpha_j += delta;

            if (sum > c) {
                if (alpha_i > c) {
                    alpha_i = c;
                    alpha_j = sum - c;
                }
                if (alpha_j > c) {
                    alpha_j = c;
                    alpha_i = sum - c;
                }
            }
            else {
                if (alpha_j < 0) {
                    alpha_j = 0;
                    alpha_i = sum;
                }
                if (alpha_i < 0) {
                    alpha_i = 0;
                    alpha_j = sum;
                }
            }
        }

        const double delta_i = alpha_i - old_alpha_i;
        const double delta_j = alpha_j - old_alpha_j;

        for (int k = 0; k < int(m_grad.size()); ++k) {
            m_grad[k] += Q(i, k) * delta_i + Q(j, k) * delta_j;
        }
    }

    double Solver::Bias() const {
        double ub = inf;
        double lb = -inf;
        double sum_free = 0.0;
        int num_free = 0;

        for (int t = 0; t < int(m_y.size()); ++t) {
            const double yg = m_y[t] * m_grad[t];

            if (IsUpperBound(t)) {
                if (m_y[t] < 0) {
                    ub = std::min(ub, yg);
                }
                else {
                    lb = std::max(lb, yg);
                }
            }
            else if (IsLowerBound(t)) {
                if (m_y[t] > 0) {
                    ub = std::min(ub, yg);
                }
                else {
                    lb = std::max(lb, yg);
                }
            }
            else {
                ++num_free;
                sum_free += yg;
            }
        }

        if (num_free > 0) {
            return -sum_free / num_free;
        }

        if (std::isinf(ub) || std::isinf(lb)) {
            return std::isinf(ub) ? -lb : -ub;
        }

        const double rho = (ub + lb) / 2;
        return -rho;
    }

    double Solver::Objective() const {
        double v = 0.0;

        for (int t = 0; t < int(m_alpha.size()); ++t) {
            v += m_alpha[t] * (m_grad[t] - 1.0);
        }

        return v / 2;
    }

    void PrintTrainResult(const model::TrainResult& result, const svm::Model& model, const std::string& kernel) {
        std::cout << "SVM " << kernel << ": " << result.m_iterations << " iterations, "
            << model.NumSupportVectors() << " support vectors, bias " << model.Bias();

        if (result.m_diagnostic) {
            std::cout << ", " << error::ToString(*result.m_diagnostic);
        }

        std::cout << std::endl;
    }
}

namespace svm {
    Model::Model(kernel::Kernel kernel, std::vector<linalg::Vector>&& supportVectors,
        std::vector<double>&& coefficients, std::vector<double>&& labels, double bias, int inputDim)
        : m_kernel{ std::move(kernel) }
        , m_supportVectors{ std::move(supportVectors) }
        , m_coefficients{ std::move(coefficients) }
        , m_labels{ std::move(labels) }
        , m_bias{ bias }
        , m_inputDim{ inputDim }
    {
        if (m_coefficients.size() != m_supportVectors.size() || m_labels.size() != m_supportVectors.size()) {
            throw std::logic_error("Svm::Model(): support vectors, coefficients and labels differ in count");
        }
    }

    data::Label Model::Predict(const data::Features& x) const {
        data::Label label(1);
        label << Classify(x);

        return label;
    }

    double Model::Decision(const data::Features& x) const {
        if (x.size() != m_inputDim) {
            throw error::DimensionMismatch("Svm::Model::Predict()", m_inputDim, long(x.size()));
        }

        double sum = m_bias;
        for (int i = 0; i < NumSupportVectors(); ++i) {
            sum += m_coefficients[i] * m_labels[i] * m_kernel.Evaluate(m_supportVectors[i], x);
        }

        return sum;
    }

    double Model::Classify(const data::Features& x) const {
        return Decision(x) > 0 ? 1.0 : -1.0;
    }

    Trainer::Trainer(Config config)
        : m_config{ std::move(config) }
    {
        if (!(m_config.m_penalty > 0)) {
            throw std::invalid_argument("Svm::Trainer(): penalty must be positive");
        }

        if (!(m_config.m_tolerance > 0)) {
            throw std::invalid_argument("Svm::Trainer(): tolerance must be positive");
        }

        if (m_config.m_maxIterations < 0) {
            throw std::invalid_argument("Svm::Trainer(): iteration cap must not be negative");
        }
    }

    model::TrainResult Trainer::Train(const data::Dataset& dataset) const {
        if (dataset.Empty()) {
            throw error::EmptyDataset("Svm::Trainer::Train()");
        }

        if (dataset.LabelDim() != 1) {
            throw error::DimensionMismatch("Svm::Trainer::Train(): label", 1, dataset.LabelDim());
        }

        std::vector<double> y;
        y.reserve(size_t(dataset.Size()));

        for (const auto& sample : dataset) {
            const double label = sample.second(0);
            if (label != 1.0 && label != -1.0) {
                throw error::InvalidLabel("Svm::Trainer::Train()", label);
            }

            y.push_back(label);
        }

        const int input_dim = dataset.FeatureDim();
        model::TrainResult result;

        const bool single_class = std::all_of(y.begin(), y.end(), [&y](double label) { return label == y.front(); });
        if (single_class) {
            auto machine = std::make_shared<const Model>(m_config.m_kernel, std::vector<linalg::Vector>{},
                std::vector<double>{}, std::vector<double>{}, y.front(), input_dim);

            if (m_config.m_verbose) {
                PrintTrainResult(result, *machine, m_config.m_kernel.Describe());
            }

            result.m_model = std::move(machine);
            return result;
        }

        auto gram = GramMatrix(dataset, m_config.m_kernel);
        if (!linalg::AllFinite(gram)) {
            throw std::domain_error("Svm::Trainer::Train(): kernel " + m_config.m_kernel.Describe() + " produced a non-finite value");
        }

        Solver solver(std::move(gram), y, m_config.m_penalty);

        bool converged = false;
        int iterations = 0;

        for (;;) {
            int i = -1;
            int j = -1;

            if (!solver.SelectWorkingSet(m_config.m_tolerance, i, j)) {
                converged = true;
                break;
            }

            if (iterations >= m_config.m_maxIterations) {
                break;
            }

            solver.Update(i, j);
            ++iterations;
        }

        std::vector<linalg::Vector> support_vectors;
        std::vector<double> coefficients;
        std::vector<double> labels;

        const auto& alpha = solver.Alpha();
        for (int t = 0; t < dataset.Size(); ++t) {
            if (alpha[t] > m_config.m_supportEpsilon) {
                support_vectors.push_back(dataset[t].first);
                coefficients.push_back(alpha[t]);
                labels.push_back(y[t]);
            }
        }

        auto machine = std::make_shared<const Model>(m_config.m_kernel, std::move(support_vectors),
            std::move(coefficients), std::move(labels), solver.Bias(), input_dim);

        result.m_iterations = iterations;
        result.m_objective = solver.Objective();

        if (!converged) {
            result.m_diagnostic = error::Code::DidNotConverge;
        }

        if (m_config.m_verbose) {
            PrintTrainResult(result, *machine, m_config.m_kernel.Describe());

            if (!converged) {
                std::cerr << "SVM: " << error::ToString(error::Code::DidNotConverge) << " : violation above "
                    << m_config.m_tolerance << " after " << iterations << " iterations" << std::endl;
            }
        }

        result.m_model = std::move(machine);
        return result;
    }

    model::TrainResult Train(const data::Dataset& dataset, const kernel::Kernel& kernel, double penalty) {
        Config config;
        config.m_kernel = kernel;
        config.m_penalty = penalty;

        return Trainer(std::move(config)).Train(dataset);
    }
}
