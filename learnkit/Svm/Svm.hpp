#pragma once
#include <vector>
#include "Kernel/Kernel.hpp"
#include "Model/Model.hpp"

namespace svm {
    struct Config {
        kernel::Kernel m_kernel = kernel::Kernel::Linear();

        // upper bound C on every dual coefficient
        double m_penalty = 1.0;

        // stop once the maximal KKT violation drops below this
        double m_tolerance = 1e-3;
        int m_maxIterations = 100000;

        // coefficients at or below this are not kept as support vectors
        double m_supportEpsilon = 1e-8;

        bool m_verbose = false;
    };

    // decision(x) = sum_i coeff_i * label_i * K(sv_i, x) + bias
    class Model : public model::Model {
    public:
        Model(kernel::Kernel kernel, std::vector<linalg::Vector>&& supportVectors,
            std::vector<double>&& coefficients, std::vector<double>&& labels, double bias, int inputDim);

        // One-element label holding +1 or -1.
        data::Label Predict(const data::Features& x) const override;

        double Decision(const data::Features& x) const;
        double Classify(const data::Features& x) const;

        int InputDim() const override { return m_inputDim; }
        int OutputDim() const override { return 1; }

        const kernel::Kernel& GetKernel() const { return m_kernel; }
        const std::vector<linalg::Vector>& SupportVectors() const { return m_supportVectors; }
        const std::vector<double>& Coefficients() const { return m_coefficients; }
        const std::vector<double>& Labels() const { return m_labels; }
        double Bias() const { return m_bias; }
        int NumSupportVectors() const { return int(m_supportVectors.size()); }

    private:
        const kernel::Kernel m_kernel;
        const std::vector<linalg::Vector> m_supportVectors;
        const std::vector<double> m_coefficients;
        const std::vector<double> m_labels;
        const double m_bias;
        const int m_inputDim;
    };

    class Trainer : public model::Trainer {
    public:
        explicit Trainer(Config config);

        // Labels must be one-element vectors holding +1 or -1.
        model::TrainResult Train(const data::Dataset& dataset) const override;

        const Config& GetConfig() const { return m_config; }

    private:
        Config m_config;
    };

    model::TrainResult Train(const data::Dataset& dataset, const kernel::Kernel& kernel, double penalty);
}
