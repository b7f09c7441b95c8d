#include "Svm/Svm.hpp"
#include "Net/Net.hpp"
#include "Score/Score.hpp"
#include <iostream>
#include <random>

namespace {
    void SignClassifier() {
        data::Dataset dataset;
        for (int x = -1000; x < 1000; x += 100) {
            dataset.Add(linalg::MakeVector({ double(x) }), x > 0 ? 1.0 : -1.0);
        }

        svm::Config config;
        config.m_kernel = kernel::Kernel::HyperTan(100.0, 0.0);
        config.m_penalty = 10.0;
        config.m_verbose = true;

        const auto result = svm::Trainer(config).Train(dataset);

        std::vector<double> outputs;
        std::vector<double> targets;
        for (const auto& sample : dataset) {
            outputs.push_back(result.m_model->Predict(sample.first)(0));
            targets.push_back(sample.second(0));
        }

        std::cout << "Sign classifier accuracy: " << score::Accuracy(outputs, targets) << std::endl;
    }

    void AndGate() {
        const double threshold = 0.7;

        std::mt19937 gen(7);
        std::uniform_int_distribution<int> corner(0, 1);
        std::uniform_real_distribution<double> jitter(-0.1, 0.1);

        data::Dataset dataset;
        for (int i = 0; i < 200; ++i) {
            const double a = corner(gen) + jitter(gen);
            const double b = corner(gen) + jitter(gen);
            dataset.Add(linalg::MakeVector({ a, b }), a > threshold && b > threshold ? 1.0 : 0.0);
        }

        auto trainer = net::Builder()
            .AddInputLayer(2)
            .AddLayer(1, activation::Type::Sigmoid)
            .AddCost(cost::Type::MSE)
            .LearningRate(1.0)
            .Epochs(1000)
            .Verbose(true, 250)
            .Build();

        const auto result = trainer->Train(dataset);

        const std::vector<std::pair<double, double>> inputs = { { 0.0, 0.0 }, { 1.0, 0.0 }, { 0.0, 1.0 }, { 1.0, 1.0 } };
        const std::vector<double> targets = { 0.0, 0.0, 0.0, 1.0 };

        std::vector<double> outputs;
        for (const auto& input : inputs) {
            const double out = result.m_model->Predict(linalg::MakeVector({ input.first, input.second }))(0);
            std::cout << "AND(" << input.first << ", " << input.second << ") = " << out << std::endl;
            outputs.push_back(out >= 0.5 ? 1.0 : 0.0);
        }

        std::cout << "AND gate accuracy: " << score::Accuracy(outputs, targets) << std::endl;
    }
}

int main() {
    SignClassifier();
    AndGate();

    std::cout << "\nDone" << std::endl;
}
