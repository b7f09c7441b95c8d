/**
 * @file test_net.cpp
 * @brief Feed-forward network training and prediction
 */

#include <gtest/gtest.h>
#include <Net/Net.hpp>
#include <Error/Error.hpp>
#include <cmath>
#include <limits>
#include <random>

namespace {
    // Points scattered around the corners of the unit square, labelled 1 only
    // when both coordinates exceed the threshold.
    data::Dataset AndGate(int samples, unsigned seed) {
        const double threshold = 0.7;

        std::mt19937 gen(seed);
        std::uniform_int_distribution<int> corner(0, 1);
        std::uniform_real_distribution<double> jitter(-0.1, 0.1);

        data::Dataset dataset;
        for (int i = 0; i < samples; ++i) {
            const double a = corner(gen) + jitter(gen);
            const double b = corner(gen) + jitter(gen);
            dataset.Add(linalg::MakeVector({ a, b }), a > threshold && b > threshold ? 1.0 : 0.0);
        }

        return dataset;
    }

    net::Topology Perceptron() {
        net::Topology topology;
        topology.m_inputSize = 2;
        topology.m_layers.push_back({ 1, activation::Type::Sigmoid });
        return topology;
    }

    bool SameWeights(const model::Model& lhs, const model::Model& rhs) {
        const auto& a = dynamic_cast<const net::Model&>(lhs).Layers();
        const auto& b = dynamic_cast<const net::Model&>(rhs).Layers();

        if (a.size() != b.size()) {
            return false;
        }

        for (size_t i = 0; i < a.size(); ++i) {
            if (a[i].m_weights.rows() != b[i].m_weights.rows() || a[i].m_weights.cols() != b[i].m_weights.cols()) {
                return false;
            }

            if (!(a[i].m_weights.array() == b[i].m_weights.array()).all()) {
                return false;
            }
        }

        return true;
    }
}

TEST(NetTest, AndGatePerceptron) {
    net::TrainConfig config;
    config.m_learningRate = 1.0;
    config.m_epochs = 1000;

    const auto result = net::Train(AndGate(200, 5), Perceptron(), config);
    ASSERT_TRUE(result.Ok());
    ASSERT_NE(result.m_model, nullptr);
    EXPECT_EQ(result.m_iterations, 1000);

    EXPECT_NEAR(result.m_model->Predict(linalg::MakeVector({ 0.0, 0.0 }))(0), 0.0, 0.05);
    EXPECT_NEAR(result.m_model->Predict(linalg::MakeVector({ 1.0, 0.0 }))(0), 0.0, 0.05);
    EXPECT_NEAR(result.m_model->Predict(linalg::MakeVector({ 0.0, 1.0 }))(0), 0.0, 0.05);
    EXPECT_NEAR(result.m_model->Predict(linalg::MakeVector({ 1.0, 1.0 }))(0), 1.0, 0.05);
}

TEST(NetTest, LayerShapesIncludeBiasColumn) {
    auto trainer = net::Builder()
        .AddInputLayer(3)
        .AddLayer(4, activation::Type::Tanh)
        .AddLayer(2, activation::Type::Sigmoid)
        .Epochs(0)
        .Build();

    data::Dataset dataset;
    dataset.Add(linalg::MakeVector({ 1, 2, 3 }), linalg::MakeVector({ 0, 1 }));

    const auto result = trainer->Train(dataset);
    const auto& layers = dynamic_cast<const net::Model&>(*result.m_model).Layers();

    ASSERT_EQ(layers.size(), 2u);
    EXPECT_EQ(layers[0].m_weights.rows(), 4);
    EXPECT_EQ(layers[0].m_weights.cols(), 4);
    EXPECT_EQ(layers[1].m_weights.rows(), 2);
    EXPECT_EQ(layers[1].m_weights.cols(), 5);
    EXPECT_EQ(layers[1].m_activation, activation::Type::Sigmoid);

    EXPECT_EQ(result.m_model->InputDim(), 3);
    EXPECT_EQ(result.m_model->OutputDim(), 2);

    // untrained weights stay within the initial range
    EXPECT_LE(layers[0].m_weights.cwiseAbs().maxCoeff(), 0.5);
}

TEST(NetTest, SameSeedReproducesWeights) {
    const auto dataset = AndGate(40, 9);

    net::TrainConfig config;
    config.m_epochs = 20;
    config.m_seed = 1234;

    const auto first = net::Train(dataset, Perceptron(), config);
    const auto second = net::Train(dataset, Perceptron(), config);
    EXPECT_TRUE(SameWeights(*first.m_model, *second.m_model));

    config.m_seed = 4321;
    const auto third = net::Train(dataset, Perceptron(), config);
    EXPECT_FALSE(SameWeights(*first.m_model, *third.m_model));
}

TEST(NetTest, HiddenLayerLearnsXor) {
    data::Dataset dataset;
    dataset.Add(linalg::MakeVector({ 0, 0 }), 0.0);
    dataset.Add(linalg::MakeVector({ 0, 1 }), 1.0);
    dataset.Add(linalg::MakeVector({ 1, 0 }), 1.0);
    dataset.Add(linalg::MakeVector({ 1, 1 }), 0.0);

    auto trainer = net::Builder()
        .AddInputLayer(2)
        .AddLayer(8, activation::Type::Tanh)
        .AddLayer(1, activation::Type::Sigmoid)
        .AddCost(cost::Type::CrossEntropy)
        .LearningRate(0.1)
        .Epochs(5000)
        .Seed(3)
        .Build();

    const auto result = trainer->Train(dataset);
    ASSERT_TRUE(result.Ok());

    for (const auto& sample : dataset) {
        const auto out = result.m_model->Predict(sample.first)(0);
        EXPECT_EQ(out >= 0.5, sample.second(0) == 1.0) << sample.first.transpose();
    }
}

TEST(NetTest, MiniBatchesTrainToo) {
    auto trainer = net::Builder()
        .AddInputLayer(2)
        .AddLayer(1, activation::Type::Sigmoid)
        .LearningRate(2.0)
        .MiniBatchSize(8)
        .Epochs(2000)
        .Build();

    const auto result = trainer->Train(AndGate(100, 21));
    ASSERT_TRUE(result.Ok());

    EXPECT_LT(result.m_model->Predict(linalg::MakeVector({ 1.0, 0.0 }))(0), 0.5);
    EXPECT_GT(result.m_model->Predict(linalg::MakeVector({ 1.0, 1.0 }))(0), 0.5);
}

TEST(NetTest, LossToleranceStopsEarly) {
    net::TrainConfig config;
    config.m_learningRate = 1.0;
    config.m_epochs = 100000;
    config.m_lossTolerance = 1e-4;

    const auto result = net::Train(AndGate(40, 13), Perceptron(), config);

    ASSERT_TRUE(result.Ok());
    EXPECT_LT(result.m_iterations, config.m_epochs);
    EXPECT_GT(result.m_iterations, 1);
}

TEST(NetTest, NonFiniteGradientKeepsLastGoodWeights) {
    net::Topology topology;
    topology.m_inputSize = 2;
    topology.m_layers.push_back({ 1, activation::Type::Linear });

    data::Dataset dataset;
    dataset.Add(linalg::MakeVector({ 1, 1 }), 10.0);
    dataset.Add(linalg::MakeVector({ 1, -1 }), -10.0);

    net::TrainConfig config;
    config.m_learningRate = 1e308;
    config.m_epochs = 10;

    const auto result = net::Train(dataset, topology, config);

    ASSERT_FALSE(result.Ok());
    EXPECT_EQ(*result.m_diagnostic, error::Code::NonFiniteGradient);
    EXPECT_EQ(result.m_iterations, 0);
    ASSERT_NE(result.m_model, nullptr);

    const auto& layers = dynamic_cast<const net::Model&>(*result.m_model).Layers();
    EXPECT_TRUE(layers[0].m_weights.allFinite());
    EXPECT_LE(layers[0].m_weights.cwiseAbs().maxCoeff(), config.m_initRange);

    const auto out = result.m_model->Predict(linalg::MakeVector({ 1, 1 }));
    EXPECT_TRUE(std::isfinite(out(0)));
}

TEST(NetTest, NonFiniteActivationStopsBeforeAnyUpdate) {
    const double nan = std::numeric_limits<double>::quiet_NaN();

    data::Dataset dataset;
    dataset.Add(linalg::MakeVector({ nan, 1.0 }), 1.0);
    dataset.Add(linalg::MakeVector({ 1.0, nan }), 0.0);

    net::TrainConfig config;
    config.m_epochs = 10;
    config.m_seed = 77;

    const auto result = net::Train(dataset, Perceptron(), config);

    ASSERT_FALSE(result.Ok());
    EXPECT_EQ(*result.m_diagnostic, error::Code::NonFiniteGradient);
    EXPECT_EQ(result.m_iterations, 0);
    ASSERT_NE(result.m_model, nullptr);

    // zero epochs with the same seed yields the initial weights
    config.m_epochs = 0;
    const auto initial = net::Train(dataset, Perceptron(), config);
    ASSERT_TRUE(initial.Ok());
    EXPECT_TRUE(SameWeights(*result.m_model, *initial.m_model));
}

TEST(NetTest, PredictRejectsWrongDimension) {
    net::TrainConfig config;
    config.m_epochs = 5;

    const auto result = net::Train(AndGate(10, 1), Perceptron(), config);

    EXPECT_THROW(result.m_model->Predict(linalg::MakeVector({ 1.0 })), error::DimensionMismatch);
    EXPECT_THROW(result.m_model->Predict(linalg::MakeVector({ 1.0, 2.0, 3.0 })), error::DimensionMismatch);

    const auto x = linalg::MakeVector({ 0.3, 0.9 });
    EXPECT_EQ(result.m_model->Predict(x), result.m_model->Predict(x));
}

TEST(NetTest, TrainingErrors) {
    net::TrainConfig config;

    EXPECT_THROW(net::Train(data::Dataset{}, Perceptron(), config), error::EmptyDataset);

    data::Dataset wrong_features;
    wrong_features.Add(linalg::MakeVector({ 1, 2, 3 }), 1.0);
    EXPECT_THROW(net::Train(wrong_features, Perceptron(), config), error::DimensionMismatch);

    data::Dataset wrong_label;
    wrong_label.Add(linalg::MakeVector({ 1, 2 }), linalg::MakeVector({ 1, 0 }));
    EXPECT_THROW(net::Train(wrong_label, Perceptron(), config), error::DimensionMismatch);

    EXPECT_THROW(net::Builder().AddInputLayer(2).Build(), std::invalid_argument);
    EXPECT_THROW(net::Builder().AddInputLayer(2).AddLayer(0, activation::Type::Sigmoid).Build(), std::invalid_argument);
    EXPECT_THROW(net::Builder().AddInputLayer(2).AddLayer(1, activation::Type::Sigmoid).LearningRate(0.0).Build(), std::invalid_argument);
}

TEST(NetTest, TrainWithTestSplit) {
    const auto set = data::Split(AndGate(120, 17), 0.25, 2);

    auto trainer = net::Builder()
        .AddInputLayer(2)
        .AddLayer(1, activation::Type::Sigmoid)
        .LearningRate(1.0)
        .Epochs(300)
        .Build();

    const auto result = trainer->Train(set);
    ASSERT_TRUE(result.Ok());

    int matches = 0;
    for (const auto& sample : set.m_test_data) {
        const auto out = result.m_model->Predict(sample.first)(0);
        matches += int((out >= 0.5) == (sample.second(0) >= 0.5));
    }

    EXPECT_EQ(matches, set.m_test_data.Size());
}
