/**
 * @file test_concurrency.cpp
 * @brief Independent training runs and shared read-only models across threads
 */

#include <gtest/gtest.h>
#include <Svm/Svm.hpp>
#include <Net/Net.hpp>
#include <thread>
#include <vector>

namespace {
    data::Dataset Diagonal(int count) {
        data::Dataset dataset;
        for (int i = 0; i < count; ++i) {
            const double x = -1.0 + 2.0 * i / (count - 1);
            const double y = (i % 5) * 0.4 - 0.8;
            dataset.Add(linalg::MakeVector({ x, y }), x + y > 0 ? 1.0 : -1.0);
        }

        return dataset;
    }

    std::vector<linalg::Vector> Queries() {
        std::vector<linalg::Vector> queries;
        for (int i = 0; i < 50; ++i) {
            queries.push_back(linalg::MakeVector({ -1.0 + 0.04 * i, 0.9 - 0.035 * i }));
        }

        return queries;
    }
}

TEST(ConcurrencyTest, TrainersRunInParallel) {
    const auto dataset = Diagonal(40);

    data::Dataset binary;
    for (const auto& sample : dataset) {
        binary.Add(sample.first, sample.second(0) > 0 ? 1.0 : 0.0);
    }

    net::Topology topology;
    topology.m_inputSize = 2;
    topology.m_layers.push_back({ 1, activation::Type::Sigmoid });

    net::TrainConfig config;
    config.m_epochs = 50;

    model::TrainResult svm_result;
    model::TrainResult net_result;

    std::thread svm_thread([&] { svm_result = svm::Train(dataset, kernel::Kernel::Linear(), 10.0); });
    std::thread net_thread([&] { net_result = net::Train(binary, topology, config); });

    svm_thread.join();
    net_thread.join();

    const auto svm_sequential = svm::Train(dataset, kernel::Kernel::Linear(), 10.0);
    const auto net_sequential = net::Train(binary, topology, config);

    ASSERT_NE(svm_result.m_model, nullptr);
    ASSERT_NE(net_result.m_model, nullptr);

    for (const auto& x : Queries()) {
        EXPECT_EQ(svm_result.m_model->Predict(x), svm_sequential.m_model->Predict(x));
        EXPECT_EQ(net_result.m_model->Predict(x), net_sequential.m_model->Predict(x));
    }
}

TEST(ConcurrencyTest, SharedModelServesManyThreads) {
    const auto result = svm::Train(Diagonal(30), kernel::Kernel::Rbf(0.5), 5.0);
    ASSERT_NE(result.m_model, nullptr);

    const auto queries = Queries();

    std::vector<data::Label> expected;
    for (const auto& x : queries) {
        expected.push_back(result.m_model->Predict(x));
    }

    const int num_threads = 4;
    std::vector<std::vector<data::Label>> outputs(num_threads);
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t] {
            for (int round = 0; round < 20; ++round) {
                outputs[size_t(t)].clear();
                for (const auto& x : queries) {
                    outputs[size_t(t)].push_back(result.m_model->Predict(x));
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    for (const auto& output : outputs) {
        ASSERT_EQ(output.size(), expected.size());
        for (size_t i = 0; i < output.size(); ++i) {
            EXPECT_EQ(output[i], expected[i]);
        }
    }
}
