#pragma once
#include <memory>
#include <optional>
#include <vector>
#include "Model/Model.hpp"
#include "Activation.hpp"
#include "Cost.hpp"

namespace net {
    struct LayerSpec {
        int m_size = 0;
        activation::Type m_activation = activation::Type::Sigmoid;
    };

    // Input width followed by every non-input layer, first to last.
    struct Topology {
        int m_inputSize = 0;
        std::vector<LayerSpec> m_layers;
    };

    struct TrainConfig {
        double m_learningRate = 0.5;
        int m_epochs = 1000;

        // stop early once |loss(epoch) - loss(epoch - 1)| falls below this
        std::optional<double> m_lossTolerance;

        // 1 updates after every example
        int m_miniBatchSize = 1;
        cost::Type m_cost = cost::Type::MSE;

        // initial weights are drawn uniformly from [-m_initRange, m_initRange]
        unsigned m_seed = 42;
        double m_initRange = 0.5;
        bool m_shuffle = true;

        bool m_verbose = false;
        int m_printEvery = 100;
    };

    // Weight matrix rows are units, columns are inputs plus one; the last
    // column is the bias.
    struct Layer {
        linalg::Matrix m_weights;
        activation::Type m_activation = activation::Type::Sigmoid;
    };

    class Model : public model::Model {
    public:
        explicit Model(std::vector<Layer>&& layers);

        data::Label Predict(const data::Features& x) const override;

        int InputDim() const override;
        int OutputDim() const override;

        const std::vector<Layer>& Layers() const { return m_layers; }

    private:
        const std::vector<Layer> m_layers;
        std::vector<activation::Ptr> m_activations;
    };

    class Trainer : public model::Trainer {
    public:
        Trainer(Topology topology, TrainConfig config);

        model::TrainResult Train(const data::Dataset& dataset) const override;

        // Same as above; with m_verbose the test split is scored on every
        // printed epoch.
        model::TrainResult Train(const data::Set& set) const;

        const Topology& GetTopology() const { return m_topology; }
        const TrainConfig& GetConfig() const { return m_config; }

    private:
        model::TrainResult Run(const data::Dataset& training, const data::Dataset* test) const;

        Topology m_topology;
        TrainConfig m_config;
    };

    class Builder {
    public:
        Builder& AddInputLayer(int num_neurons);
        Builder& AddLayer(int num_neurons, activation::Type type);
        Builder& AddCost(cost::Type type);

        Builder& LearningRate(double learning_rate);
        Builder& Epochs(int epochs);
        Builder& LossTolerance(double tolerance);
        Builder& MiniBatchSize(int mini_batch_size);
        Builder& Seed(unsigned seed);
        Builder& Verbose(bool verbose, int print_every = 100);

        std::unique_ptr<Trainer> Build() const;

    private:
        Topology m_topology;
        TrainConfig m_config;
    };

    model::TrainResult Train(const data::Dataset& dataset, const Topology& topology, const TrainConfig& config);
}
