#include "Net.hpp"
#include <algorithm>
#include <cmath>
#include <functional>
#include <iostream>
#include <iterator>
#include <numeric>
#include <random>

namespace net {
    using VecVector = std::vector<linalg::Vector>;
    using VecMatrix = std::vector<linalg::Matrix>;

    using Ref = std::reference_wrapper<const data::PairXY>;

    struct grads {
        VecMatrix m_dc_dw;

        bool empty() const {
            return m_dc_dw.empty();
        }

        int size() const {
            return int(m_dc_dw.size());
        }
    };

    // Per-layer pre-activations and activations of one example; m_a[0] is
    // the input.
    struct pass {
        VecVector m_z;
        VecVector m_a;

        bool all_finite() const {
            return std::all_of(m_a.begin(), m_a.end(), [](const auto& a) { return linalg::AllFinite(a); });
        }
    };

    template <class Cont, class Gen>
    void ShuffleInput(Cont& container, Gen& gen) {
        std::shuffle(container.begin(), container.end(), gen);
    }

    std::vector<Ref> MiniBatch(const std::vector<Ref>& input, int mini_batch_index, int mini_batch_size) {
        const auto offset = std::min(size_t(mini_batch_index) * size_t(mini_batch_size), input.size());
        const auto beginIt = std::next(input.begin(), std::ptrdiff_t(offset));
        const auto endIt = std::next(beginIt, std::ptrdiff_t(std::min(size_t(mini_batch_size), input.size() - offset)));

        return { beginIt, endIt };
    }

    grads SumGrads(grads&& batch_grads, grads layer_grads) {
        if (batch_grads.empty()) {
            return layer_grads;
        }

        for (int i = 0; i < batch_grads.size(); ++i) {
            batch_grads.m_dc_dw[i] += layer_grads.m_dc_dw[i];
        }

        return batch_grads;
    }

    linalg::Vector Affine(const linalg::Matrix& w, const linalg::Vector& a) {
        const auto inputs = w.cols() - 1;
        if (a.size() != inputs) {
            throw error::DimensionMismatch("Net::Affine()", long(inputs), long(a.size()));
        }

        return w.leftCols(inputs) * a + w.col(inputs);
    }

    std::vector<activation::Ptr> CreateActivations(const std::vector<Layer>& layers) {
        std::vector<activation::Ptr> output;
        output.reserve(layers.size());

        std::transform(layers.begin(), layers.end(), std::back_inserter(output), [](const Layer& layer) {
            return activation::Create(layer.m_activation);
        });

        return output;
    }
}

namespace init {
    void FillData(double* data, Eigen::Index size, std::mt19937& gen, double range) {
        std::uniform_real_distribution<double> dist(-range, range);

        for (Eigen::Index i = 0; i < size; ++i) {
            data[i] = dist(gen);
        }
    }

    linalg::Matrix GenerateMatrix(int rows, int cols, std::mt19937& gen, double range) {
        linalg::Matrix mtx(rows, cols);

        FillData(mtx.data(), mtx.size(), gen, range);
        return mtx;
    }

    std::vector<net::Layer> DefaultLayers(const net::Topology& topology, std::mt19937& gen, double range) {
        std::vector<net::Layer> layers;
        layers.reserve(topology.m_layers.size());

        int inputs = topology.m_inputSize;
        for (const auto& spec : topology.m_layers) {
            layers.push_back({ GenerateMatrix(spec.m_size, inputs + 1, gen, range), spec.m_activation });
            inputs = spec.m_size;
        }

        return layers;
    }
}

namespace net {
    // Mutable network owned by a single Trainer::Train call. Release() hands
    // the weights over to an immutable Model.
    class Network {
    public:
        Network(std::vector<Layer>&& layers, cost::Ptr cost);

        pass Forward(const linalg::Vector& x) const;
        double Loss(const linalg::Vector& y, const pass& p) const;
        grads BackProp(const linalg::Vector& y, const pass& p) const;

        // Applies w -= ratio * dc_dw to every layer, or leaves the weights
        // untouched and returns false when any gradient or updated weight is
        // not finite.
        bool GradDescent(grads batch_grads, double ratio);

        int Evaluate(const data::Dataset& test_data) const;

        std::vector<Layer> Release() { return std::move(m_layers); }

    private:
        std::vector<Layer> m_layers;
        std::vector<activation::Ptr> m_activations;
        cost::Ptr m_cost;
    };

    Network::Network(std::vector<Layer>&& layers, cost::Ptr cost)
        : m_layers{ std::move(layers) }
        , m_activations{ CreateActivations(m_layers) }
        , m_cost{ std::move(cost) }
    {
    }

    pass Network::Forward(const linalg::Vector& x) const {
        pass output;
        output.m_z.reserve(m_layers.size());
        output.m_a.reserve(m_layers.size() + 1);

        output.m_a.push_back(x);
        for (int i = 0; i < int(m_layers.size()); ++i) {
            output.m_z.push_back(Affine(m_layers[i].m_weights, output.m_a.back()));
            output.m_a.push_back(m_activations[i]->f(output.m_z.back()));
        }

        return output;
    }

    double Network::Loss(const linalg::Vector& y, const pass& p) const {
        return m_cost->loss(y, p.m_a.back());
    }

    grads Network::BackProp(const linalg::Vector& y, const pass& p) const {
        linalg::Vector dc_da = m_cost->dc_da(y, p.m_a.back());

        grads output;
        output.m_dc_dw.resize(m_layers.size());

        for (int layer = int(m_layers.size()) - 1; layer >= 0; --layer) {
            const auto& w = m_layers[layer].m_weights;
            const auto inputs = w.cols() - 1;

            const auto da_dz = m_activations[layer]->f_prime(p.m_z[layer]);
            const auto dc_dz = linalg::Hadamard(dc_da, da_dz);

            auto& dc_dw = output.m_dc_dw[layer];
            dc_dw.resize(w.rows(), w.cols());
            dc_dw.leftCols(inputs) = linalg::Outer(dc_dz, p.m_a[layer]);
            dc_dw.col(inputs) = dc_dz;

            dc_da = w.leftCols(inputs).transpose() * dc_dz;
        }

        return output;
    }

    bool Network::GradDescent(grads batch_grads, double ratio) {
        VecMatrix updated;
        updated.reserve(m_layers.size());

        for (int i = 0; i < batch_grads.size(); ++i) {
            if (!linalg::AllFinite(batch_grads.m_dc_dw[i])) {
                return false;
            }

            updated.push_back(linalg::Subtract(m_layers[i].m_weights, linalg::Scale(batch_grads.m_dc_dw[i], ratio)));
            if (!linalg::AllFinite(updated.back())) {
                return false;
            }
        }

        for (int i = 0; i < int(updated.size()); ++i) {
            m_layers[i].m_weights = std::move(updated[i]);
        }

        return true;
    }

    // Multi-output networks match on argmax, single-output ones on the 0.5
    // threshold.
    int Network::Evaluate(const data::Dataset& test_data) const {
        VecVector output;
        output.reserve(size_t(test_data.Size()));

        std::transform(test_data.begin(), test_data.end(), std::back_inserter(output), [this](const auto& data) {
            return Forward(data.first).m_a.back();
        });

        return std::inner_product(test_data.begin(), test_data.end(), output.begin(), 0, std::plus<>(), [](const auto& test, const auto& out) {
            if (out.size() == 1) {
                return int((test.second(0) >= 0.5) == (out(0) >= 0.5));
            }

            Eigen::Index max_y_idx;
            test.second.maxCoeff(&max_y_idx);

            Eigen::Index max_out_idx;
            out.maxCoeff(&max_out_idx);

            return int(max_y_idx == max_out_idx);
        });
    }

    void PrintEpochResult(int epoch, double loss, const Network& network, const data::Dataset* test) {
        std::cout << "Epoch: " << epoch << " : loss: " << loss;

        if (test && !test->Empty()) {
            std::cout << " : num_matches: " << network.Evaluate(*test) << '/' << test->Size();
        }

        std::cout << std::endl;
    }

    void CheckDataset(const char* where, const data::Dataset& dataset, const Topology& topology) {
        if (dataset.FeatureDim() != topology.m_inputSize) {
            throw error::DimensionMismatch(std::string(where) + ": features", topology.m_inputSize, dataset.FeatureDim());
        }

        const auto outputs = topology.m_layers.back().m_size;
        if (dataset.LabelDim() != outputs) {
            throw error::DimensionMismatch(std::string(where) + ": label", outputs, dataset.LabelDim());
        }
    }

    Model::Model(std::vector<Layer>&& layers)
        : m_layers{ std::move(layers) }
        , m_activations{ CreateActivations(m_layers) }
    {
        if (m_layers.empty()) {
            throw std::logic_error("Net::Model(): at least one layer is required");
        }

        for (size_t i = 1; i < m_layers.size(); ++i) {
            if (m_layers[i].m_weights.cols() != m_layers[i - 1].m_weights.rows() + 1) {
                throw error::DimensionMismatch("Net::Model(): layer " + std::to_string(i),
                    long(m_layers[i - 1].m_weights.rows() + 1), long(m_layers[i].m_weights.cols()));
            }
        }
    }

    data::Label Model::Predict(const data::Features& x) const {
        if (x.size() != InputDim()) {
            throw error::DimensionMismatch("Net::Model::Predict()", InputDim(), long(x.size()));
        }

        linalg::Vector a = x;
        for (int i = 0; i < int(m_layers.size()); ++i) {
            a = m_activations[i]->f(Affine(m_layers[i].m_weights, a));
        }

        return a;
    }

    int Model::InputDim() const {
        return int(m_layers.front().m_weights.cols()) - 1;
    }

    int Model::OutputDim() const {
        return int(m_layers.back().m_weights.rows());
    }

    Trainer::Trainer(Topology topology, TrainConfig config)
        : m_topology{ std::move(topology) }
        , m_config{ std::move(config) }
    {
        if (m_topology.m_inputSize <= 0) {
            throw std::invalid_argument("Net::Trainer(): input layer must have at least one neuron");
        }

        if (m_topology.m_layers.empty()) {
            throw std::invalid_argument("Net::Trainer(): at least one non-input layer is required");
        }

        for (const auto& spec : m_topology.m_layers) {
            if (spec.m_size <= 0) {
                throw std::invalid_argument("Net::Trainer(): every layer must have at least one neuron");
            }
        }

        if (!(m_config.m_learningRate > 0)) {
            throw std::invalid_argument("Net::Trainer(): learning rate must be positive");
        }

        if (m_config.m_epochs < 0) {
            throw std::invalid_argument("Net::Trainer(): epoch count must not be negative");
        }

        if (m_config.m_miniBatchSize < 1) {
            throw std::invalid_argument("Net::Trainer(): mini-batch size must be at least 1");
        }

        if (m_config.m_lossTolerance && !(*m_config.m_lossTolerance >= 0)) {
            throw std::invalid_argument("Net::Trainer(): loss tolerance must not be negative");
        }

        if (!(m_config.m_initRange >= 0)) {
            throw std::invalid_argument("Net::Trainer(): initial weight range must not be negative");
        }

        if (m_config.m_printEvery < 1) {
            throw std::invalid_argument("Net::Trainer(): print interval must be at least 1");
        }
    }

    model::TrainResult Trainer::Train(const data::Dataset& dataset) const {
        return Run(dataset, nullptr);
    }

    model::TrainResult Trainer::Train(const data::Set& set) const {
        if (!set.m_test_data.Empty()) {
            CheckDataset("Net::Trainer::Train(): test", set.m_test_data, m_topology);
        }

        return Run(set.m_training_data, &set.m_test_data);
    }

    model::TrainResult Trainer::Run(const data::Dataset& training, const data::Dataset* test) const {
        if (training.Empty()) {
            throw error::EmptyDataset("Net::Trainer::Train()");
        }

        CheckDataset("Net::Trainer::Train()", training, m_topology);

        std::mt19937 gen(m_config.m_seed);
        Network network(init::DefaultLayers(m_topology, gen, m_config.m_initRange), cost::Create(m_config.m_cost));

        std::vector<Ref> training_data(training.begin(), training.end());

        const int mini_batch_size = m_config.m_miniBatchSize;
        const int mini_batches = (int(training_data.size()) + mini_batch_size - 1) / mini_batch_size;

        model::TrainResult result;
        std::optional<double> previous_loss;

        for (int i = 0; i < m_config.m_epochs; ++i) {
            if (m_config.m_shuffle) {
                net::ShuffleInput(training_data, gen);
            }

            double epoch_loss = 0.0;
            bool finite = true;

            for (int j = 0; j < mini_batches && finite; ++j) {
                const auto mini_batch = net::MiniBatch(training_data, j, mini_batch_size);

                grads batch_grads;
                for (const auto& sample : mini_batch) {
                    const auto p = network.Forward(sample.get().first);

                    const auto loss = network.Loss(sample.get().second, p);
                    if (!p.all_finite() || !std::isfinite(loss)) {
                        finite = false;
                        break;
                    }

                    epoch_loss += loss;
                    batch_grads = SumGrads(std::move(batch_grads), network.BackProp(sample.get().second, p));
                }

                const double ratio = m_config.m_learningRate / double(mini_batch.size());
                finite = finite && network.GradDescent(std::move(batch_grads), ratio);
            }

            if (!finite) {
                result.m_diagnostic = error::Code::NonFiniteGradient;

                if (m_config.m_verbose) {
                    std::cerr << "Epoch: " << i << " : non-finite gradient, keeping the last finite weights" << std::endl;
                }

                break;
            }

            epoch_loss /= double(training_data.size());
            result.m_iterations = i + 1;
            result.m_objective = epoch_loss;

            if (m_config.m_verbose && (i % m_config.m_printEvery == 0 || i + 1 == m_config.m_epochs)) {
                PrintEpochResult(i, epoch_loss, network, test);
            }

            if (m_config.m_lossTolerance && previous_loss && std::abs(*previous_loss - epoch_loss) < *m_config.m_lossTolerance) {
                if (m_config.m_verbose) {
                    std::cout << "Epoch: " << i << " : loss change below tolerance, stopping" << std::endl;
                }

                break;
            }

            previous_loss = epoch_loss;
        }

        result.m_model = std::make_shared<const Model>(network.Release());
        return result;
    }

    Builder& Builder::AddInputLayer(int num_neurons) {
        m_topology.m_inputSize = num_neurons;
        return *this;
    }

    Builder& Builder::AddLayer(int num_neurons, activation::Type type) {
        m_topology.m_layers.push_back({ num_neurons, type });
        return *this;
    }

    Builder& Builder::AddCost(cost::Type type) {
        m_config.m_cost = type;
        return *this;
    }

    Builder& Builder::LearningRate(double learning_rate) {
        m_config.m_learningRate = learning_rate;
        return *this;
    }

    Builder& Builder::Epochs(int epochs) {
        m_config.m_epochs = epochs;
        return *this;
    }

    Builder& Builder::LossTolerance(double tolerance) {
        m_config.m_lossTolerance = tolerance;
        return *this;
    }

    Builder& Builder::MiniBatchSize(int mini_batch_size) {
        m_config.m_miniBatchSize = mini_batch_size;
        return *this;
    }

    Builder& Builder::Seed(unsigned seed) {
        m_config.m_seed = seed;
        return *this;
    }

    Builder& Builder::Verbose(bool verbose, int print_every) {
        m_config.m_verbose = verbose;
        m_config.m_printEvery = print_every;
        return *this;
    }

    std::unique_ptr<Trainer> Builder::Build() const {
        return std::make_unique<Trainer>(m_topology, m_config);
    }

    model::TrainResult Train(const data::Dataset& dataset, const Topology& topology, const TrainConfig& config) {
        return Trainer(topology, config).Train(dataset);
    }
}
