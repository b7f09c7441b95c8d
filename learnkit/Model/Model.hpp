#pragma once
#include <memory>
#include <optional>
#include <vector>
#include "Data/Data.hpp"
#include "Error/Error.hpp"

namespace model {
    // Trained, immutable predictor. Implementations hold no mutable state, so
    // a single instance may serve Predict calls from several threads.
    class Model {
    public:
        virtual ~Model() = default;

        // Throws error::DimensionMismatch when x.size() != InputDim().
        virtual data::Label Predict(const data::Features& x) const = 0;

        virtual int InputDim() const = 0;
        virtual int OutputDim() const = 0;
    };

    using Ptr = std::shared_ptr<const Model>;

    struct TrainResult {
        Ptr m_model;

        // DidNotConverge or NonFiniteGradient; m_model is still usable then
        std::optional<error::Code> m_diagnostic;

        // solver pair updates (SVM) or completed epochs (network)
        int m_iterations = 0;

        // final dual objective (SVM) or last epoch's mean loss (network)
        double m_objective = 0.0;

        bool Ok() const { return !m_diagnostic.has_value(); }
    };

    class Trainer {
    public:
        virtual ~Trainer() = default;

        // Throws error::EmptyDataset or error::DimensionMismatch; every other
        // training condition is reported through TrainResult::m_diagnostic.
        virtual TrainResult Train(const data::Dataset& dataset) const = 0;
    };

    std::vector<data::Label> PredictAll(const Model& model, const data::Dataset& dataset);
}
