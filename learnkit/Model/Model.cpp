#include "Model.hpp"
#include <algorithm>
#include <iterator>

namespace model {
    std::vector<data::Label> PredictAll(const Model& model, const data::Dataset& dataset) {
        std::vector<data::Label> output;
        output.reserve(size_t(dataset.Size()));

        std::transform(dataset.begin(), dataset.end(), std::back_inserter(output), [&model](const auto& sample) {
            return model.Predict(sample.first);
        });

        return output;
    }
}
