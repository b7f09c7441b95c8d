#include "Data.hpp"
#include "Error/Error.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>

namespace data {
    Dataset::Dataset(std::vector<PairXY> samples) {
        m_samples.reserve(samples.size());

        for (auto& sample : samples) {
            Add(std::move(sample.first), std::move(sample.second));
        }
    }

    void Dataset::Add(Features x, Label y) {
        Check(x, y);
        m_samples.emplace_back(std::move(x), std::move(y));
    }

    void Dataset::Add(Features x, double y) {
        Label label(1);
        label << y;

        Add(std::move(x), std::move(label));
    }

    int Dataset::FeatureDim() const {
        return m_samples.empty() ? 0 : int(m_samples.front().first.size());
    }

    int Dataset::LabelDim() const {
        return m_samples.empty() ? 0 : int(m_samples.front().second.size());
    }

    void Dataset::Check(const Features& x, const Label& y) const {
        if (m_samples.empty()) {
            return;
        }

        if (x.size() != FeatureDim()) {
            throw error::DimensionMismatch("Dataset::Add(): features", FeatureDim(), long(x.size()));
        }

        if (y.size() != LabelDim()) {
            throw error::DimensionMismatch("Dataset::Add(): label", LabelDim(), long(y.size()));
        }
    }

    Set Split(const Dataset& dataset, double testFraction, unsigned seed) {
        if (testFraction < 0.0 || testFraction > 1.0) {
            throw std::invalid_argument("Data::Split(): test fraction must lie in [0, 1]");
        }

        std::vector<int> order(size_t(dataset.Size()));
        std::iota(order.begin(), order.end(), 0);

        std::mt19937 gen(seed);
        std::shuffle(order.begin(), order.end(), gen);

        const auto num_test = int(std::lround(testFraction * dataset.Size()));

        Set set;
        for (int i = 0; i < int(order.size()); ++i) {
            const auto& sample = dataset[order[size_t(i)]];
            auto& target = i < num_test ? set.m_test_data : set.m_training_data;
            target.Add(sample.first, sample.second);
        }

        return set;
    }
}
