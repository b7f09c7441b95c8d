#pragma once
#include <utility>
#include <vector>
#include "Linalg/Linalg.hpp"

namespace data {
    using Features = linalg::Vector;
    using Label = linalg::Vector;
    using PairXY = std::pair<Features, Label>;

    // Ordered (features, label) pairs. All feature vectors share one
    // dimension and all labels share one dimension; samples are read-only
    // once added.
    class Dataset {
    public:
        using const_iterator = std::vector<PairXY>::const_iterator;

        Dataset() = default;
        explicit Dataset(std::vector<PairXY> samples);

        void Add(Features x, Label y);
        void Add(Features x, double y);

        int Size() const { return int(m_samples.size()); }
        bool Empty() const { return m_samples.empty(); }

        // 0 while the dataset is empty
        int FeatureDim() const;
        int LabelDim() const;

        const PairXY& operator[](int index) const { return m_samples[size_t(index)]; }
        const std::vector<PairXY>& Samples() const { return m_samples; }

        const_iterator begin() const { return m_samples.begin(); }
        const_iterator end() const { return m_samples.end(); }

    private:
        void Check(const Features& x, const Label& y) const;

        std::vector<PairXY> m_samples;
    };

    struct Set {
        Dataset m_training_data;
        Dataset m_test_data;
    };

    // Shuffles with the given seed and moves round(testFraction * size)
    // samples into the test split.
    Set Split(const Dataset& dataset, double testFraction, unsigned seed);
}
