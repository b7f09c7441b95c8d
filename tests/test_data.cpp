#include <gtest/gtest.h>
#include <Data/Data.hpp>
#include <Error/Error.hpp>

TEST(DatasetTest, TracksDimensions) {
    data::Dataset dataset;
    EXPECT_TRUE(dataset.Empty());
    EXPECT_EQ(dataset.FeatureDim(), 0);

    dataset.Add(linalg::MakeVector({ 1, 2, 3 }), 1.0);
    dataset.Add(linalg::MakeVector({ 4, 5, 6 }), -1.0);

    EXPECT_EQ(dataset.Size(), 2);
    EXPECT_EQ(dataset.FeatureDim(), 3);
    EXPECT_EQ(dataset.LabelDim(), 1);
    EXPECT_EQ(dataset[1].second(0), -1.0);
}

TEST(DatasetTest, RejectsMixedDimensions) {
    data::Dataset dataset;
    dataset.Add(linalg::MakeVector({ 1, 2 }), linalg::MakeVector({ 0, 1 }));

    EXPECT_THROW(dataset.Add(linalg::MakeVector({ 1, 2, 3 }), linalg::MakeVector({ 0, 1 })), error::DimensionMismatch);
    EXPECT_THROW(dataset.Add(linalg::MakeVector({ 1, 2 }), 1.0), error::DimensionMismatch);
    EXPECT_EQ(dataset.Size(), 1);

    std::vector<data::PairXY> samples = {
        { linalg::MakeVector({ 1 }), linalg::MakeVector({ 1 }) },
        { linalg::MakeVector({ 1, 2 }), linalg::MakeVector({ 1 }) },
    };
    EXPECT_THROW(data::Dataset{ samples }, error::DimensionMismatch);
}

TEST(DatasetTest, SplitIsReproducible) {
    data::Dataset dataset;
    for (int i = 0; i < 20; ++i) {
        dataset.Add(linalg::MakeVector({ double(i) }), double(i % 2));
    }

    const auto first = data::Split(dataset, 0.25, 3);
    const auto second = data::Split(dataset, 0.25, 3);

    ASSERT_EQ(first.m_test_data.Size(), 5);
    ASSERT_EQ(first.m_training_data.Size(), 15);

    for (int i = 0; i < first.m_test_data.Size(); ++i) {
        EXPECT_EQ(first.m_test_data[i].first, second.m_test_data[i].first);
    }

    EXPECT_THROW(data::Split(dataset, 1.5, 3), std::invalid_argument);
}
