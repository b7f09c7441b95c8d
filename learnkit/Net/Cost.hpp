#pragma once
#include <memory>
#include "Linalg/Linalg.hpp"

namespace cost {
    enum class Type {
        MSE,
        CrossEntropy
    };

    const char* ToString(Type type);

    class Cost {
    public:
        virtual ~Cost() = default;

        // y is the target, a the network output
        virtual double loss(const linalg::Vector& y, const linalg::Vector& a) const = 0;
        virtual linalg::Vector dc_da(const linalg::Vector& y, const linalg::Vector& a) const = 0;
    };

    using Ptr = std::unique_ptr<Cost>;

    Ptr Create(Type type);
}
