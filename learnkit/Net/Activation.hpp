#pragma once
#include <memory>
#include "Linalg/Linalg.hpp"

namespace activation {
    enum class Type {
        Sigmoid,
        Tanh,
        Linear,
        ReLU
    };

    const char* ToString(Type type);

    class Activation {
    public:
        virtual ~Activation() = default;

        virtual linalg::Vector f(const linalg::Vector& z) const = 0;
        virtual linalg::Vector f_prime(const linalg::Vector& z) const = 0;
    };

    using Ptr = std::unique_ptr<Activation>;

    Ptr Create(Type type);
}
