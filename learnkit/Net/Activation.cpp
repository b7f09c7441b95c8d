#include "Activation.hpp"
#include <stdexcept>

namespace activation {
    namespace impl {
        class Sigmoid : public Activation {
        public:
            linalg::Vector f(const linalg::Vector& z) const override {
                return 1.0 / (1.0 + Eigen::exp(-z.array()));
            }

            linalg::Vector f_prime(const linalg::Vector& z) const override {
                return sigmoid_prime_impl(f(z));
            }

        private:
            static linalg::Vector sigmoid_prime_impl(const linalg::Vector& s) {
                return s.array() * (1.0 - s.array());
            }
        };

        class Tanh : public Activation {
        public:
            linalg::Vector f(const linalg::Vector& z) const override {
                return z.array().tanh();
            }

            linalg::Vector f_prime(const linalg::Vector& z) const override {
                return 1.0 - z.array().tanh().square();
            }
        };

        class Linear : public Activation {
        public:
            linalg::Vector f(const linalg::Vector& z) const override {
                return z;
            }

            linalg::Vector f_prime(const linalg::Vector& z) const override {
                return linalg::Vector::Ones(z.size());
            }
        };

        class ReLU : public Activation {
        public:
            linalg::Vector f(const linalg::Vector& z) const override {
                return z.array().max(0.0);
            }

            linalg::Vector f_prime(const linalg::Vector& z) const override {
                return (z.array() > 0.0).cast<double>();
            }
        };
    }

    const char* ToString(Type type) {
        switch (type) {
        case Type::Sigmoid:
            return "Sigmoid";
        case Type::Tanh:
            return "Tanh";
        case Type::Linear:
            return "Linear";
        case Type::ReLU:
            return "ReLU";
        }

        return "Unknown";
    }

    Ptr Create(Type type) {
        switch (type) {
        case Type::Sigmoid:
            return std::make_unique<impl::Sigmoid>();
        case Type::Tanh:
            return std::make_unique<impl::Tanh>();
        case Type::Linear:
            return std::make_unique<impl::Linear>();
        case Type::ReLU:
            return std::make_unique<impl::ReLU>();
        }

        throw std::logic_error("Activation::Create(): Incorrect type has been passed as parameter");
    }
}
