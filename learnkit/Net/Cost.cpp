#include "Cost.hpp"
#include <stdexcept>

namespace cost {
    namespace impl {
        // Squared error; the gradient drops the factor 2.
        class MSE : public Cost {
        public:
            double loss(const linalg::Vector& y, const linalg::Vector& a) const override {
                return linalg::Subtract(y, a).squaredNorm() / double(y.size());
            }

            linalg::Vector dc_da(const linalg::Vector& y, const linalg::Vector& a) const override {
                return linalg::Subtract(a, y);
            }
        };

        // Binary cross entropy over outputs in (0, 1). Outputs are clamped into
        // [eps, 1 - eps] so that dc_da * sigmoid'(z) stays (a - y) until the
        // sigmoid saturates past eps.
        class CrossEntropy : public Cost {
        public:
            double loss(const linalg::Vector& y, const linalg::Vector& a) const override {
                const linalg::Vector p = Clamp(a);
                const auto terms = y.array() * p.array().log() + (1.0 - y.array()) * (1.0 - p.array()).log();

                return -terms.mean();
            }

            linalg::Vector dc_da(const linalg::Vector& y, const linalg::Vector& a) const override {
                const linalg::Vector p = Clamp(a);
                return linalg::Subtract(p, y).array() / (p.array() * (1.0 - p.array()));
            }

        private:
            static constexpr double eps = 1e-12;

            static linalg::Vector Clamp(const linalg::Vector& a) {
                return a.cwiseMax(eps).cwiseMin(1.0 - eps);
            }
        };
    }

    const char* ToString(Type type) {
        switch (type) {
        case Type::MSE:
            return "MSE";
        case Type::CrossEntropy:
            return "CrossEntropy";
        }

        return "Unknown";
    }

    Ptr Create(Type type) {
        if (type == Type::MSE) {
            return std::make_unique<impl::MSE>();
        }

        if (type == Type::CrossEntropy) {
            return std::make_unique<impl::CrossEntropy>();
        }

        throw std::logic_error("Cost::Create(): Incorrect type has been passed as parameter");
    }
}
