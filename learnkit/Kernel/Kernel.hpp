#pragma once
#include <string>
#include "Linalg/Linalg.hpp"

namespace kernel {
    enum class Type {
        Linear,
        Polynomial,
        HyperTan,
        Rbf
    };

    const char* ToString(Type type);

    // Stateless similarity function chosen by tag. The parameters are fixed at
    // construction; Evaluate dispatches on the tag.
    //
    //   Linear      dot(a, b) + c
    //   Polynomial  (alpha * dot(a, b) + c) ^ degree
    //   HyperTan    tanh(gain * dot(a, b) + offset)
    //   Rbf         exp(-gamma * |a - b|^2)
    class Kernel {
    public:
        static Kernel Linear(double c = 0.0);
        static Kernel Polynomial(double alpha = 1.0, double c = 0.0, int degree = 2);
        static Kernel HyperTan(double gain = 1.0, double offset = 0.0);
        static Kernel Rbf(double gamma = 1.0);

        // Throws error::DimensionMismatch when a and b differ in length.
        double Evaluate(const linalg::Vector& a, const linalg::Vector& b) const;

        Type GetType() const { return m_type; }
        double Gain() const { return m_gain; }
        double Offset() const { return m_offset; }
        int Degree() const { return m_degree; }

        std::string Describe() const;

    private:
        Kernel(Type type, double gain, double offset, int degree);

        Type m_type;
        double m_gain;    // alpha for Polynomial, gamma for Rbf
        double m_offset;  // c
        int m_degree;
    };
}
