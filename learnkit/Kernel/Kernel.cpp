#include "Kernel.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace kernel {
    const char* ToString(Type type) {
        switch (type) {
        case Type::Linear:
            return "Linear";
        case Type::Polynomial:
            return "Polynomial";
        case Type::HyperTan:
            return "HyperTan";
        case Type::Rbf:
            return "Rbf";
        }

        return "Unknown";
    }

    Kernel::Kernel(Type type, double gain, double offset, int degree)
        : m_type{ type }
        , m_gain{ gain }
        , m_offset{ offset }
        , m_degree{ degree }
    {
    }

    Kernel Kernel::Linear(double c) {
        return Kernel(Type::Linear, 1.0, c, 1);
    }

    Kernel Kernel::Polynomial(double alpha, double c, int degree) {
        if (degree < 1) {
            throw std::invalid_argument("Kernel::Polynomial(): degree must be at least 1");
        }

        return Kernel(Type::Polynomial, alpha, c, degree);
    }

    Kernel Kernel::HyperTan(double gain, double offset) {
        return Kernel(Type::HyperTan, gain, offset, 1);
    }

    Kernel Kernel::Rbf(double gamma) {
        if (gamma <= 0.0) {
            throw std::invalid_argument("Kernel::Rbf(): gamma must be positive");
        }

        return Kernel(Type::Rbf, gamma, 0.0, 1);
    }

    double Kernel::Evaluate(const linalg::Vector& a, const linalg::Vector& b) const {
        switch (m_type) {
        case Type::Linear:
            return linalg::Dot(a, b) + m_offset;
        case Type::Polynomial:
            return std::pow(m_gain * linalg::Dot(a, b) + m_offset, m_degree);
        case Type::HyperTan:
            return std::tanh(m_gain * linalg::Dot(a, b) + m_offset);
        case Type::Rbf:
            return std::exp(-m_gain * linalg::SquaredDistance(a, b));
        }

        throw std::logic_error("Kernel::Evaluate(): Incorrect type has been stored");
    }

    std::string Kernel::Describe() const {
        std::ostringstream out;
        out << ToString(m_type);

        switch (m_type) {
        case Type::Linear:
            out << "(c=" << m_offset << ")";
            break;
        case Type::Polynomial:
            out << "(alpha=" << m_gain << ", c=" << m_offset << ", degree=" << m_degree << ")";
            break;
        case Type::HyperTan:
            out << "(gain=" << m_gain << ", offset=" << m_offset << ")";
            break;
        case Type::Rbf:
            out << "(gamma=" << m_gain << ")";
            break;
        }

        return out.str();
    }
}
