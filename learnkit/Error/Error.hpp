#pragma once
#include <stdexcept>
#include <string>

namespace error {
    enum class Code {
        DimensionMismatch,
        DidNotConverge,
        NonFiniteGradient,
        EmptyDataset,
        InvalidLabel
    };

    const char* ToString(Code code);

    class Error : public std::logic_error {
    public:
        Error(Code code, const std::string& what);

        Code GetCode() const noexcept { return m_code; }

    private:
        Code m_code;
    };

    // Operand or input extent does not match what the operation requires.
    class DimensionMismatch : public Error {
    public:
        DimensionMismatch(const std::string& where, long expected, long actual);

        long Expected() const noexcept { return m_expected; }
        long Actual() const noexcept { return m_actual; }

    private:
        long m_expected;
        long m_actual;
    };

    class EmptyDataset : public Error {
    public:
        explicit EmptyDataset(const std::string& where);
    };

    class InvalidLabel : public Error {
    public:
        InvalidLabel(const std::string& where, double label);
    };
}
