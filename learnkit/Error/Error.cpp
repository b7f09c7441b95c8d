#include "Error.hpp"

namespace error {
    const char* ToString(Code code) {
        switch (code) {
        case Code::DimensionMismatch:
            return "DimensionMismatch";
        case Code::DidNotConverge:
            return "DidNotConverge";
        case Code::NonFiniteGradient:
            return "NonFiniteGradient";
        case Code::EmptyDataset:
            return "EmptyDataset";
        case Code::InvalidLabel:
            return "InvalidLabel";
        }

        return "Unknown";
    }

    Error::Error(Code code, const std::string& what)
        : std::logic_error(what)
        , m_code{ code }
    {
    }

    DimensionMismatch::DimensionMismatch(const std::string& where, long expected, long actual)
        : Error(Code::DimensionMismatch,
            where + ": dimension mismatch, expected " + std::to_string(expected) + " but got " + std::to_string(actual))
        , m_expected{ expected }
        , m_actual{ actual }
    {
    }

    EmptyDataset::EmptyDataset(const std::string& where)
        : Error(Code::EmptyDataset, where + ": training requires at least one example")
    {
    }

    InvalidLabel::InvalidLabel(const std::string& where, double label)
        : Error(Code::InvalidLabel, where + ": expected label +1 or -1 but got " + std::to_string(label))
    {
    }
}
