#include "Linalg.hpp"
#include "Error/Error.hpp"

namespace {
    void CheckSize(const char* where, Eigen::Index expected, Eigen::Index actual) {
        if (expected != actual) {
            throw error::DimensionMismatch(where, long(expected), long(actual));
        }
    }

    void CheckShape(const char* where, const linalg::Matrix& a, const linalg::Matrix& b) {
        CheckSize(where, a.rows(), b.rows());
        CheckSize(where, a.cols(), b.cols());
    }
}

namespace linalg {
    Vector MakeVector(const std::vector<double>& values) {
        return Eigen::Map<const Vector>(values.data(), Eigen::Index(values.size()));
    }

    Vector MakeVector(std::initializer_list<double> values) {
        return MakeVector(std::vector<double>(values));
    }

    Matrix MakeMatrix(int rows, int cols, const std::vector<double>& values) {
        if (rows < 0 || cols < 0) {
            throw std::invalid_argument("Linalg::MakeMatrix(): negative extent");
        }
        CheckSize("Linalg::MakeMatrix()", Eigen::Index(rows) * cols, Eigen::Index(values.size()));

        using RowMajor = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
        return Eigen::Map<const RowMajor>(values.data(), rows, cols);
    }

    Matrix MakeMatrix(const std::vector<std::vector<double>>& rows) {
        if (rows.empty()) {
            return Matrix(0, 0);
        }

        const auto cols = Eigen::Index(rows.front().size());
        Matrix m(Eigen::Index(rows.size()), cols);

        for (size_t r = 0; r < rows.size(); ++r) {
            CheckSize("Linalg::MakeMatrix()", cols, Eigen::Index(rows[r].size()));
            m.row(Eigen::Index(r)) = Eigen::Map<const Eigen::RowVectorXd>(rows[r].data(), cols);
        }

        return m;
    }

    Vector Add(const Vector& a, const Vector& b) {
        CheckSize("Linalg::Add()", a.size(), b.size());
        return a + b;
    }

    Vector Subtract(const Vector& a, const Vector& b) {
        CheckSize("Linalg::Subtract()", a.size(), b.size());
        return a - b;
    }

    Vector Scale(const Vector& a, double s) {
        return a * s;
    }

    Vector Hadamard(const Vector& a, const Vector& b) {
        CheckSize("Linalg::Hadamard()", a.size(), b.size());
        return a.cwiseProduct(b);
    }

    double Dot(const Vector& a, const Vector& b) {
        CheckSize("Linalg::Dot()", a.size(), b.size());
        return a.dot(b);
    }

    double SquaredDistance(const Vector& a, const Vector& b) {
        CheckSize("Linalg::SquaredDistance()", a.size(), b.size());
        return (a - b).squaredNorm();
    }

    Matrix Add(const Matrix& a, const Matrix& b) {
        CheckShape("Linalg::Add()", a, b);
        return a + b;
    }

    Matrix Subtract(const Matrix& a, const Matrix& b) {
        CheckShape("Linalg::Subtract()", a, b);
        return a - b;
    }

    Matrix Scale(const Matrix& a, double s) {
        return a * s;
    }

    Matrix Hadamard(const Matrix& a, const Matrix& b) {
        CheckShape("Linalg::Hadamard()", a, b);
        return a.cwiseProduct(b);
    }

    Vector Multiply(const Matrix& m, const Vector& v) {
        CheckSize("Linalg::Multiply()", m.cols(), v.size());
        return m * v;
    }

    Matrix Multiply(const Matrix& a, const Matrix& b) {
        CheckSize("Linalg::Multiply()", a.cols(), b.rows());
        return a * b;
    }

    Matrix Outer(const Vector& a, const Vector& b) {
        return a * b.transpose();
    }

    Matrix Transpose(const Matrix& m) {
        return m.transpose();
    }

    bool AllFinite(const Vector& v) {
        return v.allFinite();
    }

    bool AllFinite(const Matrix& m) {
        return m.allFinite();
    }
}
