#pragma once
#include <Eigen/Dense>
#include <initializer_list>
#include <vector>

// Shape-checked wrappers over Eigen. Every operation returns a new value and
// throws error::DimensionMismatch instead of relying on Eigen's debug asserts.
namespace linalg {
    using Vector = Eigen::VectorXd;
    using Matrix = Eigen::MatrixXd;

    Vector MakeVector(const std::vector<double>& values);
    Vector MakeVector(std::initializer_list<double> values);

    // values are read row by row
    Matrix MakeMatrix(int rows, int cols, const std::vector<double>& values);
    Matrix MakeMatrix(const std::vector<std::vector<double>>& rows);

    Vector Add(const Vector& a, const Vector& b);
    Vector Subtract(const Vector& a, const Vector& b);
    Vector Scale(const Vector& a, double s);
    Vector Hadamard(const Vector& a, const Vector& b);

    double Dot(const Vector& a, const Vector& b);
    double SquaredDistance(const Vector& a, const Vector& b);

    Matrix Add(const Matrix& a, const Matrix& b);
    Matrix Subtract(const Matrix& a, const Matrix& b);
    Matrix Scale(const Matrix& a, double s);
    Matrix Hadamard(const Matrix& a, const Matrix& b);

    Vector Multiply(const Matrix& m, const Vector& v);
    Matrix Multiply(const Matrix& a, const Matrix& b);
    Matrix Outer(const Vector& a, const Vector& b);
    Matrix Transpose(const Matrix& m);

    bool AllFinite(const Vector& v);
    bool AllFinite(const Matrix& m);
}
