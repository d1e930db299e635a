/**
 * @file LinearAlgebra.cpp
 * @brief Implementation of the dimension-checked dense matrix kernel
 *
 * @author peanut-nav
 * @date Created: 2025-09-10
 * @last Modified: 2025-09-18
 * @version 0.5.0
 */

#include "LinearAlgebra.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

using namespace Eigen;

DenseMatrix::DenseMatrix(int rows, int cols, double initial_value) {
    if (rows <= 0 || cols <= 0) {
        throw DimensionMismatchError("Matrix dimensions must be positive");
    }
    data_ = MatrixXd::Constant(rows, cols, initial_value);
}

DenseMatrix::DenseMatrix(const MatrixXd& data) : data_(data) {}

double DenseMatrix::get(int row, int col) const {
    checkIndex(row, col);
    return data_(row, col);
}

void DenseMatrix::set(int row, int col, double value) {
    checkIndex(row, col);
    data_(row, col) = value;
}

void DenseMatrix::checkIndex(int row, int col) const {
    if (row < 0 || row >= rows() || col < 0 || col >= cols()) {
        std::ostringstream oss;
        oss << "Index (" << row << ", " << col << ") out of range for "
            << shapeString(*this) << " matrix";
        throw std::out_of_range(oss.str());
    }
}

double DenseMatrix::trace() const {
    if (data_.rows() != data_.cols()) {
        throw DimensionMismatchError("Trace requires a square matrix, got " + shapeString(*this));
    }
    return data_.trace();
}

DenseMatrix DenseMatrix::invert() const {
    if (rows() == 2 && cols() == 2) {
        return invert2x2(*this);
    }
    if (rows() == 3 && cols() == 3) {
        return invert3x3(*this);
    }
    throw UnsupportedSizeError("Cannot invert " + shapeString(*this) + " matrix");
}

bool DenseMatrix::operator==(const DenseMatrix& other) const {
    return rows() == other.rows() && cols() == other.cols() && data_ == other.data_;
}

bool DenseMatrix::isApprox(const DenseMatrix& other, double tolerance) const {
    if (rows() != other.rows() || cols() != other.cols()) {
        return false;
    }
    return ((data_ - other.data_).cwiseAbs().array() <= tolerance).all();
}

// ================== Static Operations ==================

DenseMatrix DenseMatrix::identity(int size) {
    return DenseMatrix(MatrixXd::Identity(size, size));
}

DenseMatrix DenseMatrix::fromEigen(const MatrixXd& source) {
    if (source.rows() == 0 || source.cols() == 0) {
        throw DimensionMismatchError("Cannot build a matrix from an empty source");
    }
    return DenseMatrix(source);
}

DenseMatrix DenseMatrix::multiply(const DenseMatrix& A, const DenseMatrix& B) {
    if (A.cols() != B.rows()) {
        throw DimensionMismatchError("Cannot multiply " + shapeString(A) + " by " + shapeString(B));
    }
    return DenseMatrix(MatrixXd(A.data_ * B.data_));
}

DenseMatrix DenseMatrix::add(const DenseMatrix& A, const DenseMatrix& B) {
    if (A.rows() != B.rows() || A.cols() != B.cols()) {
        throw DimensionMismatchError("Cannot add " + shapeString(A) + " and " + shapeString(B));
    }
    return DenseMatrix(MatrixXd(A.data_ + B.data_));
}

DenseMatrix DenseMatrix::subtract(const DenseMatrix& A, const DenseMatrix& B) {
    if (A.rows() != B.rows() || A.cols() != B.cols()) {
        throw DimensionMismatchError("Cannot subtract " + shapeString(B) + " from " + shapeString(A));
    }
    return DenseMatrix(MatrixXd(A.data_ - B.data_));
}

DenseMatrix DenseMatrix::transpose(const DenseMatrix& A) {
    return DenseMatrix(MatrixXd(A.data_.transpose()));
}

/**
 * @brief Closed-form inverse of a 2x2 matrix
 */
DenseMatrix DenseMatrix::invert2x2(const DenseMatrix& A) {
    if (A.rows() != 2 || A.cols() != 2) {
        throw DimensionMismatchError("invert2x2 requires a 2x2 matrix, got " + shapeString(A));
    }

    const Matrix2d m = A.data_;
    const double det = m.determinant();
    if (std::abs(det) < SINGULAR_EPSILON) {
        throw SingularMatrixError("Matrix is singular (determinant is zero)");
    }

    // Fixed-size 2x2 inverse is the adjugate formula
    return DenseMatrix(MatrixXd(m.inverse()));
}

/**
 * @brief Closed-form inverse of a 3x3 matrix (cofactor expansion)
 */
DenseMatrix DenseMatrix::invert3x3(const DenseMatrix& A) {
    if (A.rows() != 3 || A.cols() != 3) {
        throw DimensionMismatchError("invert3x3 requires a 3x3 matrix, got " + shapeString(A));
    }

    const Matrix3d m = A.data_;
    const double det = m.determinant();
    if (std::abs(det) < SINGULAR_EPSILON) {
        throw SingularMatrixError("Matrix is singular (determinant is zero)");
    }

    return DenseMatrix(MatrixXd(m.inverse()));
}

std::string DenseMatrix::shapeString(const DenseMatrix& m) {
    std::ostringstream oss;
    oss << m.rows() << "x" << m.cols();
    return oss.str();
}
