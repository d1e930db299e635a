/**
 * @file LinearAlgebra.hpp
 * @brief Dimension-checked dense matrix kernel for the navigation filter
 *
 * Wraps Eigen dynamic matrices behind an interface that validates operand
 * shapes on every operation and restricts inversion to the closed-form 2x2
 * and 3x3 cases used by the Kalman filter innovation covariance.
 *
 * @author peanut-nav
 * @date Created: 2025-09-10
 * @last Modified: 2025-09-18
 * @version 0.5.0
 */

#pragma once
#include <Eigen/Dense>
#include <stdexcept>
#include <string>

/**
 * @brief Raised when operand shapes are incompatible
 */
class DimensionMismatchError : public std::invalid_argument {
public:
    explicit DimensionMismatchError(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * @brief Raised when a matrix determinant is below the singularity threshold
 */
class SingularMatrixError : public std::runtime_error {
public:
    explicit SingularMatrixError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief Raised when inversion is requested for a size other than 2x2 or 3x3
 */
class UnsupportedSizeError : public std::invalid_argument {
public:
    explicit UnsupportedSizeError(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * @brief Rectangular matrix with fixed shape and checked arithmetic
 *
 * Shape is fixed at construction. Element access is mutable in place.
 */
class DenseMatrix {
public:
    /// Determinant magnitude below which a matrix is treated as singular
    static constexpr double SINGULAR_EPSILON = 1e-10;

    /**
     * @brief Construct a rows x cols matrix filled with a value
     *
     * @param rows Number of rows
     * @param cols Number of columns
     * @param initial_value Fill value (default 0.0)
     */
    DenseMatrix(int rows, int cols, double initial_value = 0.0);

    /**
     * @brief Wrap an existing Eigen matrix
     */
    explicit DenseMatrix(const Eigen::MatrixXd& data);

    int rows() const { return static_cast<int>(data_.rows()); }
    int cols() const { return static_cast<int>(data_.cols()); }

    /**
     * @brief Element access
     * @throws std::out_of_range if (row, col) lies outside the matrix
     */
    double get(int row, int col) const;
    void set(int row, int col, double value);

    /**
     * @brief Sum of diagonal entries
     * @throws DimensionMismatchError if the matrix is not square
     */
    double trace() const;

    /**
     * @brief Invert this matrix using the closed-form 2x2 or 3x3 formula
     *
     * @return Inverse matrix
     * @throws SingularMatrixError if |det| < SINGULAR_EPSILON
     * @throws UnsupportedSizeError for any other shape
     */
    DenseMatrix invert() const;

    /// Underlying Eigen storage (read-only view)
    const Eigen::MatrixXd& toEigen() const { return data_; }

    bool operator==(const DenseMatrix& other) const;
    bool operator!=(const DenseMatrix& other) const { return !(*this == other); }

    /**
     * @brief Element-wise comparison within an absolute tolerance
     */
    bool isApprox(const DenseMatrix& other, double tolerance) const;

    // ================== Static Operations ==================

    static DenseMatrix identity(int size);

    /**
     * @brief Copy an Eigen matrix into a new DenseMatrix
     * @throws DimensionMismatchError if the source is empty
     */
    static DenseMatrix fromEigen(const Eigen::MatrixXd& source);

    /**
     * @brief Matrix product A * B
     * @throws DimensionMismatchError if A.cols != B.rows
     */
    static DenseMatrix multiply(const DenseMatrix& A, const DenseMatrix& B);

    /**
     * @brief Element-wise sum A + B
     * @throws DimensionMismatchError if shapes differ
     */
    static DenseMatrix add(const DenseMatrix& A, const DenseMatrix& B);

    /**
     * @brief Element-wise difference A - B
     * @throws DimensionMismatchError if shapes differ
     */
    static DenseMatrix subtract(const DenseMatrix& A, const DenseMatrix& B);

    static DenseMatrix transpose(const DenseMatrix& A);

    static DenseMatrix invert2x2(const DenseMatrix& A);
    static DenseMatrix invert3x3(const DenseMatrix& A);

private:
    void checkIndex(int row, int col) const;
    static std::string shapeString(const DenseMatrix& m);

    Eigen::MatrixXd data_;
};
