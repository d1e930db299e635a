/**
 * @file test_linear_algebra.cpp
 * @brief Unit tests for the DenseMatrix kernel
 *
 * @author peanut-nav
 * @date Created: 2025-09-10
 * @last Modified: 2025-09-18
 * @version 0.5.0
 */

#include <gtest/gtest.h>
#include "LinearAlgebra.hpp"
#include <initializer_list>
#include <stdexcept>

class DenseMatrixTest : public ::testing::Test {
protected:
    void SetUp() override {
        A = DenseMatrix(MatrixFromRows({{4.0, 7.0}, {2.0, 6.0}}));

        Eigen::Matrix3d b;
        b << 2.0, 0.0, 1.0,
             1.0, 3.0, 2.0,
             1.0, 1.0, 2.0;
        B = DenseMatrix(Eigen::MatrixXd(b));
    }

    static Eigen::MatrixXd MatrixFromRows(std::initializer_list<std::initializer_list<double>> rows) {
        Eigen::MatrixXd m(rows.size(), rows.begin()->size());
        int i = 0;
        for (const auto& row : rows) {
            int j = 0;
            for (double v : row) {
                m(i, j++) = v;
            }
            i++;
        }
        return m;
    }

    DenseMatrix A{2, 2};
    DenseMatrix B{3, 3};
};

TEST_F(DenseMatrixTest, ConstructorFillsValue) {
    DenseMatrix m(2, 3, 1.5);
    EXPECT_EQ(m.rows(), 2);
    EXPECT_EQ(m.cols(), 3);
    for (int i = 0; i < 2; i++) {
        for (int j = 0; j < 3; j++) {
            EXPECT_DOUBLE_EQ(m.get(i, j), 1.5);
        }
    }
}

TEST_F(DenseMatrixTest, ConstructorRejectsNonPositiveSize) {
    EXPECT_THROW(DenseMatrix(0, 2), DimensionMismatchError);
    EXPECT_THROW(DenseMatrix(2, -1), DimensionMismatchError);
}

TEST_F(DenseMatrixTest, OutOfRangeIndexThrows) {
    DenseMatrix m(2, 2);
    EXPECT_THROW(m.set(3, 3, 1.0), std::out_of_range);
    EXPECT_THROW(m.set(-1, 0, 1.0), std::out_of_range);
    EXPECT_THROW(m.get(0, 2), std::out_of_range);
    EXPECT_THROW(m.get(2, 0), std::out_of_range);

    // Failed writes leave the matrix unchanged
    EXPECT_TRUE(m == DenseMatrix(2, 2));
    m.set(1, 1, 4.0);
    EXPECT_DOUBLE_EQ(m.get(1, 1), 4.0);
}

TEST_F(DenseMatrixTest, MultiplyByIdentity) {
    EXPECT_EQ(DenseMatrix::multiply(A, DenseMatrix::identity(2)), A);
    EXPECT_EQ(DenseMatrix::multiply(DenseMatrix::identity(3), B), B);
}

TEST_F(DenseMatrixTest, MultiplyShapeAndValues) {
    DenseMatrix col(2, 1);
    col.set(0, 0, 1.0);
    col.set(1, 0, -1.0);

    DenseMatrix r = DenseMatrix::multiply(A, col);
    ASSERT_EQ(r.rows(), 2);
    ASSERT_EQ(r.cols(), 1);
    EXPECT_DOUBLE_EQ(r.get(0, 0), -3.0);
    EXPECT_DOUBLE_EQ(r.get(1, 0), -4.0);
}

TEST_F(DenseMatrixTest, DimensionMismatchThrows) {
    EXPECT_THROW(DenseMatrix::multiply(A, B), DimensionMismatchError);
    EXPECT_THROW(DenseMatrix::add(A, B), DimensionMismatchError);
    EXPECT_THROW(DenseMatrix::subtract(A, B), DimensionMismatchError);
    EXPECT_THROW(DenseMatrix(2, 3).trace(), DimensionMismatchError);
}

TEST_F(DenseMatrixTest, AddSubtractTranspose) {
    DenseMatrix sum = DenseMatrix::add(A, A);
    EXPECT_DOUBLE_EQ(sum.get(0, 1), 14.0);

    DenseMatrix zero = DenseMatrix::subtract(A, A);
    EXPECT_EQ(zero, DenseMatrix(2, 2));

    DenseMatrix t = DenseMatrix::transpose(A);
    EXPECT_DOUBLE_EQ(t.get(0, 1), 2.0);
    EXPECT_DOUBLE_EQ(t.get(1, 0), 7.0);
}

TEST_F(DenseMatrixTest, Trace) {
    EXPECT_DOUBLE_EQ(A.trace(), 10.0);
    EXPECT_DOUBLE_EQ(B.trace(), 7.0);
}

TEST_F(DenseMatrixTest, Invert2x2) {
    DenseMatrix inv = A.invert();
    EXPECT_TRUE(DenseMatrix::multiply(A, inv).isApprox(DenseMatrix::identity(2), 1e-12));
    EXPECT_TRUE(inv.invert().isApprox(A, 1e-12));
}

TEST_F(DenseMatrixTest, Invert3x3) {
    DenseMatrix inv = B.invert();
    EXPECT_TRUE(DenseMatrix::multiply(inv, B).isApprox(DenseMatrix::identity(3), 1e-12));
    EXPECT_TRUE(inv.invert().isApprox(B, 1e-12));
}

TEST_F(DenseMatrixTest, SingularMatrixThrows) {
    DenseMatrix s2(MatrixFromRows({{1.0, 2.0}, {2.0, 4.0}}));
    EXPECT_THROW(s2.invert(), SingularMatrixError);

    DenseMatrix s3(3, 3, 1.0);
    EXPECT_THROW(s3.invert(), SingularMatrixError);
}

TEST_F(DenseMatrixTest, UnsupportedInverseSize) {
    EXPECT_THROW(DenseMatrix::identity(4).invert(), UnsupportedSizeError);
    EXPECT_THROW(DenseMatrix(2, 3).invert(), UnsupportedSizeError);
}

TEST_F(DenseMatrixTest, EigenAdapters) {
    DenseMatrix copy = DenseMatrix::fromEigen(B.toEigen());
    EXPECT_EQ(copy, B);
    copy.set(0, 0, -1.0);
    EXPECT_NE(copy, B);
    EXPECT_THROW(DenseMatrix::fromEigen(Eigen::MatrixXd()), DimensionMismatchError);
}

TEST_F(DenseMatrixTest, SingularErrorIsRuntimeError) {
    DenseMatrix s(2, 2);
    try {
        s.invert();
        FAIL() << "Expected SingularMatrixError";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "Matrix is singular (determinant is zero)");
    }
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
