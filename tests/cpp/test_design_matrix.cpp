#include "linalg/design_matrix.h"
#include "linalg/sparse_core.h"
#include <cassert>
#include <cmath>
#include <iostream>
#include <random>

using namespace lassolab;

Eigen::MatrixXd sparse_looking_matrix(int rows, int cols, std::mt19937 &gen) {
  std::normal_distribution<> dist(0.0, 1.0);
  std::bernoulli_distribution keep(0.3);
  Eigen::MatrixXd m = Eigen::MatrixXd::Zero(rows, cols);
  for (int i = 0; i < rows; ++i)
    for (int j = 0; j < cols; ++j)
      if (keep(gen)) m(i, j) = dist(gen);
  return m;
}

void test_dense_sparse_agree() {
  std::cout << "Testing dense/sparse agreement..." << std::endl;
  std::mt19937 gen(7);
  Eigen::MatrixXd M = sparse_looking_matrix(12, 6, gen);
  M.col(4).setZero();

  DenseDesignMatrix dense(M);
  SparseDesignMatrix sparse = to_sparse(M);

  assert(dense.rows() == sparse.rows() && dense.cols() == sparse.cols());
  assert(!dense.is_sparse() && sparse.is_sparse());
  assert(sparse.nnz() == (M.array() != 0.0).count());

  Eigen::VectorXd v = Eigen::VectorXd::LinSpaced(12, -1.0, 2.0);
  Eigen::VectorXd x = Eigen::VectorXd::LinSpaced(6, 0.5, 3.0);

  for (int j = 0; j < 6; ++j) {
    assert((dense.column(j) - sparse.column(j)).norm() < 1e-14);
    assert(std::abs(dense.column_squared_norm(j) - sparse.column_squared_norm(j)) < 1e-12);
    assert(std::abs(dense.column_norm(j) - M.col(j).norm()) < 1e-12);
    assert(std::abs(dense.column_dot(j, v) - sparse.column_dot(j, v)) < 1e-12);

    Eigen::VectorXd r1 = v, r2 = v;
    dense.add_scaled_column(j, -0.75, r1);
    sparse.add_scaled_column(j, -0.75, r2);
    assert((r1 - r2).norm() < 1e-12);
    assert((r1 - (v - 0.75 * M.col(j))).norm() < 1e-12);
  }
  assert(dense.column_squared_norm(4) == 0.0);
  assert(sparse.column_squared_norm(4) == 0.0);

  assert((dense.multiply(x) - sparse.multiply(x)).norm() < 1e-12);
  assert((dense.transpose_multiply(v) - sparse.transpose_multiply(v)).norm() < 1e-12);

  std::cout << "[PASS] Dense and sparse backends agree." << std::endl;
}

void test_select_rows() {
  std::cout << "Testing select_rows..." << std::endl;
  Eigen::MatrixXd M(4, 3);
  M << 1, 0, 2,
       0, 3, 0,
       4, 0, 5,
       0, 0, 6;
  DenseDesignMatrix dense(M);
  SparseDesignMatrix sparse = to_sparse(M);

  std::vector<int> rows = {3, 0, 2};
  auto d_sub = dense.select_rows(rows);
  auto s_sub = sparse.select_rows(rows);
  assert(d_sub->rows() == 3 && s_sub->rows() == 3);
  assert(d_sub->cols() == 3 && s_sub->cols() == 3);
  assert(s_sub->is_sparse());

  for (int j = 0; j < 3; ++j) {
    Eigen::VectorXd expected(3);
    expected << M(3, j), M(0, j), M(2, j);
    assert((d_sub->column(j) - expected).norm() == 0.0);
    assert((s_sub->column(j) - expected).norm() == 0.0);
  }

  auto empty = sparse.select_rows({});
  assert(empty->rows() == 0 && empty->cols() == 3);

  std::cout << "[PASS] Row selection preserves order." << std::endl;
}

void test_builders() {
  std::cout << "Testing sparse builders..." << std::endl;
  // [[1, 0, 2], [0, 0, 3]]
  SparseDesignMatrix csr = SparseDesignMatrix::from_csr({1.0, 2.0, 3.0}, {0, 2, 2}, {0, 2, 3}, 2, 3);
  SparseDesignMatrix tri = SparseDesignMatrix::from_triplets({0, 0, 1}, {0, 2, 2}, {1.0, 2.0, 3.0}, 2, 3);
  for (int j = 0; j < 3; ++j) {
    assert((csr.column(j) - tri.column(j)).norm() == 0.0);
  }
  assert(csr.column_squared_norm(1) == 0.0);
  assert(std::abs(csr.column_squared_norm(2) - 13.0) < 1e-12);
  assert(std::abs(csr.density() - 0.5) < 1e-12);

  SparseDesignMatrix I = sparse_identity(5);
  assert(I.nnz() == 5);
  Eigen::VectorXd x = Eigen::VectorXd::LinSpaced(5, 1.0, 5.0);
  assert((I.multiply(x) - x).norm() == 0.0);

  std::cout << "[PASS] CSR and triplet builders agree." << std::endl;
}

void test_errors() {
  std::cout << "Testing error reporting..." << std::endl;
  DenseDesignMatrix dense(Eigen::MatrixXd::Ones(3, 2));
  SparseDesignMatrix sparse = to_sparse(Eigen::MatrixXd::Ones(3, 2));

  int caught = 0;
  try { dense.column(2); } catch (const std::out_of_range &) { ++caught; }
  try { sparse.column(-1); } catch (const std::out_of_range &) { ++caught; }
  try { sparse.select_rows({0, 3}); } catch (const std::out_of_range &) { ++caught; }
  try { dense.multiply(Eigen::VectorXd::Ones(3)); } catch (const std::invalid_argument &) { ++caught; }
  try { sparse.transpose_multiply(Eigen::VectorXd::Ones(2)); } catch (const std::invalid_argument &) { ++caught; }
  try { SparseDesignMatrix::from_csr({1.0}, {0}, {0, 1}, 2, 2); } catch (const std::invalid_argument &) { ++caught; }
  try { SparseDesignMatrix::from_triplets({0}, {5}, {1.0}, 2, 2); } catch (const std::out_of_range &) { ++caught; }
  // Row 0 claims entries 0..5 of a 3-entry array
  try { SparseDesignMatrix::from_csr({1.0, 2.0, 3.0}, {0, 1, 2}, {0, 5, 3}, 2, 3); }
  catch (const std::invalid_argument &) { ++caught; }
  assert(caught == 8);

  std::cout << "[PASS] Bad indices and shapes are rejected." << std::endl;
}

int main() {
  std::cout << "--- Design Matrix Test ---" << std::endl;
  try {
    test_dense_sparse_agree();
    test_select_rows();
    test_builders();
    test_errors();
  } catch (const std::exception &e) {
    std::cout << "Exception: " << e.what() << std::endl;
    return 1;
  }
  std::cout << "Design Matrix Test Passed!" << std::endl;
  return 0;
}
