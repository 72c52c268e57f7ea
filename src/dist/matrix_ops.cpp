/*
 *
 * matrix_ops.cpp
 * Comparison matrix transformations
 *
 */
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <omp.h>
#include <stdexcept>
#include <vector>

#include "matrix.hpp"

template <typename T>
std::vector<T> combine_vectors(const std::vector<std::vector<T>> &vec,
                               const size_t len) {
  std::vector<T> all(len);
  auto all_it = all.begin();
  for (size_t i = 0; i < vec.size(); ++i) {
    std::copy(vec[i].cbegin(), vec[i].cend(), all_it);
    all_it += vec[i].size();
  }
  return all;
}

sparse_coo sparsify_by_threshold(const NumpyMatrix &squareValues,
                                 const double cutoff,
                                 const unsigned int num_threads) {
  if (squareValues.rows() != squareValues.cols()) {
    throw std::runtime_error("sparsify_by_threshold input must be square");
  }
  if (cutoff < 0) {
    throw std::runtime_error("Cutoff must be >= 0");
  }

  const long n = squareValues.rows();
  size_t len = 0;

  // ijv vectors, one per row so threads never share a vector
  std::vector<std::vector<double>> values(n);
  std::vector<std::vector<long>> i_vec(n);
  std::vector<std::vector<long>> j_vec(n);
#pragma omp parallel for schedule(static) num_threads(num_threads) reduction(+:len)
  for (long i = 0; i < n; i++) {
    for (long j = i + 1; j < n; j++) {
      if (squareValues(i, j) >= cutoff) {
        values[i].push_back(squareValues(i, j));
        i_vec[i].push_back(i);
        j_vec[i].push_back(j);
      }
    }
    len += i_vec[i].size();
  }
  std::vector<double> values_all = combine_vectors(values, len);
  std::vector<long> i_vec_all = combine_vectors(i_vec, len);
  std::vector<long> j_vec_all = combine_vectors(j_vec, len);
  return (std::make_tuple(i_vec_all, j_vec_all, values_all));
}

NumpyMatrix long_to_square(const Eigen::VectorXd &longValues,
                           const double diagonal,
                           const unsigned int num_threads) {
  const size_t n_samples = rows_to_samples(longValues);
  if (longValues.size() !=
      static_cast<long>((n_samples * (n_samples - 1)) >> 1)) {
    throw std::runtime_error(
        "Long form vector length is not a triangular number");
  }

  NumpyMatrix squareValues(n_samples, n_samples);
  for (size_t diag_idx = 0; diag_idx < n_samples; diag_idx++) {
    squareValues(diag_idx, diag_idx) = diagonal;
  }

#pragma omp parallel for schedule(static) num_threads(num_threads)
  for (long idx = 0; idx < longValues.rows(); idx++) {
    unsigned long i = calc_row_idx(idx, n_samples);
    unsigned long j = calc_col_idx(idx, i, n_samples);
    squareValues(i, j) = longValues[idx];
    squareValues(j, i) = longValues[idx];
  }

  return squareValues;
}

Eigen::VectorXd square_to_long(const NumpyMatrix &squareValues,
                               const unsigned int num_threads) {
  if (squareValues.rows() != squareValues.cols()) {
    throw std::runtime_error("square_to_long input must be a square matrix");
  }

  long n = squareValues.rows();
  Eigen::VectorXd longValues((n * (n - 1)) >> 1);

// Each inner loop increases in size linearly with outer index
// due to reverse direction
// guided schedules inversely proportional to outer index
#pragma omp parallel for schedule(guided, 1) num_threads(num_threads)
  for (long i = n - 2; i >= 0; i--) {
    for (long j = i + 1; j < n; j++) {
      longValues(square_to_condensed(i, j, n)) = squareValues(i, j);
    }
  }

  return (longValues);
}
