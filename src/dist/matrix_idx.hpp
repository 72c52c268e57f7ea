/*
 *
 * matrix_idx.hpp
 * long/square index conversion
 *
 */
#pragma once

#include <cassert> // assert
#include <cmath>   // floor/sqrt
#include <cstddef> // size_t

template <class T> inline size_t rows_to_samples(const T &longMat) {
  return 0.5 * (1 + sqrt(1 + 8 * (longMat.rows())));
}

// Row of condensed index k in an n x n upper triangle
inline long calc_row_idx(const long long k, const long n) {
  return n - 2 -
         std::floor(
             std::sqrt(static_cast<double>(-8 * k + 4 * n * (n - 1) - 7)) / 2 -
             0.5);
}

inline long calc_col_idx(const long long k, const long i, const long n) {
  return k + i + 1 - n * (n - 1) / 2 + (n - i) * ((n - i) - 1) / 2;
}

inline long long square_to_condensed(long i, long j, long n) {
  assert(j > i);
  return (n * i - ((i * (i + 1)) >> 1) + j - 1 - i);
}
