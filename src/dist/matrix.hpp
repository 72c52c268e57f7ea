/*
 *
 * matrix.hpp
 * functions in matrix_ops.cpp
 *
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include <Eigen/Dense>

#include "matrix_idx.hpp"
#include "matrix_types.hpp"

// Row-major so rows can be handed to numpy without a copy
using NumpyMatrix =
    Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

NumpyMatrix long_to_square(const Eigen::VectorXd &longValues,
                           const double diagonal,
                           const unsigned int num_threads = 1);

Eigen::VectorXd square_to_long(const NumpyMatrix &squareValues,
                               const unsigned int num_threads = 1);

// Upper triangle entries at or above cutoff
sparse_coo sparsify_by_threshold(const NumpyMatrix &squareValues,
                                 const double cutoff,
                                 const unsigned int num_threads = 1);
