#pragma once

// Compound types returned by the matrix functions and api

#include <tuple>
#include <vector>

// (row indices, column indices, values)
using sparse_coo =
    std::tuple<std::vector<long>, std::vector<long>, std::vector<double>>;
