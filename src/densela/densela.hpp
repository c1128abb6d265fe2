#ifndef DENSELA_DENSELA_HPP
#define DENSELA_DENSELA_HPP

#include "library_config.hpp"
#include "types.hpp"
#include "matrix_error.hpp"
#include "StoragePolicy.hpp"
#include "vector.hpp"
#include "views.hpp"
#include "matrix.hpp"
#include "transpose.hpp"
#include "solver_config.hpp"
#include "row_reduction.hpp"
#include "decomposition.hpp"
#include "eigen.hpp"

#endif  // DENSELA_DENSELA_HPP
