#ifndef DENSELA_SOLVER_CONFIG_HPP
#define DENSELA_SOLVER_CONFIG_HPP

#include "library_config.hpp"
#include "types.hpp"

namespace densela {

enum class QRMethod {
  Householder,  // Orthogonal reflections, full m x m Q
  GramSchmidt   // Modified Gram-Schmidt, thin m x n Q
};

// Per-call numerical settings for the iterative solvers
template <Tolerant T>
struct SolverConfig {
  // Convergence / singularity threshold on magnitudes
  real_t<T> tolerance = ScalarTraits<T>::tolerance();
  size_t max_iterations = DEFAULT_MAX_ITERATIONS;
  QRMethod qr_method = QRMethod::Householder;
};

}  // namespace densela
#endif  // DENSELA_SOLVER_CONFIG_HPP
