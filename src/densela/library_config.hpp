#ifndef DENSELA_LIBRARY_CONFIG_HPP
#define DENSELA_LIBRARY_CONFIG_HPP

#include <cstddef>

#ifdef DENSELA_DISABLE_OPENMP
static constexpr bool DENSELA_OPENMP_ENABLED = false;
#else
static constexpr bool DENSELA_OPENMP_ENABLED = true;
#endif
static constexpr size_t ThreadCount = 2;
// Work size from which the arithmetic kernels use ThreadCount threads.
static constexpr size_t PARALLEL_THRESHOLD = 64 * 64;
static constexpr size_t DEFAULT_MAX_ITERATIONS = 1000;

#endif  // DENSELA_LIBRARY_CONFIG_HPP
