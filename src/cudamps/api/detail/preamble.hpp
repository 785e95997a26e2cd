/**
* @file
 *
 * @brief preprocessor-focused definitions and compiler compatibility code,
 * to (preferably) be included before anything else in the library
 */
#ifndef CUDAMPS_PREAMBLE_HPP_
#define CUDAMPS_PREAMBLE_HPP_

#if (__cplusplus < 201103L)
#error "The CUDA MPS wrappers can only be compiled with C++11 or a later version of the C++ language standard"
#endif

#if !defined(__linux__)
#error "The CUDA MPS wrappers inspect /proc, and are only supported on Linux"
#endif

#ifndef CUDAMPS_MAYBE_UNUSED
#if __cplusplus >= 201703L
#define CUDAMPS_MAYBE_UNUSED [[maybe_unused]]
#else
#if __GNUC__
#define CUDAMPS_MAYBE_UNUSED __attribute__((unused))
#else
#define CUDAMPS_MAYBE_UNUSED
#endif // __GNUC__
#endif // __cplusplus >= 201703L
#endif // ifndef CUDAMPS_MAYBE_UNUSED

#endif //CUDAMPS_PREAMBLE_HPP_
