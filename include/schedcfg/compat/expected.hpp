/**
 * @file expected.hpp
 * @brief Compatibility shim for std::expected (C++23) and tl::expected (earlier).
 *
 * This header provides a unified alias for expected/unexpected so the rest
 * of the codebase does not depend directly on a specific implementation.
 *
 * - When the standard library ships <expected>: uses it.
 * - Otherwise: falls back to <tl/expected.hpp>, a header-only
 *   backport by TartanLlama (https://github.com/TartanLlama/expected).
 *
 * Only has_value()/value()/error() are used by callers; the monadic
 * operations are not available on every standard library that defines
 * __cpp_lib_expected.
 */
#pragma once

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202202L
  #include <expected>
  namespace schedcfg_detail {
      template<class T, class E> using expected   = std::expected<T,E>;
      template<class E>          using unexpected = std::unexpected<E>;
  }
#else
#include <tl/expected.hpp>
namespace schedcfg_detail {
      template<class T, class E> using expected   = tl::expected<T,E>;
      template<class E>          using unexpected = tl::unexpected<E>;
  }
#endif
