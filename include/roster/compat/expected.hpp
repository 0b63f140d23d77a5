/**
 * @file expected.hpp
 * @brief Selects the expected<T, E> implementation used for error returns.
 *
 * Registry lifecycle and dispatch, the config loader and the queue factories
 * all report failures as roster_detail::expected<T, Err>.
 *
 * - libstdc++/libc++ with <expected> (202202L or later): std::expected.
 *   No monadic operations are used, so the pre-monadic revision shipped by
 *   GCC 12 is enough.
 * - Otherwise: tl::expected (https://github.com/TartanLlama/expected).
 */
#pragma once

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202202L
  #include <expected>
  namespace roster_detail {
      template<class T, class E> using expected   = std::expected<T,E>;
      template<class E>          using unexpected = std::unexpected<E>;
  }
#else
#include <tl/expected.hpp>
namespace roster_detail {
      template<class T, class E> using expected   = tl::expected<T,E>;
      template<class E>          using unexpected = tl::unexpected<E>;
  }
#endif
