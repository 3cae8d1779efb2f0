/**
 * @file expected.hpp
 * @brief Single spelling of expected/unexpected for setup-time factories.
 *
 * Loader and TaskQueue factories report failures as values instead of
 * throwing. Callers name `didagent_detail::expected` and never the backing
 * implementation:
 *
 * - Standard library with P2505 monadic expected: `<expected>`.
 * - Anything older: `<tl/expected.hpp>` (TartanLlama's header-only backport).
 */
#pragma once

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L
  #include <expected>
  namespace didagent_detail {
      template<class T, class E> using expected   = std::expected<T,E>;
      template<class E>          using unexpected = std::unexpected<E>;
  }
#else
  #include <tl/expected.hpp>
  namespace didagent_detail {
      template<class T, class E> using expected   = tl::expected<T,E>;
      template<class E>          using unexpected = tl::unexpected<E>;
  }
#endif
