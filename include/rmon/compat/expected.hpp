/**
 * @file expected.hpp
 * @brief Compatibility shim for std::expected (C++23) and tl::expected.
 *
 * The rest of the codebase spells expected/unexpected through rmon_detail so it
 * does not depend on a specific implementation.
 *
 * - When the standard library ships <expected>: uses std::expected.
 * - Otherwise: falls back to <tl/expected.hpp>, the header-only backport by
 *   TartanLlama (https://github.com/TartanLlama/expected).
 *
 * Only the non-monadic interface (has_value, value, error, operator*) is used,
 * so the first libstdc++ release of <expected> (202202L) is sufficient.
 */
#pragma once

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202202L
  #include <expected>
  namespace rmon_detail {
      template<class T, class E> using expected   = std::expected<T,E>;
      template<class E>          using unexpected = std::unexpected<E>;
  }
#else
  #include <tl/expected.hpp>
  namespace rmon_detail {
      template<class T, class E> using expected   = tl::expected<T,E>;
      template<class E>          using unexpected = tl::unexpected<E>;
  }
#endif
