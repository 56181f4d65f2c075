/**
 * @file expected.hpp
 * @brief Picks the expected/unexpected implementation behind drguard's Result type.
 *
 * drguard code names only `drguard_detail::expected` and
 * `drguard_detail::unexpected`. With a C++23 standard library these are
 * std::expected; older libraries get TartanLlama's tl::expected, which has
 * the same interface for everything drguard uses (value/error access,
 * operator bool, construction from unexpected).
 */
#pragma once

#include <version>

#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202202L
#  include <expected>
namespace drguard_detail {
template <class T, class E> using expected   = std::expected<T, E>;
template <class E>          using unexpected = std::unexpected<E>;
} // namespace drguard_detail
#else
#  include <tl/expected.hpp>
namespace drguard_detail {
template <class T, class E> using expected   = tl::expected<T, E>;
template <class E>          using unexpected = tl::unexpected<E>;
} // namespace drguard_detail
#endif
