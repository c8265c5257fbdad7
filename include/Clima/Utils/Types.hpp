/**
 * @file Types.hpp
 * @brief Defines the type aliases used throughout Clima++.
 *
 * The aliases are thin names over standard library types so that signatures
 * across the library, the CLI and the tests read the same way.
 */

#pragma once

#include <array>       // std::array (Array)
#include <exception>   // std::exception (Exception)
#include <cstdint>     // std::{int*_t, uint*_t}
#include <functional>  // std::less
#include <map>         // std::map (Map)
#include <memory>      // std::unique_ptr (UniquePointer)
#include <mutex>       // std::mutex and std::lock_guard (Mutex, LockGuard)
#include <optional>    // std::optional (Option)
#include <span>        // std::span (Span)
#include <string>      // std::string (String)
#include <string_view> // std::string_view (StringView)
#include <tuple>       // std::tuple (Tuple)
#include <utility>     // std::pair (Pair)
#include <vector>      // std::vector (Vec)

namespace clima::utils::types {
  using u8  = std::uint8_t;  ///< 8-bit unsigned integer.
  using u16 = std::uint16_t; ///< 16-bit unsigned integer.
  using u32 = std::uint32_t; ///< 32-bit unsigned integer.
  using u64 = std::uint64_t; ///< 64-bit unsigned integer.
  using i8  = std::int8_t;   ///< 8-bit signed integer.
  using i16 = std::int16_t;  ///< 16-bit signed integer.
  using i32 = std::int32_t;  ///< 32-bit signed integer.
  using i64 = std::int64_t;  ///< 64-bit signed integer.
  using f32 = float;         ///< 32-bit floating-point number.
  using f64 = double;        ///< 64-bit floating-point number.

  using usize = std::size_t;    ///< Unsigned size type (result of sizeof).
  using isize = std::ptrdiff_t; ///< Signed size type (result of pointer subtraction).

  /**
   * @brief Alias for std::string.
   *
   * Owning, mutable string.
   */
  using String = std::string;

  /**
   * @brief Alias for std::string_view.
   *
   * Non-owning view of a string.
   */
  using StringView = std::string_view;

  using CStr       = const char*; ///< Pointer to a null-terminated C-style string.
  using PCStr      = const char*; ///< Pointer-to-const C-style string, used by the environment helpers.
  using RawPointer = void*;       ///< A type-erased pointer.

  /**
   * @brief Alias for void, used as the return type of functions that return nothing.
   */
  using Unit = void;

  /**
   * @brief Alias for std::exception.
   *
   * Standard exception type.
   */
  using Exception = std::exception;

  using Mutex     = std::mutex;             ///< Mutex type for synchronization.
  using LockGuard = std::lock_guard<Mutex>; ///< RAII-style lock guard for mutexes.

  /**
   * @brief Alias for std::nullopt_t.
   *
   * Represents an empty optional value.
   */
  inline constexpr std::nullopt_t None = std::nullopt;

  /**
   * @brief Alias for std::optional<Tp>.
   *
   * Represents a value that may or may not be present.
   * @tparam Tp The type of the potential value.
   */
  template <typename Tp>
  using Option = std::optional<Tp>;

  template <typename Tp, usize sz>
  using Array = std::array<Tp, sz>;

  template <typename Tp>
  using Vec = std::vector<Tp>;

  template <typename Tp, usize sz = std::dynamic_extent>
  using Span = std::span<Tp, sz>;

  /**
   * @brief Alias for std::map<Key, Val> with a transparent comparator.
   *
   * Lookups accept any type comparable with Key (e.g. StringView for String keys).
   */
  template <typename Key, typename Val>
  using Map = std::map<Key, Val, std::less<>>;

  template <typename T1, typename T2>
  using Pair = std::pair<T1, T2>;

  template <typename... Ts>
  using Tuple = std::tuple<Ts...>;

  /**
   * @brief Alias for std::unique_ptr<Tp, Dp>.
   *
   * Manages unique ownership of a dynamically allocated object.
   * @tparam Tp The type of the managed object.
   * @tparam Dp The deleter type (defaults to std::default_delete<Tp>).
   */
  template <typename Tp, typename Dp = std::default_delete<Tp>>
  using UniquePointer = std::unique_ptr<Tp, Dp>;
} // namespace clima::utils::types
