/**
 * @file Types.hpp
 * @brief Defines various type aliases for commonly used types.
 *
 * This header provides the shorthand vocabulary used across DomePlug++.
 * Every alias maps onto a standard library type, except the unordered
 * containers which use ankerl::unordered_dense.
 */

#pragma once

#include <ankerl/unordered_dense.h> // ankerl::unordered_dense::{map, set} (UnorderedMap, UnorderedSet)
#include <array>                    // std::array (Array)
#include <cstdint>                  // std::{u,}int{8,16,32,64}_t
#include <expected>                 // std::expected
#include <functional>               // std::function (Fn)
#include <map>                      // std::map (Map)
#include <memory>                   // std::unique_ptr (UniquePointer)
#include <optional>                 // std::optional (Option)
#include <span>                     // std::span (Span)
#include <string>                   // std::string (String)
#include <string_view>              // std::string_view (StringView)
#include <utility>                  // std::pair (Pair)
#include <vector>                   // std::vector (Vec)

namespace domeplug::utils {
  // Forward decl for Result and Err
  namespace error {
    struct DplugError;
  } // namespace error

  namespace types {
    using u8  = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;
    using i8  = std::int8_t;
    using i16 = std::int16_t;
    using i32 = std::int32_t;
    using i64 = std::int64_t;
    using f32 = float;
    using f64 = double;

    /**
     * @brief Alias for std::size_t.
     *
     * Unsigned size type (result of sizeof).
     */
    using usize = std::size_t;

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

    /**
     * @brief Alias for const char*.
     *
     * Pointer to a null-terminated C-style string, as exchanged with the host.
     */
    using PCStr = const char*;

    /**
     * @brief Alias for void.
     *
     * Represents a unit type.
     */
    using Unit = void;

    /**
     * @brief Alias for void*.
     *
     * A type-erased pointer.
     */
    using RawPointer = void*;

    /**
     * @brief Alias for std::exception.
     *
     * Standard exception type.
     */
    using Exception = std::exception;

    /**
     * @brief Alias for std::optional<Tp>.
     *
     * Represents a value that may or may not be present.
     * @tparam Tp The type of the potential value.
     */
    template <typename Tp>
    using Option = std::optional<Tp>;

    /**
     * @brief Alias for std::nullopt_t.
     *
     * Represents an empty optional value.
     */
    inline constexpr std::nullopt_t None = std::nullopt;

    /**
     * @brief Helper function to create an Option with a value.
     * @tparam Tp The type of the value.
     * @param value The value to wrap in an Option.
     * @return An Option containing the value.
     */
    template <typename Tp>
    constexpr auto Some(Tp&& value) -> Option<std::remove_reference_t<Tp>> {
      return std::make_optional<std::remove_reference_t<Tp>>(std::forward<Tp>(value));
    }

    template <typename Tp, usize sz>
    using Array = std::array<Tp, sz>;

    template <typename Tp>
    using Vec = std::vector<Tp>;

    template <typename Tp, usize sz = std::dynamic_extent>
    using Span = std::span<Tp, sz>;

    template <typename T1, typename T2>
    using Pair = std::pair<T1, T2>;

    /**
     * @brief Alias for std::map<Key, Val>.
     *
     * Ordered map with transparent comparison.
     */
    template <typename Key, typename Val>
    using Map = std::map<Key, Val, std::less<>>;

    /**
     * @brief Alias for ankerl::unordered_dense::map<Key, Val>.
     *
     * High-performance unordered map using Robin Hood hashing.
     */
    template <typename Key, typename Val>
    using UnorderedMap = ankerl::unordered_dense::map<Key, Val>;

    /**
     * @brief Alias for ankerl::unordered_dense::set<Key>.
     */
    template <typename Key>
    using UnorderedSet = ankerl::unordered_dense::set<Key>;

    /**
     * @brief Alias for std::unique_ptr<Tp, Dp>.
     *
     * Manages unique ownership of a dynamically allocated object.
     */
    template <typename Tp, typename Dp = std::default_delete<Tp>>
    using UniquePointer = std::unique_ptr<Tp, Dp>;

    /**
     * @brief Alias for std::function<Tp>.
     *
     * Represents a callable object. An empty Fn is falsy.
     */
    template <typename Tp>
    using Fn = std::function<Tp>;

    /**
     * @typedef Result
     * @brief Alias for std::expected<Tp, Er>. Represents a value that can either be
     * a success value of type Tp or an error value of type Er.
     * @tparam Tp The type of the success value.
     * @tparam Er The type of the error value.
     */
    template <typename Tp = Unit, typename Er = error::DplugError>
    using Result = std::expected<Tp, Er>;

    /**
     * @typedef Err
     * @brief Alias for std::unexpected<Er>. Used to construct a Result in an error state.
     * @tparam Er The type of the error value.
     */
    template <typename Er = error::DplugError>
    using Err = std::unexpected<Er>;
  } // namespace types
} // namespace domeplug::utils
