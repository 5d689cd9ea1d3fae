#pragma once

#include <format>          // std::format
#include <matchit.hpp>     // matchit::{match, is, _}
#include <source_location> // std::source_location

#include "Types.hpp"

namespace domeplug::utils::error {
  /**
   * @enum DplugErrorCode
   * @brief Error categories produced by the plugin bridge.
   */
  enum class DplugErrorCode : types::u8 {
    ConfigurationError,     ///< Plugin configuration file or environment override is invalid.
    HookFailure,            ///< A lifecycle hook reported failure or threw.
    InternalError,          ///< Bridge invariant broken (should not happen).
    InvalidArgument,        ///< Malformed argument (bad signature, duplicate name, embedded NUL, ...).
    InvalidCapabilityTable, ///< The host capability table is null or of an unsupported version.
    InvalidState,           ///< Operation not allowed in the current lifecycle state.
    IoError,                ///< Filesystem error while reading configuration.
    NotFound,               ///< A requested resource was not found.
    ParseError,             ///< Failed to parse configuration.
    RegistrationFailed,     ///< The host refused a module, class or method definition.
    SlotOutOfBounds,        ///< Slot index negative or beyond the current slot count.
    TypeMismatch,           ///< Slot or foreign object holds a different type than requested.
  };

  /**
   * @brief Human-readable name of an error category.
   */
  inline auto Describe(const DplugErrorCode code) -> types::StringView {
    using namespace matchit;
    using enum DplugErrorCode;

    return match(code)(
      is | ConfigurationError     = "Configuration error",
      is | HookFailure            = "Hook failure",
      is | InternalError          = "Internal error",
      is | InvalidArgument        = "Invalid argument",
      is | InvalidCapabilityTable = "Invalid capability table",
      is | InvalidState           = "Invalid state",
      is | IoError                = "I/O error",
      is | NotFound               = "Not found",
      is | ParseError             = "Parse error",
      is | RegistrationFailed     = "Registration failed",
      is | SlotOutOfBounds        = "Slot out of bounds",
      is | TypeMismatch           = "Type mismatch",
      is | _                      = "Unknown error"
    );
  }

  /**
   * @struct DplugError
   * @brief Holds structured information about a bridge error.
   *
   * Used as the error type in Result throughout the library. Nothing of this
   * type ever reaches the host; entry points translate it to a DPlugResult.
   */
  struct DplugError {
    types::String        message;  ///< A descriptive error message.
    std::source_location location; ///< The source location where the error occurred (file, line, function).
    DplugErrorCode       code;     ///< The general category of the error.

    DplugError(const DplugErrorCode errc, types::String msg, const std::source_location& loc = std::source_location::current())
      : message(std::move(msg)), location(loc), code(errc) {}

    [[nodiscard]] auto toString() const -> types::String {
      return std::format("{}: {}", Describe(code), message);
    }
  };
} // namespace domeplug::utils::error

#define ERR(errc, msg)          return ::domeplug::utils::types::Err(::domeplug::utils::error::DplugError(errc, msg))
#define ERR_FMT(errc, fmt, ...) return ::domeplug::utils::types::Err(::domeplug::utils::error::DplugError(errc, std::format(fmt, __VA_ARGS__)))

/**
 * @brief Macro for Rust-style error propagation.
 *
 * Evaluates the given expression (which must return a Result<T, E>).
 * If the result contains an error, it immediately returns from the enclosing
 * function with that error wrapped in Err(). Otherwise, it yields the
 * success value.
 *
 * @note Uses GNU statement expressions on GCC/Clang.
 *
 * @example
 * @code
 * auto readPair(VM& vm) -> Result<f64> {
 *   f64 lhs = TRY(vm.getSlotDouble(1));
 *   f64 rhs = TRY(vm.getSlotDouble(2));
 *   return lhs + rhs;
 * }
 * @endcode
 */
#ifdef _MSC_VER
  #define DPLUG_CONCAT_IMPL(a, b) a##b
  #define DPLUG_CONCAT(a, b)      DPLUG_CONCAT_IMPL(a, b)

  #define TRY(expr)            \
    [&]() {                    \
      auto _tmp = (expr);      \
      if (!_tmp)               \
        throw _tmp.error();    \
      return *std::move(_tmp); \
    }()
#else
  #define TRY(expr)                                                                             \
    _Pragma("clang diagnostic push")                                                            \
      _Pragma("clang diagnostic ignored \"-Wgnu-statement-expression-from-macro-expansion\"")({ \
        auto&& _dplug_try_result = (expr);                                                      \
        if (!_dplug_try_result)                                                                 \
          return ::domeplug::utils::types::Err(_dplug_try_result.error());                      \
        std::move(*_dplug_try_result);                                                          \
      })                                                                                        \
        _Pragma("clang diagnostic pop")
#endif

/**
 * @brief Macro for Rust-style error propagation with Result<void> types.
 *
 * Evaluates the given expression (which must return a Result<void, E>).
 * If the result contains an error, it immediately returns from the enclosing
 * function with that error wrapped in Err(). Otherwise, execution continues.
 */
#define TRY_VOID(expr)                                                 \
  do {                                                                 \
    auto&& _dplug_try_result = (expr);                                 \
    if (!_dplug_try_result)                                            \
      return ::domeplug::utils::types::Err(_dplug_try_result.error()); \
  } while (0)
