#pragma once

#include <cstdlib> // std::getenv, setenv, unsetenv, _dupenv_s, _putenv_s

#include "Error.hpp"
#include "Types.hpp"

namespace domeplug::utils::env {
  namespace types = ::domeplug::utils::types;
  namespace error = ::domeplug::utils::error;

  using enum error::DplugErrorCode;

  /**
   * @brief Safely retrieves an environment variable.
   * @param name The name of the environment variable to retrieve.
   * @return The value, or NotFound when the variable is unset.
   */
  [[nodiscard]] inline auto GetEnv(types::PCStr name) -> types::Result<types::String> {
#ifdef _WIN32
    char*        rawPtr     = nullptr;
    types::usize bufferSize = 0;

    const types::i32 err = _dupenv_s(&rawPtr, &bufferSize, name);

    const types::UniquePointer<char, decltype(&free)> ptrManager(rawPtr, free);

    if (err != 0)
      ERR_FMT(IoError, "Failed to retrieve environment variable '{}'", name);

    if (!ptrManager)
      ERR_FMT(NotFound, "Environment variable '{}' not found", name);

    return types::String(ptrManager.get());
#else
    const char* value = std::getenv(name);

    if (!value)
      ERR_FMT(NotFound, "Environment variable '{}' not found", name);

    return types::String(value);
#endif
  }

  /**
   * @brief Sets an environment variable, overwriting any previous value.
   */
  inline auto SetEnv(types::PCStr name, types::PCStr value) -> types::Unit {
#ifdef _WIN32
    _putenv_s(name, value);
#else
    setenv(name, value, 1);
#endif
  }

  /**
   * @brief Removes an environment variable.
   */
  inline auto UnsetEnv(types::PCStr name) -> types::Unit {
#ifdef _WIN32
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
  }
} // namespace domeplug::utils::env
