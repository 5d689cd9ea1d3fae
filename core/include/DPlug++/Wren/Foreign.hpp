/**
 * @file Foreign.hpp
 * @brief Compile-time trampolines from native handlers to the host's foreign calling convention
 * @author DomePlug++ Team
 * @version 1.0.0
 *
 * @details The host calls foreign methods through plain `void(WrenVM*)`
 * pointers. InvokeForeign<Handler> instantiates one such function per handler,
 * building a VM from the loaded capabilities, calling the handler and turning
 * an error or exception into a fiber abort so nothing unwinds into the host.
 *
 * Supported handler shapes:
 * - `void(VM&)` and `Result<>(VM&)` free functions (static methods)
 * - `void (T::*)(VM&)` and `Result<> (T::*)(VM&)`, const or not, where the
 *   receiver is the foreign T in slot 0 (instance methods)
 */

#pragma once

#include <concepts>    // std::same_as
#include <format>      // std::format
#include <functional>  // std::invoke
#include <type_traits> // std::is_void_v, std::invoke_result_t

#include <dplug_abi.h>

#include "../Core/Runtime.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Logging.hpp"
#include "../Utils/Types.hpp"
#include "VM.hpp"

namespace domeplug::wren {
  namespace detail {
    template <typename>
    struct MemberHandler : std::false_type {};

    template <typename R, typename C>
    struct MemberHandler<R (C::*)(VM&)> : std::true_type {
      using Class = C;
    };

    template <typename R, typename C>
    struct MemberHandler<R (C::*)(VM&) const> : std::true_type {
      using Class = C;
    };

    template <typename>
    struct IsResult : std::false_type {};

    template <typename T, typename E>
    struct IsResult<std::expected<T, E>> : std::true_type {};

    template <typename F, typename... Args>
    auto CallAsResult(F&& func, Args&&... args) -> types::Result<> {
      if constexpr (std::is_void_v<std::invoke_result_t<F, Args...>>) {
        std::invoke(std::forward<F>(func), std::forward<Args>(args)...);
        return {};
      } else {
        static_assert(std::same_as<std::invoke_result_t<F, Args...>, types::Result<>>, "Foreign handlers must return void or Result<>");
        return std::invoke(std::forward<F>(func), std::forward<Args>(args)...);
      }
    }

    template <auto Handler>
    auto CallHandler(VM& vm) -> types::Result<> {
      using H = decltype(Handler);

      if constexpr (MemberHandler<H>::value) {
        using Class = typename MemberHandler<H>::Class;

        Class* self = TRY(vm.getSlotForeign<Class>(0));
        return CallAsResult(Handler, *self, vm);
      } else {
        static_assert(std::is_invocable_v<H, VM&>, "Foreign handlers take a VM&");
        return CallAsResult(Handler, vm);
      }
    }

    /**
     * @brief Run a native callback on behalf of the host, aborting the fiber on failure.
     */
    template <typename F>
    auto RunGuarded(WrenVM* raw, F&& body) -> void {
      const core::CapabilityTable* caps = core::plugin::PluginRuntime::getInstance().capabilities();

      if (caps == nullptr) {
        error_log("Foreign call received while no plugin is loaded");
        return;
      }

      VM vm(*caps, raw);

      try {
        if (const types::Result<> result = std::forward<F>(body)(vm); !result) {
          debug_log("Aborting fiber: {}", result.error().toString());
          vm.abortFiber(result.error().message);
        }
      } catch (const types::Exception& exc) {
        error_log("Foreign call threw: {}", exc.what());
        vm.abortFiber(std::format("Native code threw: {}", exc.what()));
      } catch (...) {
        error_log("Foreign call threw an unknown exception");
        vm.abortFiber("Native code threw an unknown exception");
      }
    }
  } // namespace detail

  /**
   * @brief Host-callable trampoline for a foreign method handler.
   */
  template <auto Handler>
  auto InvokeForeign(WrenVM* raw) -> void {
    detail::RunGuarded(raw, [](VM& vm) -> types::Result<> { return detail::CallHandler<Handler>(vm); });
  }

  /**
   * @brief Host-callable allocator for a foreign class backed by T.
   *
   * With no Factory, T is built from `T(VM&)` when that constructor exists and
   * default-constructed otherwise. A Factory is called as `Factory(VM&)` and
   * may return T or Result<T>.
   */
  template <typename T, auto Factory = nullptr>
  auto AllocateForeign(WrenVM* raw) -> void {
    detail::RunGuarded(raw, [](VM& vm) -> types::Result<> {
      if constexpr (!std::same_as<decltype(Factory), std::nullptr_t>) {
        using Produced = std::invoke_result_t<decltype(Factory), VM&>;

        if constexpr (detail::IsResult<Produced>::value) {
          T value = TRY(std::invoke(Factory, vm));
          TRY_VOID(vm.setSlotNewForeign<T>(0, 0, std::move(value)));
        } else {
          TRY_VOID(vm.setSlotNewForeign<T>(0, 0, std::invoke(Factory, vm)));
        }
      } else if constexpr (std::is_constructible_v<T, VM&>) {
        TRY_VOID(vm.setSlotNewForeign<T>(0, 0, vm));
      } else {
        static_assert(std::is_default_constructible_v<T>, "Foreign types need T(VM&), a default constructor, or a factory");
        TRY_VOID(vm.setSlotNewForeign<T>(0, 0));
      }

      return {};
    });
  }

  /**
   * @brief Host-callable finalizer for a foreign class backed by T.
   * @note Finalizers must not touch the VM; they only destroy the native object.
   */
  template <typename T>
  auto FinalizeForeign(void* block) -> void {
    if (T* object = detail::ForeignCast<T>(block))
      object->~T();
  }
} // namespace domeplug::wren
