/**
 * @file Module.hpp
 * @brief Declarative description of the modules, classes and methods a plugin exposes
 * @author DomePlug++ Team
 * @version 1.0.0
 *
 * @details Plugin authors describe their script-facing surface with
 * ModuleBuilder/ClassBuilder during the init hook. The resulting descriptors
 * generate the module's script source and drive the host registration calls
 * in the order the host's loader expects:
 *
 *   registerModule -> (registerClass -> registerFn*)* -> lockModule
 *
 * @example
 * @code
 * auto module = ModuleBuilder("external");
 * module.foreignClass<ExternalClass>("ExternalClass")
 *   .source("construct init() {}")
 *   .method<&ExternalClass::alert>("alert(text)");
 *
 * TRY_VOID(RegisterModules(ctx, { TRY(module.build()) }));
 * @endcode
 */

#pragma once

#include <dplug_abi.h>

#include "../Core/Context.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"
#include "Foreign.hpp"

namespace domeplug::wren {
  /// Upper bound on parameters per method, matching the script engine.
  inline constexpr types::usize MAX_PARAMETERS = 16;

  /**
   * @enum SignatureKind
   * @brief Syntactic form of a method signature.
   */
  enum class SignatureKind : types::u8 {
    Method,          ///< name(a, b)
    Getter,          ///< name
    Setter,          ///< name=(value)
    Subscript,       ///< [index]
    SubscriptSetter, ///< [index]=(value)
    PrefixOperator,  ///< -
    InfixOperator,   ///< +(other)
  };

  /**
   * @struct Signature
   * @brief A parsed method signature.
   *
   * Parameters may be written as `_` or as identifiers; identifiers are kept
   * for the generated declaration, while the host only ever sees `_`.
   */
  struct Signature {
    types::String              name; ///< Method or operator name; empty for subscripts.
    SignatureKind              kind;
    types::Vec<types::String>  params;

    [[nodiscard]] auto arity() const -> types::usize {
      return params.size();
    }

    /**
     * @brief Signature as the host matches it, e.g. `playTone(_,_)`.
     */
    [[nodiscard]] auto canonical() const -> types::String;

    /**
     * @brief Signature as written in generated source, e.g. `playTone(a0, a1)`.
     */
    [[nodiscard]] auto declaration() const -> types::String;
  };

  /**
   * @brief Parse a method signature.
   * @return InvalidArgument for malformed signatures or more than MAX_PARAMETERS parameters.
   */
  auto ParseSignature(types::StringView text) -> types::Result<Signature>;

  struct MethodDescriptor {
    Signature      signature;
    bool           isStatic = false;
    DPlugForeignFn handler  = nullptr;

    /**
     * @brief Full host signature, e.g. `static Synth.playTone(_,_)`.
     */
    [[nodiscard]] auto hostSignature(types::StringView className) const -> types::String;
  };

  struct ClassDescriptor {
    types::String                name;
    DPlugForeignFn               allocate = nullptr; ///< Set for foreign classes
    DPlugFinalizerFn             finalize = nullptr;
    types::Vec<types::String>    source;             ///< Lines copied verbatim into the class body
    types::Vec<MethodDescriptor> methods;

    [[nodiscard]] auto isForeign() const -> bool {
      return allocate != nullptr;
    }
  };

  struct ModuleDescriptor {
    types::String               name;
    types::Vec<types::String>   source; ///< Lines copied verbatim before the classes
    types::Vec<ClassDescriptor> classes;
    types::Option<bool>         lock;   ///< None follows PluginConfig::lockModules
  };

  /**
   * @brief Generate the script source for a module.
   */
  auto GenerateSource(const ModuleDescriptor& module) -> types::String;

  /**
   * @brief Check names, handlers and duplicates without calling the host.
   * @return InvalidArgument describing the first problem found.
   */
  auto ValidateModule(const ModuleDescriptor& module) -> types::Result<>;

  /**
   * @brief Register modules with the host, stopping at the first failure.
   * @param ctx Context of the init hook.
   * @param modules Modules in registration order.
   * @return InvalidArgument if any descriptor is invalid (no host call is made),
   *         or RegistrationFailed naming the module, class and method that failed.
   */
  auto RegisterModules(core::Context& ctx, types::Span<const ModuleDescriptor> modules) -> types::Result<>;

  inline auto RegisterModules(core::Context& ctx, std::initializer_list<ModuleDescriptor> modules) -> types::Result<> {
    return RegisterModules(ctx, types::Span<const ModuleDescriptor>(modules.begin(), modules.size()));
  }

  class ModuleBuilder;

  /**
   * @class ClassBuilder
   * @brief Adds source lines and methods to one class of a ModuleBuilder.
   *
   * Holds an index rather than a pointer to the class, so adding more classes
   * to the module does not invalidate it.
   */
  class ClassBuilder {
   public:
    auto source(types::StringView line) -> ClassBuilder&;

    template <auto Handler>
    auto method(const types::StringView signature) -> ClassBuilder& {
      return addMethod(signature, false, &InvokeForeign<Handler>);
    }

    template <auto Handler>
    auto staticMethod(const types::StringView signature) -> ClassBuilder& {
      return addMethod(signature, true, &InvokeForeign<Handler>);
    }

    /**
     * @brief Bind an already host-callable function.
     */
    auto rawMethod(types::StringView signature, bool isStatic, DPlugForeignFn handler) -> ClassBuilder&;

    [[nodiscard]] auto module() const -> ModuleBuilder& {
      return *m_owner;
    }

   private:
    friend class ModuleBuilder;

    ModuleBuilder* m_owner;
    types::usize   m_index;

    ClassBuilder(ModuleBuilder& owner, const types::usize index)
      : m_owner(&owner), m_index(index) {}

    auto addMethod(types::StringView signature, bool isStatic, DPlugForeignFn handler) -> ClassBuilder&;
  };

  /**
   * @class ModuleBuilder
   * @brief Accumulates one module's descriptor.
   *
   * Problems found while building (such as a malformed signature) are kept and
   * reported by build(), so calls can be chained without checking each one.
   */
  class ModuleBuilder {
   public:
    explicit ModuleBuilder(types::StringView name);

    auto source(types::StringView line) -> ModuleBuilder&;

    /**
     * @brief Add a foreign class backed by the native type T.
     * @tparam Factory Optional `T(VM&)` or `Result<T>(VM&)` used by the allocator.
     */
    template <typename T, auto Factory = nullptr>
    auto foreignClass(const types::StringView name) -> ClassBuilder {
      if constexpr (std::is_trivially_destructible_v<T>)
        return addClass(name, &AllocateForeign<T, Factory>, nullptr);
      else
        return addClass(name, &AllocateForeign<T, Factory>, &FinalizeForeign<T>);
    }

    /**
     * @brief Add a script class whose foreign methods are all static.
     */
    auto plainClass(types::StringView name) -> ClassBuilder;

    /**
     * @brief Override PluginConfig::lockModules for this module.
     */
    auto lock(bool enabled) -> ModuleBuilder&;

    /**
     * @brief Validate and return the descriptor.
     */
    [[nodiscard]] auto build() const -> types::Result<ModuleDescriptor>;

   private:
    friend class ClassBuilder;

    ModuleDescriptor                                 m_module;
    types::Option<utils::error::DplugError>          m_error;

    auto addClass(types::StringView name, DPlugForeignFn allocate, DPlugFinalizerFn finalize) -> ClassBuilder;
    auto fail(utils::error::DplugError error) -> types::Unit;
  };
} // namespace domeplug::wren
