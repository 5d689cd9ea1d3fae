#include <DPlug++/Wren/Module.hpp>

#include <algorithm>                 // std::ranges::{all_of, find}
#include <array>                     // std::array
#include <format>                    // std::format
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name

#include <DPlug++/Core/Runtime.hpp>
#include <DPlug++/Utils/Logging.hpp>

namespace domeplug::wren {
  using utils::error::DplugError;
  using utils::error::DplugErrorCode;
  using enum DplugErrorCode;
  using types::Array;
  using types::Option;
  using types::Result;
  using types::Span;
  using types::String;
  using types::StringView;
  using types::UnorderedSet;
  using types::Unit;
  using types::usize;
  using types::Vec;

  namespace {
    // Longest first so that "<=" is not read as "<"
    constexpr Array<StringView, 18> INFIX_OPERATORS = {
      "...", "..", "<<", ">>", "<=", ">=", "==", "!=",
      "+", "-", "*", "/", "%", "<", ">", "&", "|", "^",
    };

    constexpr Array<StringView, 3> PREFIX_OPERATORS = { "-", "!", "~" };

    constexpr auto IsIdentStart(const char chr) -> bool {
      return (chr >= 'a' && chr <= 'z') || (chr >= 'A' && chr <= 'Z') || chr == '_';
    }

    constexpr auto IsIdentChar(const char chr) -> bool {
      return IsIdentStart(chr) || (chr >= '0' && chr <= '9');
    }

    constexpr auto IsIdentifier(const StringView text) -> bool {
      return !text.empty() && IsIdentStart(text.front()) && std::ranges::all_of(text, IsIdentChar);
    }

    constexpr auto TrimBlanks(StringView text) -> StringView {
      while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
        text.remove_prefix(1);

      while (!text.empty() && (text.back() == ' ' || text.back() == '\t'))
        text.remove_suffix(1);

      return text;
    }

    auto ReadIdentifier(const StringView text) -> usize {
      if (text.empty() || !IsIdentStart(text.front()))
        return 0;

      usize len = 1;
      while (len < text.size() && IsIdentChar(text[len]))
        ++len;

      return len;
    }

    // Parameter list between delimiters: "_,value" -> ["a0", "value"]; firstIndex numbers the `_` placeholders
    auto ParseParams(const StringView signature, const StringView list, const bool allowEmpty, const usize firstIndex = 0) -> Result<Vec<String>> {
      Vec<String> params;

      if (list.empty()) {
        if (!allowEmpty)
          ERR_FMT(InvalidArgument, "Signature '{}' needs at least one parameter", signature);

        return params;
      }

      usize start = 0;

      while (true) {
        const usize      comma = list.find(',', start);
        const StringView param = TrimBlanks(list.substr(start, comma == StringView::npos ? StringView::npos : comma - start));

        if (param == "_")
          params.emplace_back(std::format("a{}", firstIndex + params.size()));
        else if (IsIdentifier(param))
          params.emplace_back(param);
        else
          ERR_FMT(InvalidArgument, "Signature '{}' has an invalid parameter '{}'", signature, param);

        if (comma == StringView::npos)
          break;

        start = comma + 1;
      }

      if (params.size() > MAX_PARAMETERS)
        ERR_FMT(InvalidArgument, "Signature '{}' has {} parameters (at most {} are allowed)", signature, params.size(), MAX_PARAMETERS);

      return params;
    }

    // Parses "(...)" at the start of rest and requires it to end the signature
    auto ParseParenthesized(const StringView signature, const StringView rest, const bool allowEmpty, const usize firstIndex = 0) -> Result<Vec<String>> {
      if (rest.size() < 2 || rest.front() != '(' || rest.back() != ')')
        ERR_FMT(InvalidArgument, "Signature '{}' has an unterminated parameter list", signature);

      return ParseParams(signature, rest.substr(1, rest.size() - 2), allowEmpty, firstIndex);
    }

    // "(value)" for setters and infix operators
    auto ParseSingleParam(const StringView signature, const StringView rest, const usize firstIndex = 0) -> Result<Vec<String>> {
      Vec<String> params = TRY(ParseParenthesized(signature, rest, false, firstIndex));

      if (params.size() != 1)
        ERR_FMT(InvalidArgument, "Signature '{}' must take exactly one value", signature);

      return params;
    }

    auto JoinParams(const Vec<String>& params, const StringView separator) -> String {
      String out;

      for (usize i = 0; i < params.size(); ++i) {
        if (i > 0)
          out += separator;
        out += params[i];
      }

      return out;
    }

    auto Placeholders(const usize count) -> String {
      return JoinParams(Vec<String>(count, "_"), ",");
    }

    auto AppendLines(String& out, const Vec<String>& lines, const StringView indent) -> Unit {
      for (const String& line : lines) {
        out += indent;
        out += line;
        out += '\n';
      }
    }

    auto RegistrationError(const DplugError& cause, const StringView module, const StringView className, const StringView method) -> DplugError {
      return DplugError(
        RegistrationFailed,
        std::format("module '{}', class '{}', method '{}': {}", module, className, method, cause.message),
        cause.location
      );
    }
  } // namespace

  auto Signature::canonical() const -> String {
    switch (kind) {
      case SignatureKind::Method:          return std::format("{}({})", name, Placeholders(arity()));
      case SignatureKind::Getter:          return name;
      case SignatureKind::Setter:          return std::format("{}=(_)", name);
      case SignatureKind::Subscript:       return std::format("[{}]", Placeholders(arity()));
      case SignatureKind::SubscriptSetter: return std::format("[{}]=(_)", Placeholders(arity() - 1));
      case SignatureKind::PrefixOperator:  return name;
      case SignatureKind::InfixOperator:   return std::format("{}(_)", name);
    }

    std::unreachable();
  }

  auto Signature::declaration() const -> String {
    switch (kind) {
      case SignatureKind::Method:        return std::format("{}({})", name, JoinParams(params, ", "));
      case SignatureKind::Getter:        return name;
      case SignatureKind::Setter:        return std::format("{}=({})", name, params.front());
      case SignatureKind::Subscript:     return std::format("[{}]", JoinParams(params, ", "));
      case SignatureKind::SubscriptSetter:
        return std::format("[{}]=({})", JoinParams(Vec<String>(params.begin(), params.end() - 1), ", "), params.back());
      case SignatureKind::PrefixOperator: return name;
      case SignatureKind::InfixOperator:  return std::format("{}({})", name, params.front());
    }

    std::unreachable();
  }

  auto ParseSignature(const StringView text) -> Result<Signature> {
    if (text.empty())
      ERR(InvalidArgument, "Signature is empty");

    // Subscripts: [_] and [_]=(_)
    if (text.front() == '[') {
      const usize close = text.find(']');

      if (close == StringView::npos)
        ERR_FMT(InvalidArgument, "Signature '{}' has an unterminated subscript", text);

      Vec<String>      params = TRY(ParseParams(text, text.substr(1, close - 1), false));
      const StringView rest   = text.substr(close + 1);

      if (rest.empty())
        return Signature { .name = {}, .kind = SignatureKind::Subscript, .params = std::move(params) };

      if (!rest.starts_with('='))
        ERR_FMT(InvalidArgument, "Unexpected '{}' after subscript in '{}'", rest, text);

      Vec<String> value = TRY(ParseSingleParam(text, rest.substr(1), params.size()));

      params.push_back(std::move(value.front()));

      if (params.size() > MAX_PARAMETERS)
        ERR_FMT(InvalidArgument, "Signature '{}' has {} parameters (at most {} are allowed)", text, params.size(), MAX_PARAMETERS);

      return Signature { .name = {}, .kind = SignatureKind::SubscriptSetter, .params = std::move(params) };
    }

    // Named methods, getters and setters
    if (const usize identLen = ReadIdentifier(text); identLen > 0) {
      const String     name(text.substr(0, identLen));
      const StringView rest = text.substr(identLen);

      // `is` is the only named infix operator
      if (name == "is") {
        Vec<String> params = TRY(ParseSingleParam(text, rest));
        return Signature { .name = name, .kind = SignatureKind::InfixOperator, .params = std::move(params) };
      }

      if (rest.empty())
        return Signature { .name = name, .kind = SignatureKind::Getter, .params = {} };

      if (rest.starts_with('=')) {
        Vec<String> params = TRY(ParseSingleParam(text, rest.substr(1)));
        return Signature { .name = name, .kind = SignatureKind::Setter, .params = std::move(params) };
      }

      Vec<String> params = TRY(ParseParenthesized(text, rest, true));
      return Signature { .name = name, .kind = SignatureKind::Method, .params = std::move(params) };
    }

    // Operators
    for (const StringView op : INFIX_OPERATORS) {
      if (!text.starts_with(op))
        continue;

      const StringView rest = text.substr(op.size());

      if (rest.empty()) {
        if (std::ranges::find(PREFIX_OPERATORS, op) == PREFIX_OPERATORS.end())
          ERR_FMT(InvalidArgument, "Operator '{}' cannot be used as a prefix operator", op);

        return Signature { .name = String(op), .kind = SignatureKind::PrefixOperator, .params = {} };
      }

      Vec<String> params = TRY(ParseSingleParam(text, rest));
      return Signature { .name = String(op), .kind = SignatureKind::InfixOperator, .params = std::move(params) };
    }

    // Prefix-only operators
    if (text == "!" || text == "~")
      return Signature { .name = String(text), .kind = SignatureKind::PrefixOperator, .params = {} };

    ERR_FMT(InvalidArgument, "Malformed signature '{}'", text);
  }

  auto MethodDescriptor::hostSignature(const StringView className) const -> String {
    return std::format("{}{}.{}", isStatic ? "static " : "", className, signature.canonical());
  }

  auto GenerateSource(const ModuleDescriptor& module) -> String {
    String out;

    AppendLines(out, module.source, "");

    for (const ClassDescriptor& cls : module.classes) {
      if (!out.empty())
        out += '\n';

      out += std::format("{}class {} {{\n", cls.isForeign() ? "foreign " : "", cls.name);

      AppendLines(out, cls.source, "  ");

      for (const MethodDescriptor& method : cls.methods)
        out += std::format("  foreign {}{}\n", method.isStatic ? "static " : "", method.signature.declaration());

      out += "}\n";
    }

    return out;
  }

  auto ValidateModule(const ModuleDescriptor& module) -> Result<> {
    if (module.name.empty() || module.name.contains('\0'))
      ERR_FMT(InvalidArgument, "Invalid module name '{}'", module.name);

    UnorderedSet<String> classNames;

    for (const ClassDescriptor& cls : module.classes) {
      if (!IsIdentifier(cls.name))
        ERR_FMT(InvalidArgument, "Invalid class name '{}' in module '{}'", cls.name, module.name);

      if (!classNames.insert(cls.name).second)
        ERR_FMT(InvalidArgument, "Class '{}' is declared twice in module '{}'", cls.name, module.name);

      if (cls.finalize != nullptr && !cls.isForeign())
        ERR_FMT(InvalidArgument, "Class '{}' has a finalizer but no allocator", cls.name);

      UnorderedSet<String> signatures;

      for (const MethodDescriptor& method : cls.methods) {
        const String hostSig = method.hostSignature(cls.name);

        if (method.handler == nullptr)
          ERR_FMT(InvalidArgument, "Method '{}' in module '{}' has no handler", hostSig, module.name);

        if (!signatures.insert(hostSig).second)
          ERR_FMT(InvalidArgument, "Method '{}' is declared twice in module '{}'", hostSig, module.name);
      }
    }

    return {};
  }

  auto RegisterModules(core::Context& ctx, const Span<const ModuleDescriptor> modules) -> Result<> {
    // Everything is checked up front so an invalid descriptor never leaves a half-registered module
    UnorderedSet<String> moduleNames;

    for (const ModuleDescriptor& module : modules) {
      TRY_VOID(ValidateModule(module));

      if (!moduleNames.insert(module.name).second)
        ERR_FMT(InvalidArgument, "Module '{}' is declared twice", module.name);
    }

    const bool lockByDefault = core::plugin::PluginRuntime::getInstance().config().lockModules;

    for (const ModuleDescriptor& module : modules) {
      span_enter(std::format("register {}", module.name));

      if (Result<> registered = ctx.registerModule(module.name, GenerateSource(module)); !registered)
        return types::Err(RegistrationError(registered.error(), module.name, "", ""));

      for (const ClassDescriptor& cls : module.classes) {
        if (cls.isForeign())
          if (Result<> registered = ctx.registerClass(module.name, cls.name, cls.allocate, cls.finalize); !registered)
            return types::Err(RegistrationError(registered.error(), module.name, cls.name, ""));

        for (const MethodDescriptor& method : cls.methods)
          if (Result<> registered = ctx.registerFn(module.name, method.hostSignature(cls.name), method.handler); !registered)
            return types::Err(RegistrationError(registered.error(), module.name, cls.name, method.signature.canonical()));
      }

      if (module.lock.value_or(lockByDefault))
        TRY_VOID(ctx.lockModule(module.name));

      debug_log("Module '{}' registered with {} classes", module.name, module.classes.size());
    }

    return {};
  }

  ModuleBuilder::ModuleBuilder(const StringView name) {
    m_module.name = String(name);
  }

  auto ModuleBuilder::source(const StringView line) -> ModuleBuilder& {
    m_module.source.emplace_back(line);
    return *this;
  }

  auto ModuleBuilder::plainClass(const StringView name) -> ClassBuilder {
    return addClass(name, nullptr, nullptr);
  }

  auto ModuleBuilder::lock(const bool enabled) -> ModuleBuilder& {
    m_module.lock = enabled;
    return *this;
  }

  auto ModuleBuilder::build() const -> Result<ModuleDescriptor> {
    if (m_error)
      return types::Err(*m_error);

    TRY_VOID(ValidateModule(m_module));

    return m_module;
  }

  auto ModuleBuilder::addClass(const StringView name, DPlugForeignFn allocate, DPlugFinalizerFn finalize) -> ClassBuilder {
    m_module.classes.push_back(ClassDescriptor {
      .name     = String(name),
      .allocate = allocate,
      .finalize = finalize,
      .source   = {},
      .methods  = {},
    });

    return { *this, m_module.classes.size() - 1 };
  }

  auto ModuleBuilder::fail(DplugError error) -> Unit {
    // Keep the first problem; later ones are usually knock-on effects
    if (!m_error)
      m_error = std::move(error);
  }

  auto ClassBuilder::source(const StringView line) -> ClassBuilder& {
    m_owner->m_module.classes[m_index].source.emplace_back(line);
    return *this;
  }

  auto ClassBuilder::rawMethod(const StringView signature, const bool isStatic, DPlugForeignFn handler) -> ClassBuilder& {
    return addMethod(signature, isStatic, handler);
  }

  auto ClassBuilder::addMethod(const StringView signature, const bool isStatic, DPlugForeignFn handler) -> ClassBuilder& {
    ClassDescriptor& cls = m_owner->m_module.classes[m_index];

    Result<Signature> parsed = ParseSignature(signature);

    if (!parsed) {
      m_owner->fail(DplugError(
        InvalidArgument,
        std::format("{} in class '{}' of module '{}'", parsed.error().message, cls.name, m_owner->m_module.name),
        parsed.error().location
      ));
      return *this;
    }

    if (!isStatic && !cls.isForeign())
      warn_log("Instance method '{}' on non-foreign class '{}' has no native receiver", signature, cls.name);

    cls.methods.push_back(MethodDescriptor {
      .signature = std::move(*parsed),
      .isStatic  = isStatic,
      .handler   = handler,
    });

    return *this;
  }
} // namespace domeplug::wren
