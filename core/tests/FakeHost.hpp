#pragma once

#include <algorithm> // std::ranges::find_if
#include <cstdarg>   // va_list, va_start, va_end
#include <cstddef>   // std::ptrdiff_t
#include <cstdio>    // std::vsnprintf
#include <format>    // std::format
#include <memory>    // std::shared_ptr, std::make_shared
#include <variant>   // std::variant, std::get, std::holds_alternative

#include <dplug_abi.h>

#include <DPlug++/Utils/Types.hpp>

// In-process stand-in for the host: implements the three capability tables,
// records every registration call, and keeps a slot array for foreign calls.
namespace domeplug::testing {
  using namespace ::domeplug::utils::types;

  struct Value;

  struct Null {
    auto operator==(const Null&) const -> bool = default;
  };

  struct Foreign {
    std::shared_ptr<Vec<unsigned char>> block;

    auto operator==(const Foreign&) const -> bool = default;
  };

  struct ClassRef {
    String module;
    String name;

    auto operator==(const ClassRef&) const -> bool = default;
  };

  using List = std::shared_ptr<Vec<Value>>;
  using Dict = std::shared_ptr<Vec<Pair<Value, Value>>>;

  struct Value {
    std::variant<Null, bool, f64, String, Foreign, List, Dict, ClassRef> data;

    Value() : data(Null {}) {}
    Value(bool value) : data(value) {}
    Value(f64 value) : data(value) {}
    Value(i32 value) : data(static_cast<f64>(value)) {}
    Value(PCStr value) : data(String(value)) {}
    Value(String value) : data(std::move(value)) {}
    Value(Foreign value) : data(std::move(value)) {}
    Value(List value) : data(std::move(value)) {}
    Value(Dict value) : data(std::move(value)) {}
    Value(ClassRef value) : data(std::move(value)) {}

    auto operator==(const Value&) const -> bool = default;

    template <typename T>
    [[nodiscard]] auto is() const -> bool {
      return std::holds_alternative<T>(data);
    }

    template <typename T>
    [[nodiscard]] auto as() const -> const T& {
      return std::get<T>(data);
    }
  };

  inline auto MakeList(std::initializer_list<Value> items) -> Value {
    return Value(std::make_shared<Vec<Value>>(items));
  }

  inline auto MakeMap(std::initializer_list<Pair<Value, Value>> entries) -> Value {
    return Value(std::make_shared<Vec<Pair<Value, Value>>>(entries));
  }

  struct ChannelRecord {
    DPlugChannelMixFn      mix;
    DPlugChannelCallbackFn update;
    DPlugChannelCallbackFn finish;
    RawPointer             userData;
    DPlugChannelState      state;
    bool                   stopped;
  };

  struct ClassRecord {
    DPlugForeignFn   allocate;
    DPlugFinalizerFn finalize;
  };

  class FakeHost {
   public:
    // Recorded calls, e.g. "registerModule synth", "registerFn synth static Synth.volume"
    Vec<String> calls;
    Vec<String> logs;

    Map<String, String>         sources;
    Map<String, DPlugForeignFn> methods; // "module signature" -> handler
    Map<String, ClassRecord>    classes; // "module.Class" -> allocator/finalizer

    // A registration call whose record contains this text is refused
    Option<String> failOn;

    Vec<Value>     slots;
    Vec<Value>     handles;
    Vec<Foreign>   foreignObjects;
    Option<String> abortMessage;
    usize          abortCount = 0;

    Map<DPlugChannelId, ChannelRecord> channels;
    DPlugChannelId                     nextChannel = 1;

    DPlugDomeApiV0  dome {};
    DPlugWrenApiV0  wren {};
    DPlugAudioApiV0 audio {};

    bool provideDome  = true;
    bool provideWren  = true;
    bool provideAudio = true;

    static auto instance() -> FakeHost& {
      static FakeHost host;
      return host;
    }

    auto context() -> DPlugHostContext {
      return reinterpret_cast<DPlugHostContext>(this);
    }

    auto vm() -> WrenVM* {
      return reinterpret_cast<WrenVM*>(this);
    }

    auto reset() -> void;

    static auto GetApi(DPlugApiType api, int version) -> void*;

    auto setArgs(std::initializer_list<Value> args) -> void {
      slots.assign(args);
      abortMessage.reset();
    }

    [[nodiscard]] auto countCalls(const StringView prefix) const -> usize {
      usize count = 0;

      for (const String& call : calls)
        if (call.starts_with(prefix))
          ++count;

      return count;
    }

    /**
     * @brief Call a registered method the way the script engine would.
     * @param key "module signature", e.g. "synth static Synth.volume"
     */
    auto call(const String& key, std::initializer_list<Value> args) -> Value {
      setArgs(args);
      methods.at(key)(vm());
      return slots.empty() ? Value() : slots.front();
    }

    /**
     * @brief Allocate a foreign instance the way the script engine would.
     */
    auto construct(const String& module, const String& className, std::initializer_list<Value> args) -> Value {
      slots.clear();
      slots.emplace_back(ClassRef { .module = module, .name = className });
      slots.insert(slots.end(), args.begin(), args.end());
      abortMessage.reset();

      classes.at(module + "." + className).allocate(vm());
      return slots.front();
    }

    auto finalize(const String& module, const String& className, const Value& object) -> void {
      if (const DPlugFinalizerFn fin = classes.at(module + "." + className).finalize)
        fin(object.as<Foreign>().block->data());
    }

    auto mix(const DPlugChannelId id, const usize samples) -> Vec<f32> {
      Vec<f32>             buffer(samples * 2, -1.0F);
      const ChannelRecord& rec = channels.at(id);
      rec.mix(DPlugChannelRef { .id = id, .engine = nullptr }, buffer.data(), samples);
      return buffer;
    }

    auto update(const DPlugChannelId id) -> void {
      channels.at(id).update(DPlugChannelRef { .id = id, .engine = nullptr }, vm());
    }

    auto finish(const DPlugChannelId id) -> void {
      const ChannelRecord rec = channels.at(id);
      rec.finish(DPlugChannelRef { .id = id, .engine = nullptr }, vm());
      channels.erase(id);
    }

    auto record(String call) -> DPlugResult {
      const bool refused = failOn && call.contains(*failOn);
      calls.push_back(std::move(call));
      return refused ? DPLUG_RESULT_FAILURE : DPLUG_RESULT_SUCCESS;
    }
  };

  namespace host {
    inline auto Self() -> FakeHost& {
      return FakeHost::instance();
    }

    inline auto Slot(const int slot) -> Value& {
      return Self().slots.at(static_cast<usize>(slot));
    }

    // DOME
    inline auto RegisterModule(DPlugHostContext /*ctx*/, const char* name, const char* source) -> DPlugResult {
      Self().sources[name] = source;
      return Self().record(std::format("registerModule {}", name));
    }

    inline auto RegisterFn(DPlugHostContext /*ctx*/, const char* module, const char* signature, DPlugForeignFn method) -> DPlugResult {
      Self().methods[std::format("{} {}", module, signature)] = method;
      return Self().record(std::format("registerFn {} {}", module, signature));
    }

    inline auto RegisterClass(DPlugHostContext /*ctx*/, const char* module, const char* className, DPlugForeignFn allocate, DPlugFinalizerFn finalize) -> DPlugResult {
      Self().classes[std::format("{}.{}", module, className)] = ClassRecord { .allocate = allocate, .finalize = finalize };
      return Self().record(std::format("registerClass {}.{}", module, className));
    }

    inline auto LockModule(DPlugHostContext /*ctx*/, const char* name) -> void {
      static_cast<void>(Self().record(std::format("lockModule {}", name)));
    }

    inline auto GetContext(WrenVM* /*vm*/) -> DPlugHostContext {
      return Self().context();
    }

    inline auto Log(DPlugHostContext /*ctx*/, const char* fmt, ...) -> void {
      Array<char, 1024> buffer {};

      va_list args;
      va_start(args, fmt);
      std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
      va_end(args);

      Self().logs.emplace_back(buffer.data());
    }

    // Wren
    inline auto EnsureSlots(WrenVM* /*vm*/, const int count) -> void {
      if (Self().slots.size() < static_cast<usize>(count))
        Self().slots.resize(static_cast<usize>(count));
    }

    inline auto SetSlotNull(WrenVM* /*vm*/, const int slot) -> void {
      Slot(slot) = Value();
    }

    inline auto SetSlotBool(WrenVM* /*vm*/, const int slot, const bool value) -> void {
      Slot(slot) = Value(value);
    }

    inline auto SetSlotDouble(WrenVM* /*vm*/, const int slot, const double value) -> void {
      Slot(slot) = Value(value);
    }

    inline auto SetSlotString(WrenVM* /*vm*/, const int slot, const char* text) -> void {
      Slot(slot) = Value(String(text));
    }

    inline auto SetSlotBytes(WrenVM* /*vm*/, const int slot, const char* data, const size_t length) -> void {
      Slot(slot) = Value(String(data, length));
    }

    inline auto SetSlotNewForeign(WrenVM* /*vm*/, const int slot, const int /*classSlot*/, const size_t size) -> void* {
      Foreign object { .block = std::make_shared<Vec<unsigned char>>(size, static_cast<unsigned char>(0xAB)) };
      Self().foreignObjects.push_back(object);
      Slot(slot) = Value(object);
      return object.block->data();
    }

    inline auto SetSlotNewList(WrenVM* /*vm*/, const int slot) -> void {
      Slot(slot) = MakeList({});
    }

    inline auto SetSlotNewMap(WrenVM* /*vm*/, const int slot) -> void {
      Slot(slot) = MakeMap({});
    }

    inline auto GetUserData(WrenVM* /*vm*/) -> DPlugHostContext {
      return Self().context();
    }

    inline auto GetSlotBool(WrenVM* /*vm*/, const int slot) -> bool {
      return Slot(slot).as<bool>();
    }

    inline auto GetSlotDouble(WrenVM* /*vm*/, const int slot) -> double {
      return Slot(slot).as<f64>();
    }

    inline auto GetSlotString(WrenVM* /*vm*/, const int slot) -> const char* {
      return Slot(slot).as<String>().c_str();
    }

    inline auto GetSlotBytes(WrenVM* /*vm*/, const int slot, int* length) -> const char* {
      const String& text = Slot(slot).as<String>();
      *length            = static_cast<int>(text.size());
      return text.data();
    }

    inline auto GetSlotForeign(WrenVM* /*vm*/, const int slot) -> void* {
      if (!Slot(slot).is<Foreign>())
        return nullptr;

      return Slot(slot).as<Foreign>().block->data();
    }

    inline auto AbortFiber(WrenVM* /*vm*/, const int slot) -> void {
      const Value& error  = Slot(slot);
      Self().abortMessage = error.is<String>() ? error.as<String>() : String("<non-string error>");
      ++Self().abortCount;
    }

    inline auto GetSlotCount(WrenVM* /*vm*/) -> int {
      return static_cast<int>(Self().slots.size());
    }

    inline auto GetSlotType(WrenVM* /*vm*/, const int slot) -> DPlugWrenType {
      constexpr Array<DPlugWrenType, 8> types = {
        DPLUG_WREN_TYPE_NULL,
        DPLUG_WREN_TYPE_BOOL,
        DPLUG_WREN_TYPE_NUM,
        DPLUG_WREN_TYPE_STRING,
        DPLUG_WREN_TYPE_FOREIGN,
        DPLUG_WREN_TYPE_LIST,
        DPLUG_WREN_TYPE_MAP,
        DPLUG_WREN_TYPE_UNKNOWN,
      };

      return types.at(Slot(slot).data.index());
    }

    inline auto ListOf(const int slot) -> Vec<Value>& {
      return *Slot(slot).as<List>();
    }

    inline auto GetListCount(WrenVM* /*vm*/, const int slot) -> int {
      return static_cast<int>(ListOf(slot).size());
    }

    inline auto GetListElement(WrenVM* /*vm*/, const int listSlot, const int index, const int elementSlot) -> void {
      Slot(elementSlot) = ListOf(listSlot).at(static_cast<usize>(index));
    }

    inline auto SetListElement(WrenVM* /*vm*/, const int listSlot, const int index, const int elementSlot) -> void {
      ListOf(listSlot).at(static_cast<usize>(index)) = Slot(elementSlot);
    }

    inline auto InsertInList(WrenVM* /*vm*/, const int listSlot, const int index, const int elementSlot) -> void {
      Vec<Value>& list = ListOf(listSlot);
      const usize pos  = index < 0 ? list.size() : static_cast<usize>(index);
      list.insert(list.begin() + static_cast<std::ptrdiff_t>(pos), Slot(elementSlot));
    }

    inline auto MapOf(const int slot) -> Vec<Pair<Value, Value>>& {
      return *Slot(slot).as<Dict>();
    }

    inline auto FindKey(const int mapSlot, const int keySlot) -> Vec<Pair<Value, Value>>::iterator {
      Vec<Pair<Value, Value>>& map = MapOf(mapSlot);
      const Value&             key = Slot(keySlot);

      return std::ranges::find_if(map, [&key](const Pair<Value, Value>& entry) -> bool { return entry.first == key; });
    }

    inline auto GetMapCount(WrenVM* /*vm*/, const int slot) -> int {
      return static_cast<int>(MapOf(slot).size());
    }

    inline auto GetMapContainsKey(WrenVM* /*vm*/, const int mapSlot, const int keySlot) -> bool {
      return FindKey(mapSlot, keySlot) != MapOf(mapSlot).end();
    }

    inline auto GetMapValue(WrenVM* /*vm*/, const int mapSlot, const int keySlot, const int valueSlot) -> void {
      const auto iter   = FindKey(mapSlot, keySlot);
      Slot(valueSlot) = iter == MapOf(mapSlot).end() ? Value() : iter->second;
    }

    inline auto SetMapValue(WrenVM* /*vm*/, const int mapSlot, const int keySlot, const int valueSlot) -> void {
      if (const auto iter = FindKey(mapSlot, keySlot); iter != MapOf(mapSlot).end())
        iter->second = Slot(valueSlot);
      else
        MapOf(mapSlot).emplace_back(Slot(keySlot), Slot(valueSlot));
    }

    inline auto RemoveMapValue(WrenVM* /*vm*/, const int mapSlot, const int keySlot, const int removedSlot) -> void {
      const auto iter = FindKey(mapSlot, keySlot);

      if (iter == MapOf(mapSlot).end()) {
        Slot(removedSlot) = Value();
        return;
      }

      Slot(removedSlot) = iter->second;
      MapOf(mapSlot).erase(iter);
    }

    inline auto GetVariable(WrenVM* /*vm*/, const char* module, const char* name, const int slot) -> void {
      Slot(slot) = Value(ClassRef { .module = module, .name = name });
    }

    inline auto GetSlotHandle(WrenVM* /*vm*/, const int slot) -> WrenHandle* {
      Self().handles.push_back(Slot(slot));
      return reinterpret_cast<WrenHandle*>(Self().handles.size());
    }

    inline auto SetSlotHandle(WrenVM* /*vm*/, const int slot, WrenHandle* handle) -> void {
      Slot(slot) = Self().handles.at(reinterpret_cast<usize>(handle) - 1);
    }

    // Audio
    inline auto ChannelCreate(DPlugHostContext /*ctx*/, DPlugChannelMixFn mix, DPlugChannelCallbackFn update, DPlugChannelCallbackFn finish, void* userData) -> DPlugChannelRef {
      const DPlugChannelId id = Self().nextChannel++;

      Self().channels[id] = ChannelRecord {
        .mix      = mix,
        .update   = update,
        .finish   = finish,
        .userData = userData,
        .state    = DPLUG_CHANNEL_INITIALIZE,
        .stopped  = false,
      };

      return DPlugChannelRef { .id = id, .engine = nullptr };
    }

    inline auto GetState(const DPlugChannelRef ref) -> DPlugChannelState {
      return Self().channels.at(ref.id).state;
    }

    inline auto SetState(const DPlugChannelRef ref, const DPlugChannelState state) -> void {
      Self().channels.at(ref.id).state = state;
    }

    inline auto Stop(const DPlugChannelRef ref) -> void {
      ChannelRecord& rec = Self().channels.at(ref.id);
      rec.stopped        = true;
      rec.state          = DPLUG_CHANNEL_STOPPING;
    }

    inline auto GetData(const DPlugChannelRef ref) -> void* {
      const auto iter = Self().channels.find(ref.id);
      return iter == Self().channels.end() ? nullptr : iter->second.userData;
    }
  } // namespace host

  inline auto FakeHost::reset() -> void {
    calls.clear();
    logs.clear();
    sources.clear();
    methods.clear();
    classes.clear();
    failOn.reset();
    slots.clear();
    handles.clear();
    foreignObjects.clear();
    abortMessage.reset();
    abortCount = 0;
    channels.clear();
    nextChannel  = 1;
    provideDome  = true;
    provideWren  = true;
    provideAudio = true;

    dome = DPlugDomeApiV0 {
      .registerModule = host::RegisterModule,
      .registerFn     = host::RegisterFn,
      .registerClass  = host::RegisterClass,
      .lockModule     = host::LockModule,
      .getContext     = host::GetContext,
      .log            = host::Log,
    };

    wren = DPlugWrenApiV0 {
      .ensureSlots       = host::EnsureSlots,
      .setSlotNull       = host::SetSlotNull,
      .setSlotBool       = host::SetSlotBool,
      .setSlotDouble     = host::SetSlotDouble,
      .setSlotString     = host::SetSlotString,
      .setSlotBytes      = host::SetSlotBytes,
      .setSlotNewForeign = host::SetSlotNewForeign,
      .setSlotNewList    = host::SetSlotNewList,
      .setSlotNewMap     = host::SetSlotNewMap,
      .getUserData       = host::GetUserData,
      .getSlotBool       = host::GetSlotBool,
      .getSlotDouble     = host::GetSlotDouble,
      .getSlotString     = host::GetSlotString,
      .getSlotBytes      = host::GetSlotBytes,
      .getSlotForeign    = host::GetSlotForeign,
      .abortFiber        = host::AbortFiber,
      .getSlotCount      = host::GetSlotCount,
      .getSlotType       = host::GetSlotType,
      .getListCount      = host::GetListCount,
      .getListElement    = host::GetListElement,
      .setListElement    = host::SetListElement,
      .insertInList      = host::InsertInList,
      .getMapCount       = host::GetMapCount,
      .getMapContainsKey = host::GetMapContainsKey,
      .getMapValue       = host::GetMapValue,
      .setMapValue       = host::SetMapValue,
      .removeMapValue    = host::RemoveMapValue,
      .getVariable       = host::GetVariable,
      .getSlotHandle     = host::GetSlotHandle,
      .setSlotHandle     = host::SetSlotHandle,
    };

    audio = DPlugAudioApiV0 {
      .channelCreate = host::ChannelCreate,
      .getState      = host::GetState,
      .setState      = host::SetState,
      .stop          = host::Stop,
      .getData       = host::GetData,
    };
  }

  inline auto FakeHost::GetApi(const DPlugApiType api, const int version) -> void* {
    FakeHost& self = instance();

    if (version != 0)
      return nullptr;

    switch (api) {
      case DPLUG_API_DOME:  return self.provideDome ? static_cast<void*>(&self.dome) : nullptr;
      case DPLUG_API_WREN:  return self.provideWren ? static_cast<void*>(&self.wren) : nullptr;
      case DPLUG_API_AUDIO: return self.provideAudio ? static_cast<void*>(&self.audio) : nullptr;
    }

    return nullptr;
  }

  /**
   * @brief Reset the fake host and return it, ready for a fresh load.
   */
  inline auto FreshHost() -> FakeHost& {
    FakeHost& fake = FakeHost::instance();
    fake.reset();
    return fake;
  }
} // namespace domeplug::testing
