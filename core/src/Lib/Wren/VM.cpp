#include <DPlug++/Wren/VM.hpp>

#include <cmath>                     // std::isfinite, std::trunc
#include <magic_enum/magic_enum.hpp> // magic_enum::enum_name

#include <DPlug++/Utils/Logging.hpp>

namespace domeplug::wren {
  using utils::error::DplugErrorCode;
  using enum DplugErrorCode;
  using types::f64;
  using types::i32;
  using types::i64;
  using types::PCStr;
  using types::Result;
  using types::Span;
  using types::String;
  using types::StringView;
  using types::u8;
  using types::Unit;
  using types::usize;
  using types::Vec;

  auto VM::checkSlot(const i32 slot) const -> Result<> {
    if (slot < 0)
      ERR_FMT(SlotOutOfBounds, "Slot index {} is negative", slot);

    if (const i32 count = slotCount(); slot >= count)
      ERR_FMT(SlotOutOfBounds, "Slot index {} is out of bounds (slot count is {})", slot, count);

    return {};
  }

  auto VM::checkSlotType(const i32 slot, const SlotType expected) const -> Result<> {
    TRY_VOID(checkSlot(slot));

    if (expected == SlotType::Unknown)
      return {};

    if (const SlotType actual = slotTypeUnchecked(slot); actual != expected)
      ERR_FMT(TypeMismatch, "Slot {} holds {}, expected {}", slot, magic_enum::enum_name(actual), magic_enum::enum_name(expected));

    return {};
  }

  auto VM::checkListIndex(const i32 listSlot, const i32 index, const bool allowEnd) const -> Result<> {
    const i32 count = TRY(getListCount(listSlot));

    if (allowEnd && index == -1)
      return {};

    if (index < 0 || index > count || (index == count && !allowEnd))
      ERR_FMT(SlotOutOfBounds, "List index {} is out of bounds (list has {} elements)", index, count);

    return {};
  }

  auto VM::ensureSlots(const i32 count) -> Result<> {
    if (count < 0)
      ERR_FMT(InvalidArgument, "Cannot ensure a negative number of slots ({})", count);

    m_caps->wren().ensureSlots(m_raw, count);
    return {};
  }

  auto VM::slotCount() const -> i32 {
    return m_caps->wren().getSlotCount(m_raw);
  }

  auto VM::slotType(const i32 slot) const -> Result<SlotType> {
    TRY_VOID(checkSlot(slot));
    return slotTypeUnchecked(slot);
  }

  auto VM::setSlotNull(const i32 slot) -> Result<> {
    TRY_VOID(checkSlot(slot));
    setSlotNullUnchecked(slot);
    return {};
  }

  auto VM::setSlotBool(const i32 slot, const bool value) -> Result<> {
    TRY_VOID(checkSlot(slot));
    setSlotBoolUnchecked(slot, value);
    return {};
  }

  auto VM::setSlotDouble(const i32 slot, const f64 value) -> Result<> {
    TRY_VOID(checkSlot(slot));
    setSlotDoubleUnchecked(slot, value);
    return {};
  }

  auto VM::setSlotString(const i32 slot, const StringView text) -> Result<> {
    TRY_VOID(checkSlot(slot));
    // Length-delimited so embedded NULs survive the trip
    m_caps->wren().setSlotBytes(m_raw, slot, text.data(), text.size());
    return {};
  }

  auto VM::setSlotBytes(const i32 slot, const Span<const u8> bytes) -> Result<> {
    TRY_VOID(checkSlot(slot));
    m_caps->wren().setSlotBytes(m_raw, slot, reinterpret_cast<PCStr>(bytes.data()), bytes.size());
    return {};
  }

  auto VM::setSlotNewList(const i32 slot) -> Result<> {
    TRY_VOID(checkSlot(slot));
    m_caps->wren().setSlotNewList(m_raw, slot);
    return {};
  }

  auto VM::setSlotNewMap(const i32 slot) -> Result<> {
    TRY_VOID(checkSlot(slot));
    m_caps->wren().setSlotNewMap(m_raw, slot);
    return {};
  }

  auto VM::getSlotBool(const i32 slot) const -> Result<bool> {
    TRY_VOID(checkSlotType(slot, SlotType::Bool));
    return getSlotBoolUnchecked(slot);
  }

  auto VM::getSlotDouble(const i32 slot) const -> Result<f64> {
    TRY_VOID(checkSlotType(slot, SlotType::Num));
    return getSlotDoubleUnchecked(slot);
  }

  auto VM::getSlotInteger(const i32 slot) const -> Result<i64> {
    const f64 value = TRY(getSlotDouble(slot));

    // 2^63 is exactly representable; anything at or past it does not fit in i64
    constexpr f64 limit = 9223372036854775808.0;

    if (!std::isfinite(value) || std::trunc(value) != value)
      ERR_FMT(TypeMismatch, "Slot {} holds {}, expected an integer", slot, value);

    if (value < -limit || value >= limit)
      ERR_FMT(TypeMismatch, "Slot {} holds {}, which does not fit in a 64-bit integer", slot, value);

    return static_cast<i64>(value);
  }

  auto VM::getSlotString(const i32 slot) const -> Result<String> {
    TRY_VOID(checkSlotType(slot, SlotType::String));

    int         length = 0;
    const PCStr data   = m_caps->wren().getSlotBytes(m_raw, slot, &length);

    if (data == nullptr || length <= 0)
      return String {};

    return String(data, static_cast<usize>(length));
  }

  auto VM::getSlotBytes(const i32 slot) const -> Result<Vec<u8>> {
    TRY_VOID(checkSlotType(slot, SlotType::String));

    int         length = 0;
    const PCStr data   = m_caps->wren().getSlotBytes(m_raw, slot, &length);

    if (data == nullptr || length <= 0)
      return Vec<u8> {};

    const auto* begin = reinterpret_cast<const u8*>(data);
    return Vec<u8>(begin, begin + length);
  }

  auto VM::getListCount(const i32 slot) const -> Result<i32> {
    TRY_VOID(checkSlotType(slot, SlotType::List));
    return m_caps->wren().getListCount(m_raw, slot);
  }

  auto VM::getListElement(const i32 listSlot, const i32 index, const i32 elementSlot) -> Result<> {
    TRY_VOID(checkListIndex(listSlot, index, false));
    TRY_VOID(checkSlot(elementSlot));
    m_caps->wren().getListElement(m_raw, listSlot, index, elementSlot);
    return {};
  }

  auto VM::setListElement(const i32 listSlot, const i32 index, const i32 elementSlot) -> Result<> {
    TRY_VOID(checkListIndex(listSlot, index, false));
    TRY_VOID(checkSlot(elementSlot));
    m_caps->wren().setListElement(m_raw, listSlot, index, elementSlot);
    return {};
  }

  auto VM::insertInList(const i32 listSlot, const i32 index, const i32 elementSlot) -> Result<> {
    TRY_VOID(checkListIndex(listSlot, index, true));
    TRY_VOID(checkSlot(elementSlot));
    m_caps->wren().insertInList(m_raw, listSlot, index, elementSlot);
    return {};
  }

  auto VM::getMapCount(const i32 slot) const -> Result<i32> {
    TRY_VOID(checkSlotType(slot, SlotType::Map));
    return m_caps->wren().getMapCount(m_raw, slot);
  }

  auto VM::getMapContainsKey(const i32 mapSlot, const i32 keySlot) const -> Result<bool> {
    TRY_VOID(checkSlotType(mapSlot, SlotType::Map));
    TRY_VOID(checkSlot(keySlot));
    return m_caps->wren().getMapContainsKey(m_raw, mapSlot, keySlot);
  }

  auto VM::getMapValue(const i32 mapSlot, const i32 keySlot, const i32 valueSlot) -> Result<> {
    TRY_VOID(checkSlotType(mapSlot, SlotType::Map));
    TRY_VOID(checkSlot(keySlot));
    TRY_VOID(checkSlot(valueSlot));
    m_caps->wren().getMapValue(m_raw, mapSlot, keySlot, valueSlot);
    return {};
  }

  auto VM::setMapValue(const i32 mapSlot, const i32 keySlot, const i32 valueSlot) -> Result<> {
    TRY_VOID(checkSlotType(mapSlot, SlotType::Map));
    TRY_VOID(checkSlot(keySlot));
    TRY_VOID(checkSlot(valueSlot));
    m_caps->wren().setMapValue(m_raw, mapSlot, keySlot, valueSlot);
    return {};
  }

  auto VM::removeMapValue(const i32 mapSlot, const i32 keySlot, const i32 removedSlot) -> Result<> {
    TRY_VOID(checkSlotType(mapSlot, SlotType::Map));
    TRY_VOID(checkSlot(keySlot));
    TRY_VOID(checkSlot(removedSlot));
    m_caps->wren().removeMapValue(m_raw, mapSlot, keySlot, removedSlot);
    return {};
  }

  auto VM::getVariable(const StringView module, const StringView name, const i32 slot) -> Result<> {
    if (module.contains('\0') || name.contains('\0'))
      ERR(InvalidArgument, "Module and variable names must not contain NUL bytes");

    TRY_VOID(checkSlot(slot));

    const String moduleName(module);
    const String variableName(name);

    m_caps->wren().getVariable(m_raw, moduleName.c_str(), variableName.c_str(), slot);
    return {};
  }

  auto VM::getSlotHandle(const i32 slot) -> Result<WrenHandle*> {
    TRY_VOID(checkSlot(slot));
    return m_caps->wren().getSlotHandle(m_raw, slot);
  }

  auto VM::setSlotHandle(const i32 slot, WrenHandle* handle) -> Result<> {
    if (handle == nullptr)
      ERR(InvalidArgument, "Cannot store a null handle in a slot");

    TRY_VOID(checkSlot(slot));
    m_caps->wren().setSlotHandle(m_raw, slot, handle);
    return {};
  }

  auto VM::abortFiber(const i32 slot) -> Result<> {
    TRY_VOID(checkSlot(slot));
    m_caps->wren().abortFiber(m_raw, slot);
    return {};
  }

  auto VM::abortFiber(const StringView message) -> Unit {
    m_caps->wren().ensureSlots(m_raw, 1);
    m_caps->wren().setSlotBytes(m_raw, 0, message.data(), message.size());
    m_caps->wren().abortFiber(m_raw, 0);
  }

  auto VM::log(const StringView text) const -> Unit {
    const DPlugDomeApiV0& dome = m_caps->dome();

    if (dome.log == nullptr) {
      info_log("{}", text);
      return;
    }

    const String line(text);
    dome.log(dome.getContext(m_raw), "%s", line.c_str());
  }

  auto VM::setSlotNullUnchecked(const i32 slot) -> Unit {
    m_caps->wren().setSlotNull(m_raw, slot);
  }

  auto VM::setSlotBoolUnchecked(const i32 slot, const bool value) -> Unit {
    m_caps->wren().setSlotBool(m_raw, slot, value);
  }

  auto VM::setSlotDoubleUnchecked(const i32 slot, const f64 value) -> Unit {
    m_caps->wren().setSlotDouble(m_raw, slot, value);
  }

  auto VM::setSlotStringUnchecked(const i32 slot, const PCStr text) -> Unit {
    m_caps->wren().setSlotString(m_raw, slot, text);
  }

  auto VM::slotTypeUnchecked(const i32 slot) const -> SlotType {
    return static_cast<SlotType>(m_caps->wren().getSlotType(m_raw, slot));
  }

  auto VM::getSlotBoolUnchecked(const i32 slot) const -> bool {
    return m_caps->wren().getSlotBool(m_raw, slot);
  }

  auto VM::getSlotDoubleUnchecked(const i32 slot) const -> f64 {
    return m_caps->wren().getSlotDouble(m_raw, slot);
  }

  auto VM::getSlotStringUnchecked(const i32 slot) const -> PCStr {
    return m_caps->wren().getSlotString(m_raw, slot);
  }

  auto VM::getSlotForeignUnchecked(const i32 slot) const -> types::RawPointer {
    return m_caps->wren().getSlotForeign(m_raw, slot);
  }
} // namespace domeplug::wren
