/**
 * @file VM.hpp
 * @brief Checked access to the script engine's slot calling convention
 * @author DomePlug++ Team
 * @version 1.0.0
 *
 * @details A VM wraps the raw WrenVM pointer handed to a foreign method,
 * allocator or audio callback together with the loaded capability table.
 * Arguments arrive in slots [1, n) with the receiver (or class) in slot 0, and
 * the return value is written back to slot 0.
 *
 * Every checked operation validates the slot index against the current slot
 * count and, for getters, the slot's type before forwarding to the host. The
 * `...Unchecked` variants forward directly and exist for hot paths where the
 * caller has already validated its slots.
 *
 * A VM is only valid for the duration of the call that received it; it is
 * neither copyable nor movable so it cannot be stored.
 */

#pragma once

#include <cstring> // std::memcpy
#include <limits>  // std::numeric_limits
#include <new>     // placement new, std::launder

#include <dplug_abi.h>

#include "../Core/Capabilities.hpp"
#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace domeplug::wren {
  namespace types = ::domeplug::utils::types;

  /**
   * @enum SlotType
   * @brief Type of the value currently held in a slot.
   */
  enum class SlotType : types::u8 {
    Bool    = DPLUG_WREN_TYPE_BOOL,
    Num     = DPLUG_WREN_TYPE_NUM,
    Foreign = DPLUG_WREN_TYPE_FOREIGN,
    List    = DPLUG_WREN_TYPE_LIST,
    Map     = DPLUG_WREN_TYPE_MAP,
    Null    = DPLUG_WREN_TYPE_NULL,
    String  = DPLUG_WREN_TYPE_STRING,
    Unknown = DPLUG_WREN_TYPE_UNKNOWN,
  };

  namespace detail {
    template <typename T>
    struct TypeTag {
      static constexpr char id = 0;
    };

    /**
     * @brief Identity of a native type stored in a foreign block.
     *
     * The address of a per-type inline variable is unique within one loaded
     * library, which is the only scope foreign objects created here live in.
     */
    template <typename T>
    constexpr auto TagOf() -> const void* {
      return &TypeTag<T>::id;
    }

    /**
     * @struct ForeignHeader
     * @brief Prefix of every foreign block allocated through VM.
     *
     * The host only guarantees byte alignment for foreign blocks, so the header
     * is always copied in and out with memcpy and the payload is placed at the
     * first suitably aligned offset after it.
     */
    struct ForeignHeader {
      const void*  tag;
      types::usize offset;
    };

    template <typename T>
    constexpr auto ForeignBlockSize() -> types::usize {
      return sizeof(ForeignHeader) + alignof(T) - 1 + sizeof(T);
    }

    inline auto ReadHeader(const void* block) -> ForeignHeader {
      ForeignHeader header {};
      std::memcpy(&header, block, sizeof(ForeignHeader));
      return header;
    }

    /**
     * @brief Construct T inside a freshly allocated foreign block.
     * @return Pointer to the constructed payload.
     */
    template <typename T, typename... Args>
    auto EmplaceForeign(void* block, Args&&... args) -> T* {
      auto*              base    = static_cast<unsigned char*>(block);
      const types::usize raw     = reinterpret_cast<types::usize>(base) + sizeof(ForeignHeader);
      const types::usize aligned = (raw + alignof(T) - 1) & ~(alignof(T) - 1);

      ForeignHeader header {
        .tag    = nullptr,
        .offset = aligned - reinterpret_cast<types::usize>(base),
      };

      // The block stays untagged until construction succeeds, so the finalizer
      // ignores an object whose constructor threw.
      std::memcpy(base, &header, sizeof(ForeignHeader));

      T* object = ::new (base + header.offset) T(std::forward<Args>(args)...);

      header.tag = TagOf<T>();
      std::memcpy(base, &header, sizeof(ForeignHeader));

      return object;
    }

    /**
     * @brief Recover a T from a foreign block, or null if the block holds something else.
     */
    template <typename T>
    auto ForeignCast(void* block) -> T* {
      if (block == nullptr)
        return nullptr;

      const ForeignHeader header = ReadHeader(block);

      if (header.tag != TagOf<T>())
        return nullptr;

      return std::launder(reinterpret_cast<T*>(static_cast<unsigned char*>(block) + header.offset));
    }
  } // namespace detail

  class VM {
   public:
    VM(const core::CapabilityTable& caps, WrenVM* raw)
      : m_caps(&caps), m_raw(raw) {}

    VM(const VM&)                    = delete;
    VM(VM&&)                         = delete;
    auto operator=(const VM&) -> VM& = delete;
    auto operator=(VM&&) -> VM&      = delete;
    ~VM()                            = default;

    [[nodiscard]] auto raw() const -> WrenVM* {
      return m_raw;
    }

    [[nodiscard]] auto capabilities() const -> const core::CapabilityTable& {
      return *m_caps;
    }

    // Slot management
    auto ensureSlots(types::i32 count) -> types::Result<>;
    [[nodiscard]] auto slotCount() const -> types::i32;
    [[nodiscard]] auto slotType(types::i32 slot) const -> types::Result<SlotType>;

    // Setters
    auto setSlotNull(types::i32 slot) -> types::Result<>;
    auto setSlotBool(types::i32 slot, bool value) -> types::Result<>;
    auto setSlotDouble(types::i32 slot, types::f64 value) -> types::Result<>;
    auto setSlotString(types::i32 slot, types::StringView text) -> types::Result<>;
    auto setSlotBytes(types::i32 slot, types::Span<const types::u8> bytes) -> types::Result<>;
    auto setSlotNewList(types::i32 slot) -> types::Result<>;
    auto setSlotNewMap(types::i32 slot) -> types::Result<>;

    // Getters
    [[nodiscard]] auto getSlotBool(types::i32 slot) const -> types::Result<bool>;
    [[nodiscard]] auto getSlotDouble(types::i32 slot) const -> types::Result<types::f64>;

    /**
     * @brief Read a number slot that must hold an integral value.
     * @return TypeMismatch if the number has a fractional part or does not fit
     *         in a 64-bit signed integer.
     */
    [[nodiscard]] auto getSlotInteger(types::i32 slot) const -> types::Result<types::i64>;

    /**
     * @brief Read a string slot.
     * @note Script strings may contain embedded NUL bytes; they are preserved.
     */
    [[nodiscard]] auto getSlotString(types::i32 slot) const -> types::Result<types::String>;
    [[nodiscard]] auto getSlotBytes(types::i32 slot) const -> types::Result<types::Vec<types::u8>>;

    // Lists
    [[nodiscard]] auto getListCount(types::i32 slot) const -> types::Result<types::i32>;
    auto getListElement(types::i32 listSlot, types::i32 index, types::i32 elementSlot) -> types::Result<>;
    auto setListElement(types::i32 listSlot, types::i32 index, types::i32 elementSlot) -> types::Result<>;

    /**
     * @brief Insert the value in elementSlot into a list.
     * @param index Position in [0, count], or -1 to append.
     */
    auto insertInList(types::i32 listSlot, types::i32 index, types::i32 elementSlot) -> types::Result<>;

    // Maps
    [[nodiscard]] auto getMapCount(types::i32 slot) const -> types::Result<types::i32>;
    [[nodiscard]] auto getMapContainsKey(types::i32 mapSlot, types::i32 keySlot) const -> types::Result<bool>;
    auto getMapValue(types::i32 mapSlot, types::i32 keySlot, types::i32 valueSlot) -> types::Result<>;
    auto setMapValue(types::i32 mapSlot, types::i32 keySlot, types::i32 valueSlot) -> types::Result<>;
    auto removeMapValue(types::i32 mapSlot, types::i32 keySlot, types::i32 removedSlot) -> types::Result<>;

    // Variables and handles
    auto getVariable(types::StringView module, types::StringView name, types::i32 slot) -> types::Result<>;
    auto getSlotHandle(types::i32 slot) -> types::Result<WrenHandle*>;
    auto setSlotHandle(types::i32 slot, WrenHandle* handle) -> types::Result<>;

    /**
     * @brief Allocate a foreign object of type T in a slot.
     * @param slot Destination slot.
     * @param classSlot Slot holding the foreign class.
     * @param args Constructor arguments for T.
     * @return Pointer to the new object, owned by the script engine.
     */
    template <typename T, typename... Args>
    auto setSlotNewForeign(const types::i32 slot, const types::i32 classSlot, Args&&... args) -> types::Result<T*> {
      TRY_VOID(checkSlot(slot));
      TRY_VOID(checkSlotType(classSlot, SlotType::Unknown));

      void* block = m_caps->wren().setSlotNewForeign(m_raw, slot, classSlot, detail::ForeignBlockSize<T>());

      if (block == nullptr)
        ERR(utils::error::DplugErrorCode::InternalError, "Host returned a null foreign block");

      return detail::EmplaceForeign<T>(block, std::forward<Args>(args)...);
    }

    /**
     * @brief Look up a foreign class by module and name, then allocate an instance of it.
     */
    template <typename T, typename... Args>
    auto newForeign(const types::i32 slot, const types::StringView module, const types::StringView className, Args&&... args) -> types::Result<T*> {
      TRY_VOID(getVariable(module, className, slot));
      return setSlotNewForeign<T>(slot, slot, std::forward<Args>(args)...);
    }

    /**
     * @brief Borrow the native object stored in a foreign slot.
     * @return TypeMismatch if the slot is not foreign or holds a different native type.
     */
    template <typename T>
    [[nodiscard]] auto getSlotForeign(const types::i32 slot) const -> types::Result<T*> {
      TRY_VOID(checkSlotType(slot, SlotType::Foreign));

      T* object = detail::ForeignCast<T>(m_caps->wren().getSlotForeign(m_raw, slot));

      if (object == nullptr)
        ERR_FMT(utils::error::DplugErrorCode::TypeMismatch, "Foreign object in slot {} is not of the requested native type", slot);

      return object;
    }

    /**
     * @brief Abort the current fiber with the value in a slot as the error.
     */
    auto abortFiber(types::i32 slot) -> types::Result<>;

    /**
     * @brief Abort the current fiber with a message, written to slot 0.
     */
    auto abortFiber(types::StringView message) -> types::Unit;

    /**
     * @brief Write text to the host log through the context owning this VM.
     */
    auto log(types::StringView text) const -> types::Unit;

    // Unchecked variants
    auto setSlotNullUnchecked(types::i32 slot) -> types::Unit;
    auto setSlotBoolUnchecked(types::i32 slot, bool value) -> types::Unit;
    auto setSlotDoubleUnchecked(types::i32 slot, types::f64 value) -> types::Unit;
    auto setSlotStringUnchecked(types::i32 slot, types::PCStr text) -> types::Unit;
    [[nodiscard]] auto slotTypeUnchecked(types::i32 slot) const -> SlotType;
    [[nodiscard]] auto getSlotBoolUnchecked(types::i32 slot) const -> bool;
    [[nodiscard]] auto getSlotDoubleUnchecked(types::i32 slot) const -> types::f64;
    [[nodiscard]] auto getSlotStringUnchecked(types::i32 slot) const -> types::PCStr;
    [[nodiscard]] auto getSlotForeignUnchecked(types::i32 slot) const -> types::RawPointer;

   private:
    const core::CapabilityTable* m_caps;
    WrenVM*                      m_raw;

    [[nodiscard]] auto checkSlot(types::i32 slot) const -> types::Result<>;

    // SlotType::Unknown only checks the index
    [[nodiscard]] auto checkSlotType(types::i32 slot, SlotType expected) const -> types::Result<>;
    [[nodiscard]] auto checkListIndex(types::i32 listSlot, types::i32 index, bool allowEnd) const -> types::Result<>;
  };
} // namespace domeplug::wren
