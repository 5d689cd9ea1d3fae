/**
 * @file Capabilities.cpp
 * @brief Capability table loading and validation
 * @author DomePlug++ Team
 * @version 1.0.0
 */

#include <DPlug++/Core/Capabilities.hpp>

#include <magic_enum/magic_enum.hpp>

#include <DPlug++/Utils/Logging.hpp>

namespace domeplug::core {
  namespace {
    using utils::error::DplugErrorCode;
    using enum DplugErrorCode;
    using types::PCStr;
    using types::Result;
    using types::Unit;

    template <typename FnPtr>
    auto RequireSlot(const FnPtr slot, const DPlugApiType api, const PCStr slotName) -> Result<Unit> {
      if (slot == nullptr)
        ERR_FMT(InvalidCapabilityTable, "{} capability '{}' is null", magic_enum::enum_name(api), slotName);

      return {};
    }

    // Fetch one table at the expected version and copy it out
    template <typename Table>
    auto FetchTable(DPlugGetApiFn getApi, const DPlugApiType api, const int version) -> Result<Table> {
      const auto* table = static_cast<const Table*>(getApi(api, version));

      if (table == nullptr)
        ERR_FMT(InvalidCapabilityTable, "Host does not provide {} at version {}", magic_enum::enum_name(api), version);

      return *table;
    }

    auto ValidateDome(const DPlugDomeApiV0& dome) -> Result<Unit> {
      constexpr DPlugApiType API = DPLUG_API_DOME;

      TRY_VOID(RequireSlot(dome.registerModule, API, "registerModule"));
      TRY_VOID(RequireSlot(dome.registerFn, API, "registerFn"));
      TRY_VOID(RequireSlot(dome.registerClass, API, "registerClass"));
      TRY_VOID(RequireSlot(dome.lockModule, API, "lockModule"));
      TRY_VOID(RequireSlot(dome.getContext, API, "getContext"));

      // log is optional; Context::log becomes a no-op without it
      if (dome.log == nullptr)
        warn_log("Host does not provide a log capability; plugin messages will only reach stderr");

      return {};
    }

    auto ValidateWren(const DPlugWrenApiV0& wren) -> Result<Unit> {
      constexpr DPlugApiType API = DPLUG_API_WREN;

      TRY_VOID(RequireSlot(wren.ensureSlots, API, "ensureSlots"));
      TRY_VOID(RequireSlot(wren.setSlotNull, API, "setSlotNull"));
      TRY_VOID(RequireSlot(wren.setSlotBool, API, "setSlotBool"));
      TRY_VOID(RequireSlot(wren.setSlotDouble, API, "setSlotDouble"));
      TRY_VOID(RequireSlot(wren.setSlotString, API, "setSlotString"));
      TRY_VOID(RequireSlot(wren.setSlotBytes, API, "setSlotBytes"));
      TRY_VOID(RequireSlot(wren.setSlotNewForeign, API, "setSlotNewForeign"));
      TRY_VOID(RequireSlot(wren.setSlotNewList, API, "setSlotNewList"));
      TRY_VOID(RequireSlot(wren.setSlotNewMap, API, "setSlotNewMap"));
      TRY_VOID(RequireSlot(wren.getUserData, API, "getUserData"));
      TRY_VOID(RequireSlot(wren.getSlotBool, API, "getSlotBool"));
      TRY_VOID(RequireSlot(wren.getSlotDouble, API, "getSlotDouble"));
      TRY_VOID(RequireSlot(wren.getSlotString, API, "getSlotString"));
      TRY_VOID(RequireSlot(wren.getSlotBytes, API, "getSlotBytes"));
      TRY_VOID(RequireSlot(wren.getSlotForeign, API, "getSlotForeign"));
      TRY_VOID(RequireSlot(wren.abortFiber, API, "abortFiber"));
      TRY_VOID(RequireSlot(wren.getSlotCount, API, "getSlotCount"));
      TRY_VOID(RequireSlot(wren.getSlotType, API, "getSlotType"));
      TRY_VOID(RequireSlot(wren.getListCount, API, "getListCount"));
      TRY_VOID(RequireSlot(wren.getListElement, API, "getListElement"));
      TRY_VOID(RequireSlot(wren.setListElement, API, "setListElement"));
      TRY_VOID(RequireSlot(wren.insertInList, API, "insertInList"));
      TRY_VOID(RequireSlot(wren.getMapCount, API, "getMapCount"));
      TRY_VOID(RequireSlot(wren.getMapContainsKey, API, "getMapContainsKey"));
      TRY_VOID(RequireSlot(wren.getMapValue, API, "getMapValue"));
      TRY_VOID(RequireSlot(wren.setMapValue, API, "setMapValue"));
      TRY_VOID(RequireSlot(wren.removeMapValue, API, "removeMapValue"));
      TRY_VOID(RequireSlot(wren.getVariable, API, "getVariable"));
      TRY_VOID(RequireSlot(wren.getSlotHandle, API, "getSlotHandle"));
      TRY_VOID(RequireSlot(wren.setSlotHandle, API, "setSlotHandle"));

      return {};
    }

    auto ValidateAudio(const DPlugAudioApiV0& audio) -> Result<Unit> {
      constexpr DPlugApiType API = DPLUG_API_AUDIO;

      TRY_VOID(RequireSlot(audio.channelCreate, API, "channelCreate"));
      TRY_VOID(RequireSlot(audio.getState, API, "getState"));
      TRY_VOID(RequireSlot(audio.setState, API, "setState"));
      TRY_VOID(RequireSlot(audio.stop, API, "stop"));
      TRY_VOID(RequireSlot(audio.getData, API, "getData"));

      return {};
    }
  } // namespace

  auto LoadCapabilities(DPlugGetApiFn getApi) -> Result<CapabilityTable> {
    if (getApi == nullptr)
      ERR(InvalidCapabilityTable, "Host passed a null getApi pointer");

    const DPlugDomeApiV0  dome  = TRY(FetchTable<DPlugDomeApiV0>(getApi, DPLUG_API_DOME, DPLUG_DOME_API_VERSION));
    const DPlugWrenApiV0  wren  = TRY(FetchTable<DPlugWrenApiV0>(getApi, DPLUG_API_WREN, DPLUG_WREN_API_VERSION));
    const DPlugAudioApiV0 audio = TRY(FetchTable<DPlugAudioApiV0>(getApi, DPLUG_API_AUDIO, DPLUG_AUDIO_API_VERSION));

    TRY_VOID(ValidateDome(dome));
    TRY_VOID(ValidateWren(wren));
    TRY_VOID(ValidateAudio(audio));

    debug_log("Loaded host capability tables (dome v{}, wren v{}, audio v{})", DPLUG_DOME_API_VERSION, DPLUG_WREN_API_VERSION, DPLUG_AUDIO_API_VERSION);

    return CapabilityTable(dome, wren, audio);
  }
} // namespace domeplug::core
