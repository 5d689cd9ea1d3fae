/**
 * @file Capabilities.hpp
 * @brief Typed, validated copy of the host's capability tables
 * @author DomePlug++ Team
 * @version 1.0.0
 *
 * @details The host hands the plugin a single getApi function pointer at load
 * time. LoadCapabilities() asks it for the DOME, Wren and Audio tables at the
 * ABI version this library was written against, rejects null or incomplete
 * tables, and copies every function pointer into an immutable value. Nothing
 * else in the library touches the raw getApi pointer.
 */

#pragma once

#include <dplug_abi.h>

#include "../Utils/Error.hpp"
#include "../Utils/Types.hpp"

namespace domeplug::core {
  namespace types = ::domeplug::utils::types;

  /**
   * @class CapabilityTable
   * @brief Immutable set of host function pointers for one loaded library instance.
   */
  class CapabilityTable {
   public:
    CapabilityTable(const DPlugDomeApiV0& dome, const DPlugWrenApiV0& wren, const DPlugAudioApiV0& audio)
      : m_dome(dome), m_wren(wren), m_audio(audio) {}

    [[nodiscard]] auto dome() const -> const DPlugDomeApiV0& {
      return m_dome;
    }

    [[nodiscard]] auto wren() const -> const DPlugWrenApiV0& {
      return m_wren;
    }

    [[nodiscard]] auto audio() const -> const DPlugAudioApiV0& {
      return m_audio;
    }

   private:
    DPlugDomeApiV0  m_dome;
    DPlugWrenApiV0  m_wren;
    DPlugAudioApiV0 m_audio;
  };

  /**
   * @brief Validate the host's getApi pointer and copy out every capability.
   * @param getApi The pointer the host passed to PLUGIN_onInit.
   * @return The loaded table, or InvalidCapabilityTable when getApi is null,
   *         a table is unavailable at the expected version, or a required
   *         slot is null.
   */
  auto LoadCapabilities(DPlugGetApiFn getApi) -> types::Result<CapabilityTable>;
} // namespace domeplug::core
