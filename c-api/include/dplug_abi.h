#ifndef DPLUG_ABI_H
#define DPLUG_ABI_H

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#if defined(_WIN32) || defined(__CYGWIN__)
  #define DPLUG_EXPORT __declspec(dllexport)
#else
  #define DPLUG_EXPORT __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
extern "C" {
#endif
  // Host ABI version requested for every capability table
  #define DPLUG_DOME_API_VERSION  0
  #define DPLUG_WREN_API_VERSION  0
  #define DPLUG_AUDIO_API_VERSION 0

  typedef enum DPlugApiType {
    DPLUG_API_DOME  = 0,
    DPLUG_API_WREN  = 1,
    DPLUG_API_AUDIO = 2,
  } DPlugApiType;

  // Host return convention; anything but SUCCESS aborts the current fiber or load
  typedef enum DPlugResult {
    DPLUG_RESULT_SUCCESS = 0,
    DPLUG_RESULT_FAILURE = 1,
    DPLUG_RESULT_UNKNOWN = 2,
  } DPlugResult;

  // Opaque host handles
  typedef struct DPlugHostContextImpl* DPlugHostContext;
  typedef struct WrenVM                WrenVM;
  typedef struct WrenHandle            WrenHandle;
  typedef struct DPlugAudioEngine      DPlugAudioEngine;

  typedef void (*DPlugForeignFn)(WrenVM* vm);
  typedef void (*DPlugFinalizerFn)(void* data);

  typedef void* (*DPlugGetApiFn)(DPlugApiType api, int version);

  typedef enum DPlugWrenType {
    DPLUG_WREN_TYPE_BOOL    = 0,
    DPLUG_WREN_TYPE_NUM     = 1,
    DPLUG_WREN_TYPE_FOREIGN = 2,
    DPLUG_WREN_TYPE_LIST    = 3,
    DPLUG_WREN_TYPE_MAP     = 4,
    DPLUG_WREN_TYPE_NULL    = 5,
    DPLUG_WREN_TYPE_STRING  = 6,
    DPLUG_WREN_TYPE_UNKNOWN = 7, // not reachable through the C API
  } DPlugWrenType;

  typedef struct DPlugDomeApiV0 {
    DPlugResult (*registerModule)(DPlugHostContext ctx, const char* name, const char* source);
    DPlugResult (*registerFn)(DPlugHostContext ctx, const char* moduleName, const char* signature, DPlugForeignFn method);
    DPlugResult (*registerClass)(DPlugHostContext ctx, const char* moduleName, const char* className, DPlugForeignFn allocate, DPlugFinalizerFn finalize);
    void (*lockModule)(DPlugHostContext ctx, const char* name);
    DPlugHostContext (*getContext)(WrenVM* vm);
    void (*log)(DPlugHostContext ctx, const char* text, ...);
  } DPlugDomeApiV0;

  typedef struct DPlugWrenApiV0 {
    void (*ensureSlots)(WrenVM* vm, int slotCount);

    void (*setSlotNull)(WrenVM* vm, int slot);
    void (*setSlotBool)(WrenVM* vm, int slot, bool value);
    void (*setSlotDouble)(WrenVM* vm, int slot, double value);
    void (*setSlotString)(WrenVM* vm, int slot, const char* text);
    void (*setSlotBytes)(WrenVM* vm, int slot, const char* data, size_t length);
    void* (*setSlotNewForeign)(WrenVM* vm, int slot, int classSlot, size_t size);
    void (*setSlotNewList)(WrenVM* vm, int slot);
    void (*setSlotNewMap)(WrenVM* vm, int slot);

    DPlugHostContext (*getUserData)(WrenVM* vm);
    bool (*getSlotBool)(WrenVM* vm, int slot);
    double (*getSlotDouble)(WrenVM* vm, int slot);
    const char* (*getSlotString)(WrenVM* vm, int slot);
    const char* (*getSlotBytes)(WrenVM* vm, int slot, int* length);
    void* (*getSlotForeign)(WrenVM* vm, int slot);

    void (*abortFiber)(WrenVM* vm, int slot);
    int (*getSlotCount)(WrenVM* vm);
    DPlugWrenType (*getSlotType)(WrenVM* vm, int slot);

    int (*getListCount)(WrenVM* vm, int slot);
    void (*getListElement)(WrenVM* vm, int listSlot, int index, int elementSlot);
    void (*setListElement)(WrenVM* vm, int listSlot, int index, int elementSlot);
    void (*insertInList)(WrenVM* vm, int listSlot, int index, int elementSlot);

    int (*getMapCount)(WrenVM* vm, int slot);
    bool (*getMapContainsKey)(WrenVM* vm, int mapSlot, int keySlot);
    void (*getMapValue)(WrenVM* vm, int mapSlot, int keySlot, int valueSlot);
    void (*setMapValue)(WrenVM* vm, int mapSlot, int keySlot, int valueSlot);
    void (*removeMapValue)(WrenVM* vm, int mapSlot, int keySlot, int removedValueSlot);

    void (*getVariable)(WrenVM* vm, const char* module, const char* name, int slot);
    WrenHandle* (*getSlotHandle)(WrenVM* vm, int slot);
    void (*setSlotHandle)(WrenVM* vm, int slot, WrenHandle* handle);
  } DPlugWrenApiV0;

  typedef uint64_t DPlugChannelId;

  typedef struct DPlugChannelRef {
    DPlugChannelId    id;
    DPlugAudioEngine* engine;
  } DPlugChannelRef;

  typedef enum DPlugChannelState {
    DPLUG_CHANNEL_INVALID      = 0,
    DPLUG_CHANNEL_INITIALIZE   = 1,
    DPLUG_CHANNEL_TO_PLAY      = 2,
    DPLUG_CHANNEL_DEVIRTUALIZE = 3,
    DPLUG_CHANNEL_LOADING      = 4,
    DPLUG_CHANNEL_PLAYING      = 5,
    DPLUG_CHANNEL_STOPPING     = 6,
    DPLUG_CHANNEL_STOPPED      = 7,
    DPLUG_CHANNEL_VIRTUALIZING = 8,
    DPLUG_CHANNEL_VIRTUAL      = 9,
    DPLUG_CHANNEL_LAST         = 10,
  } DPlugChannelState;

  // buffer holds 2 * requestedSamples interleaved stereo floats
  typedef void (*DPlugChannelMixFn)(DPlugChannelRef ref, float* buffer, size_t requestedSamples);
  typedef void (*DPlugChannelCallbackFn)(DPlugChannelRef ref, WrenVM* vm);

  typedef struct DPlugAudioApiV0 {
    DPlugChannelRef (*channelCreate)(
      DPlugHostContext       ctx,
      DPlugChannelMixFn      mix,
      DPlugChannelCallbackFn update,
      DPlugChannelCallbackFn finish,
      void*                  userData
    );
    DPlugChannelState (*getState)(DPlugChannelRef ref);
    void (*setState)(DPlugChannelRef ref, DPlugChannelState state);
    void (*stop)(DPlugChannelRef ref);
    void* (*getData)(DPlugChannelRef ref);
  } DPlugAudioApiV0;

  // Entry points resolved by the host after loading the plugin library.
  // PLUGIN_onInit is emitted by DPLUG_PLUGIN in the plugin's own translation unit.
  DPLUG_EXPORT DPlugResult PLUGIN_onInit(DPlugGetApiFn getApi, DPlugHostContext ctx);
  DPLUG_EXPORT DPlugResult PLUGIN_preUpdate(DPlugHostContext ctx);
  DPLUG_EXPORT DPlugResult PLUGIN_postUpdate(DPlugHostContext ctx);
  DPLUG_EXPORT DPlugResult PLUGIN_preDraw(DPlugHostContext ctx, double delta);
  DPLUG_EXPORT DPlugResult PLUGIN_postDraw(DPlugHostContext ctx, double delta);
  DPLUG_EXPORT DPlugResult PLUGIN_onShutdown(DPlugHostContext ctx);
#ifdef __cplusplus
}
#endif

#endif // DPLUG_ABI_H
