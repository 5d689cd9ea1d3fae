// Minimal plugin: one foreign class whose method writes to the host log.
//
//   import "external" for ExternalClass
//   ExternalClass.init().alert("Hello from Wren")

#include <DPlug++/Core/Context.hpp>
#include <DPlug++/Core/Plugin.hpp>
#include <DPlug++/Utils/Error.hpp>
#include <DPlug++/Utils/Types.hpp>
#include <DPlug++/Wren/Module.hpp>
#include <DPlug++/Wren/VM.hpp>

using namespace domeplug::utils::types;
using domeplug::core::Context;
using domeplug::wren::ModuleBuilder;
using domeplug::wren::RegisterModules;
using domeplug::wren::VM;

namespace {
  class ExternalClass {
   public:
    auto alert(VM& vm) -> Result<> {
      String text = TRY(vm.getSlotString(1));
      text += '\n';

      vm.log(text);
      return {};
    }
  };

  auto OnInit(Context& ctx) -> Result<> {
    ctx.log("Initialising external module\n");

    ModuleBuilder module("external");

    module.foreignClass<ExternalClass>("ExternalClass")
      .source("construct init() {}")
      .method<&ExternalClass::alert>("alert(text)");

    return RegisterModules(ctx, { TRY(module.build()) });
  }
} // namespace

DPLUG_PLUGIN({ .onInit = OnInit })
