#include <Attest/Resources/Resources.hpp>
#include <Attest/ModuleInit.hpp>
#include <Attest/Log.hpp>

namespace Attest
{

  bool RegisterBuiltinResources()
  {
    return EnsureModuleInitialized(kBuiltinModuleName, [](ModuleRegistration &module)
    {
      module.RegisterResources<Resources::Package, Resources::PipPackage, Resources::Service, Resources::File,
                               Resources::Socket, Resources::User, Resources::Group, Resources::SystemInfo>();
      ATTEST_LOG(Debug, "Registered built-in resources of module {}", module.ModuleName());
    });
  }

} // namespace Attest
