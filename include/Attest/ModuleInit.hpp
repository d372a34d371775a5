// ModuleInit.hpp
// Explicit, once-per-module registration of resource types
#pragma once

#include <mutex>
#include <string_view>
#include <type_traits>
#include <utility>

#include <Attest/Registry.hpp>
#include <Attest/ResourceBuilder.hpp>
#include <NGIN/Hashing/FNV.hpp>

namespace Attest
{

  /**
   * Helper used by provider bundles to register resource types in a
   * predictable, explicit fashion. Constructed with a module identifier so
   * diagnostics can attribute registrations to a specific bundle.
   */
  class ModuleRegistration
  {
  public:
    constexpr explicit ModuleRegistration(std::string_view moduleName) noexcept
        : m_moduleName(moduleName),
          m_moduleId(NGIN::Hashing::FNV1a64(moduleName.data(), moduleName.size()))
    {
    }

    [[nodiscard]] constexpr std::string_view ModuleName() const noexcept
    {
      return m_moduleName;
    }

    [[nodiscard]] constexpr ModuleId GetModuleId() const noexcept
    {
      return m_moduleId;
    }

    /** Register a single resource type. */
    template <class T>
    void RegisterResource() const
    {
      (void)detail::EnsureRegistered<T>(m_moduleId);
    }

    /** Register multiple resource types in one call, in argument order. */
    template <class... T>
    void RegisterResources() const
    {
      (detail::EnsureRegistered<T>(m_moduleId), ...);
    }

  private:
    std::string_view m_moduleName;
    ModuleId m_moduleId{0};
  };

  /**
   * Runs `fn` exactly once per module and only marks the module as initialized
   * when the callable succeeds. The callable receives a `ModuleRegistration`
   * helper. If it returns a `bool`, that value controls whether initialization
   * is considered successful.
   */
  template <class Fn>
  bool EnsureModuleInitialized(std::string_view moduleName, Fn &&fn)
  {
    static std::mutex guard;
    static bool initialized = false;
    std::lock_guard<std::mutex> lock(guard);
    if (initialized)
      return true;

    ModuleRegistration registration{moduleName};

    using Result = std::invoke_result_t<Fn, ModuleRegistration &>;

    if constexpr (std::is_void_v<Result>)
    {
      std::forward<Fn>(fn)(registration);
      initialized = true;
      return true;
    }
    else
    {
      Result result = std::forward<Fn>(fn)(registration);
      if constexpr (std::is_convertible_v<Result, bool>)
      {
        if (!static_cast<bool>(result))
          return false;
      }
      initialized = true;
      return true;
    }
  }

} // namespace Attest
