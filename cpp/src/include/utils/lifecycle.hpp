#pragma once

/*******************************************************************************
 * @file lifecycle.hpp
 * @brief Manages application startup and shutdown with dependency-aware modules.
 *
 * Modules declare their dependencies by name; the `LifecycleManager` performs a
 * topological sort to start them in order and shuts them down in reverse order.
 * Cycles and unknown dependencies are reported as `std::runtime_error` from
 * `initialize()`.
 *
 * **Usage**
 *
 * ```cpp
 * int main(int argc, char* argv[]) {
 *     federator::utils::LifecycleGuard app_lifecycle(federator::utils::MakeModDefList(
 *         federator::utils::Logger::GetLifecycleModule(),
 *         federator::crypto::GetLifecycleModule()));
 *
 *     LOGGER_INFO("Application started successfully.");
 *     return 0;
 * } // modules shut down here, in reverse start order
 * ```
 ******************************************************************************/
#include "fed_base.hpp"

#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace federator::utils
{

class LifecycleManagerImpl;

// Call-site: MakeModDefList(std::move(a), std::move(b)) or MakeModDefList(MyFactory(), ...)
template <typename... Mods> inline std::vector<ModuleDef> MakeModDefList(Mods &&...mods)
{
    static_assert((std::is_same_v<std::decay_t<Mods>, ModuleDef> && ...),
                  "MakeModDefList: all arguments must be ModuleDef (rvalues or prvalues)");
    std::vector<ModuleDef> list;
    list.reserve(sizeof...(Mods));
    (list.emplace_back(std::forward<Mods>(mods)), ...);
    return list;
}

/**
 * @class LifecycleManager
 * @brief Process-wide registry that starts and stops modules.
 */
class FEDERATOR_UTILS_EXPORT LifecycleManager
{
  public:
    static LifecycleManager &instance();

    /**
     * @brief Registers a module. Must be called before `initialize()`.
     * @throws std::logic_error if called after initialization or for a duplicate name.
     */
    void register_module(ModuleDef &&module_def);

    /**
     * @brief Starts all registered modules in dependency order.
     * @throws std::runtime_error on a dependency cycle or an unknown dependency.
     */
    void initialize(std::source_location loc);

    /**
     * @brief Shuts down started modules in reverse order. Idempotent.
     */
    void finalize(std::source_location loc);

    [[nodiscard]] bool is_initialized() const noexcept;
    [[nodiscard]] bool is_finalized() const noexcept;

    /**
     * @brief Returns true once the named module's startup callback has completed
     *        and until its shutdown begins.
     */
    [[nodiscard]] bool is_module_started(std::string_view name) const;

    LifecycleManager(const LifecycleManager &) = delete;
    LifecycleManager &operator=(const LifecycleManager &) = delete;

  private:
    LifecycleManager();
    ~LifecycleManager();
    std::unique_ptr<LifecycleManagerImpl> pImpl;
};

inline void RegisterModule(ModuleDef &&module_def)
{
    LifecycleManager::instance().register_module(std::move(module_def));
}

inline void InitializeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().initialize(loc);
}

inline void FinalizeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().finalize(loc);
}

inline bool IsAppInitialized()
{
    return LifecycleManager::instance().is_initialized();
}

/**
 * @class LifecycleGuard
 * @brief RAII owner of the application lifecycle.
 *
 * The first guard constructed in a process registers its modules and initializes
 * the application; its destructor finalizes. Later guards are no-ops.
 */
class LifecycleGuard
{
  public:
    explicit LifecycleGuard(std::vector<ModuleDef> &&modules,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        bool expected = false;
        if (owner_flag().compare_exchange_strong(expected, true, std::memory_order_acq_rel))
        {
            m_is_owner = true;
            for (auto &m : modules)
            {
                RegisterModule(std::move(m));
            }
            InitializeApp(m_loc);
        }
        else
        {
            FED_DEBUG("[FED_LifeCycle] LifecycleGuard constructed in {} but an owner already "
                      "exists; supplied modules were ignored.",
                      m_loc.function_name());
        }
    }

    LifecycleGuard(const LifecycleGuard &) = delete;
    LifecycleGuard &operator=(const LifecycleGuard &) = delete;
    LifecycleGuard(LifecycleGuard &&) = delete;
    LifecycleGuard &operator=(LifecycleGuard &&) = delete;

    ~LifecycleGuard() noexcept
    {
        if (m_is_owner)
        {
            FinalizeApp(m_loc);
        }
    }

  private:
    static std::atomic_bool &owner_flag()
    {
        static std::atomic_bool flag{false};
        return flag;
    }

    std::source_location m_loc;
    bool m_is_owner{false};
};

} // namespace federator::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
