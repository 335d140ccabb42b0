#pragma once
/**
 * @file module_def.hpp
 * @brief Module definition for LifecycleManager registration.
 */
#include "federator_utils_export.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string_view>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace federator::utils
{

class ModuleDefImpl;
class LifecycleManager;

/**
 * @brief A function pointer type for module startup and shutdown callbacks.
 *
 * A C-style function pointer keeps the callback ABI stable across shared-library
 * boundaries. `arg` is `nullptr` when no argument was supplied.
 */
using LifecycleCallback = void (*)(const char *arg);

/**
 * @class ModuleDef
 * @brief Builder for a lifecycle module definition.
 *
 * Movable but not copyable. Once registered with the `LifecycleManager`, ownership
 * is transferred.
 */
class FEDERATOR_UTILS_EXPORT ModuleDef
{
  public:
    static constexpr size_t MAX_MODULE_NAME_LEN = 256;

    /**
     * @brief Constructs a module definition with a given name.
     * @throws std::invalid_argument if `name` is empty.
     * @throws std::length_error     if `name.size() > MAX_MODULE_NAME_LEN`.
     */
    explicit ModuleDef(std::string_view name);
    ~ModuleDef();

    ModuleDef(ModuleDef &&other) noexcept;
    ModuleDef &operator=(ModuleDef &&other) noexcept;
    ModuleDef(const ModuleDef &) = delete;
    ModuleDef &operator=(const ModuleDef &) = delete;

    /**
     * @brief Declares a dependency on another module.
     *
     * The named module is started before this one and shut down after it. An empty
     * name is ignored.
     */
    void add_dependency(std::string_view dependency_name);

    void set_startup(LifecycleCallback startup_func);

    /**
     * @brief Sets the shutdown callback.
     * @param timeout Maximum time allowed for the callback. `0` runs it inline with
     *                no limit.
     */
    void set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout);

  private:
    friend class LifecycleManager;
    std::unique_ptr<ModuleDefImpl> pImpl;
};

} // namespace federator::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
