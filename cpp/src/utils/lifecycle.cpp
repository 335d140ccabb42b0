/*******************************************************************************
 * @file lifecycle.cpp
 * @brief Implementation of the dependency-ordered LifecycleManager.
 *
 * Startup: the static module graph is sorted topologically (Kahn's algorithm) and
 * each startup callback runs on the calling thread. A startup callback that throws
 * stops the sequence; modules already started are shut down again before the
 * exception is rethrown to the caller.
 *
 * Shutdown: modules are stopped in reverse startup order. Each shutdown callback
 * with a non-zero timeout runs on its own thread; if it misses the deadline the
 * thread is detached and finalize() moves on.
 ******************************************************************************/
#include "fed_service.hpp"

#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include <fmt/ranges.h>

namespace federator::utils
{

// ============================================================================
// ModuleDef
// ============================================================================

struct ModuleStep
{
    LifecycleCallback func{nullptr};
    std::chrono::milliseconds timeout{0};
};

class ModuleDefImpl
{
  public:
    std::string name;
    std::vector<std::string> dependencies;
    ModuleStep startup;
    ModuleStep shutdown;
};

ModuleDef::ModuleDef(std::string_view name) : pImpl(std::make_unique<ModuleDefImpl>())
{
    if (name.empty())
    {
        throw std::invalid_argument("ModuleDef: module name must not be empty");
    }
    if (name.size() > MAX_MODULE_NAME_LEN)
    {
        throw std::length_error(
            fmt::format("ModuleDef: module name exceeds {} characters", MAX_MODULE_NAME_LEN));
    }
    pImpl->name = std::string(name);
}

ModuleDef::~ModuleDef() = default;
ModuleDef::ModuleDef(ModuleDef &&other) noexcept = default;
ModuleDef &ModuleDef::operator=(ModuleDef &&other) noexcept = default;

void ModuleDef::add_dependency(std::string_view dependency_name)
{
    if (dependency_name.empty())
    {
        return;
    }
    if (dependency_name.size() > MAX_MODULE_NAME_LEN)
    {
        throw std::length_error(fmt::format("ModuleDef: dependency name exceeds {} characters",
                                            MAX_MODULE_NAME_LEN));
    }
    pImpl->dependencies.emplace_back(dependency_name);
}

void ModuleDef::set_startup(LifecycleCallback startup_func)
{
    pImpl->startup.func = startup_func;
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout)
{
    pImpl->shutdown.func = shutdown_func;
    pImpl->shutdown.timeout = timeout;
}

// ============================================================================
// Timed shutdown helper
// ============================================================================

namespace
{

struct ShutdownOutcome
{
    bool success;
    bool timed_out;
    std::string exception_msg;
};

struct ShutdownState
{
    std::atomic<bool> completed{false};
    std::string exception_msg;
};

ShutdownOutcome run_callback_inline(LifecycleCallback func)
{
    try
    {
        func(nullptr);
    }
    catch (const std::exception &e)
    {
        return {false, false, e.what()};
    }
    return {true, false, {}};
}

// The state is shared with the worker so a detached thread never touches a dead frame.
ShutdownOutcome timed_shutdown(LifecycleCallback func, std::chrono::milliseconds timeout)
{
    if (func == nullptr)
    {
        return {true, false, {}};
    }
    if (timeout.count() == 0)
    {
        return run_callback_inline(func);
    }

    auto state = std::make_shared<ShutdownState>();
    std::thread thread(
        [func, state]()
        {
            try
            {
                func(nullptr);
            }
            catch (const std::exception &e)
            {
                state->exception_msg = e.what();
            }
            state->completed.store(true, std::memory_order_release);
        });

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!state->completed.load(std::memory_order_acquire))
    {
        if (std::chrono::steady_clock::now() >= deadline)
        {
            thread.detach();
            return {false, true, {}};
        }
        constexpr std::chrono::milliseconds kPollInterval(10);
        std::this_thread::sleep_for(kPollInterval);
    }
    thread.join();

    if (!state->exception_msg.empty())
    {
        return {false, false, state->exception_msg};
    }
    return {true, false, {}};
}

} // namespace

// ============================================================================
// LifecycleManagerImpl
// ============================================================================

class LifecycleManagerImpl
{
  public:
    mutable std::mutex mu;
    std::map<std::string, ModuleDefImpl> modules;
    std::vector<std::string> started; // in startup order
    bool initialized{false};
    bool finalized{false};

    std::vector<std::string> startup_order() const
    {
        std::map<std::string, size_t> in_degree;
        std::map<std::string, std::vector<std::string>> dependents;
        for (const auto &[name, def] : modules)
        {
            in_degree.emplace(name, 0);
        }
        for (const auto &[name, def] : modules)
        {
            for (const auto &dep : def.dependencies)
            {
                if (!modules.contains(dep))
                {
                    throw std::runtime_error(fmt::format(
                        "Module '{}' depends on unregistered module '{}'", name, dep));
                }
                dependents[dep].push_back(name);
                in_degree[name]++;
            }
        }

        std::vector<std::string> queue;
        for (const auto &[name, degree] : in_degree)
        {
            if (degree == 0)
            {
                queue.push_back(name);
            }
        }
        std::vector<std::string> order;
        size_t head = 0;
        while (head < queue.size())
        {
            const std::string current = queue[head++];
            order.push_back(current);
            for (const auto &dependent : dependents[current])
            {
                if (--in_degree[dependent] == 0)
                {
                    queue.push_back(dependent);
                }
            }
        }
        if (order.size() != modules.size())
        {
            std::vector<std::string> cycle_nodes;
            for (const auto &[name, degree] : in_degree)
            {
                if (degree > 0)
                {
                    cycle_nodes.push_back(name);
                }
            }
            throw std::runtime_error("Circular dependency detected involving: " +
                                     fmt::format("{}", fmt::join(cycle_nodes, ", ")));
        }
        return order;
    }

    // Caller holds mu.
    void shutdown_started()
    {
        while (!started.empty())
        {
            const std::string name = started.back();
            started.pop_back();
            const auto &def = modules.at(name);
            auto outcome = timed_shutdown(def.shutdown.func, def.shutdown.timeout);
            if (outcome.timed_out)
            {
                fmt::print(stderr, "[FED_LifeCycle] Module '{}' shutdown TIMEOUT ({}ms). Thread detached.\n",
                           name, def.shutdown.timeout.count());
            }
            else if (!outcome.success)
            {
                fmt::print(stderr, "[FED_LifeCycle] Module '{}' shutdown failed: {}\n", name,
                           outcome.exception_msg);
            }
            else
            {
                FED_DEBUG("[FED_LifeCycle] Module '{}' shut down.", name);
            }
        }
    }
};

// ============================================================================
// LifecycleManager
// ============================================================================

LifecycleManager::LifecycleManager() : pImpl(std::make_unique<LifecycleManagerImpl>()) {}
LifecycleManager::~LifecycleManager() = default;

LifecycleManager &LifecycleManager::instance()
{
    static LifecycleManager instance;
    return instance;
}

void LifecycleManager::register_module(ModuleDef &&module_def)
{
    std::lock_guard<std::mutex> lock(pImpl->mu);
    if (pImpl->initialized)
    {
        throw std::logic_error("LifecycleManager: cannot register modules after initialization");
    }
    auto impl = std::move(module_def.pImpl);
    if (!impl)
    {
        throw std::invalid_argument("LifecycleManager: moved-from ModuleDef");
    }
    const std::string name = impl->name;
    if (!pImpl->modules.emplace(name, std::move(*impl)).second)
    {
        throw std::logic_error(fmt::format("LifecycleManager: duplicate module '{}'", name));
    }
}

void LifecycleManager::initialize(std::source_location loc)
{
    std::lock_guard<std::mutex> lock(pImpl->mu);
    if (pImpl->initialized)
    {
        return;
    }
    FED_DEBUG("[FED_LifeCycle] initialize() called from {}", SRCLOC_TO_STR(loc));
    (void)loc;

    const auto order = pImpl->startup_order();
    pImpl->initialized = true;
    for (const auto &name : order)
    {
        const auto &def = pImpl->modules.at(name);
        try
        {
            if (def.startup.func != nullptr)
            {
                def.startup.func(nullptr);
            }
        }
        catch (const std::exception &e)
        {
            fmt::print(stderr, "[FED_LifeCycle] Module '{}' startup failed: {}\n", name, e.what());
            pImpl->shutdown_started();
            pImpl->finalized = true;
            throw;
        }
        pImpl->started.push_back(name);
        FED_DEBUG("[FED_LifeCycle] Module '{}' started.", name);
    }
}

void LifecycleManager::finalize(std::source_location loc)
{
    std::lock_guard<std::mutex> lock(pImpl->mu);
    if (!pImpl->initialized || pImpl->finalized)
    {
        return;
    }
    FED_DEBUG("[FED_LifeCycle] finalize() called from {}", SRCLOC_TO_STR(loc));
    (void)loc;
    pImpl->shutdown_started();
    pImpl->finalized = true;
}

bool LifecycleManager::is_initialized() const noexcept
{
    std::lock_guard<std::mutex> lock(pImpl->mu);
    return pImpl->initialized;
}

bool LifecycleManager::is_finalized() const noexcept
{
    std::lock_guard<std::mutex> lock(pImpl->mu);
    return pImpl->finalized;
}

bool LifecycleManager::is_module_started(std::string_view name) const
{
    std::lock_guard<std::mutex> lock(pImpl->mu);
    return std::find(pImpl->started.begin(), pImpl->started.end(), name) != pImpl->started.end();
}

} // namespace federator::utils
