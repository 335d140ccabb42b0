/**
 * @file test_lifecycle.cpp
 * @brief Layer 2 tests for LifecycleManager and LifecycleGuard.
 *
 * ModuleDef argument validation runs in-process. Anything that registers or
 * starts modules touches the process-wide manager and runs in a worker.
 */
#include "test_patterns.h"
#include "lifecycle_workers.h"
#include "fed_service.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace federator::tests;
using federator::utils::ModuleDef;

class ModuleDefTest : public PureApiTest
{
};

TEST_F(ModuleDefTest, RejectsEmptyName)
{
    EXPECT_THROW({ ModuleDef def(""); }, std::invalid_argument);
}

TEST_F(ModuleDefTest, RejectsNameExceedingMaxLength)
{
    const std::string name(ModuleDef::MAX_MODULE_NAME_LEN + 1, 'm');
    EXPECT_THROW({ ModuleDef def(name); }, std::length_error);
}

TEST_F(ModuleDefTest, AcceptsNameAtMaxLength)
{
    const std::string name(ModuleDef::MAX_MODULE_NAME_LEN, 'm');
    EXPECT_NO_THROW({ ModuleDef def(name); });
}

TEST_F(ModuleDefTest, AddDependencyIgnoresEmpty)
{
    ModuleDef def("with-deps");
    EXPECT_NO_THROW(def.add_dependency(""));
}

class LifecycleTest : public IsolatedProcessTest
{
};

TEST_F(LifecycleTest, MultipleGuardsOnlyFirstOwns)
{
    auto w = SpawnWorker("lifecycle.multiple_guards");
    ExpectWorkerOk(w);
}

TEST_F(LifecycleTest, DependencyOrder)
{
    auto w = SpawnWorker("lifecycle.dependency_order");
    ExpectWorkerOk(w);
}

TEST_F(LifecycleTest, IsInitializedFlag)
{
    auto w = SpawnWorker("lifecycle.is_initialized_flag");
    ExpectWorkerOk(w);
}

TEST_F(LifecycleTest, RegisterAfterInitThrows)
{
    auto w = SpawnWorker("lifecycle.register_after_init");
    ExpectWorkerOk(w);
}

TEST_F(LifecycleTest, DuplicateModuleThrows)
{
    auto w = SpawnWorker("lifecycle.duplicate_module");
    ExpectWorkerOk(w);
}

TEST_F(LifecycleTest, UnresolvedDependencyThrows)
{
    auto w = SpawnWorker("lifecycle.unresolved_dependency");
    ExpectWorkerOk(w);
}

TEST_F(LifecycleTest, CircularDependencyThrows)
{
    auto w = SpawnWorker("lifecycle.circular_dependency");
    ExpectWorkerOk(w);
}

TEST_F(LifecycleTest, StartupFailureRollsBackStartedModules)
{
    auto w = SpawnWorker("lifecycle.startup_failure");
    ExpectWorkerOk(w, {"startup failed"});
}

TEST_F(LifecycleTest, FinalizeIdempotency)
{
    auto w = SpawnWorker("lifecycle.finalize_idempotency");
    ExpectWorkerOk(w);
}

TEST_F(LifecycleTest, ShutdownTimeoutDetachesThread)
{
    auto w = SpawnWorker("lifecycle.shutdown_timeout");
    ExpectWorkerOk(w, {"shutdown TIMEOUT"});
}
