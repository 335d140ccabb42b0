#pragma once
/**
 * @file zmq_context.hpp
 * @brief Shared ZeroMQ context as a named lifecycle module.
 *
 * Every ZMQ socket in the process (control ROUTER/DEALER, data PUSH/PULL) is
 * created from this one context. Register `GetZMQContextModule()` in the
 * LifecycleGuard, then call `get_zmq_context()`.
 */
#include "federator_utils_export.h"

#include <zmq.hpp>

#include "utils/module_def.hpp"

namespace federator::utils
{

/**
 * @brief Returns the process-wide ZeroMQ context.
 * @throws std::logic_error if the ZMQContext module has not been started.
 */
[[nodiscard]] FEDERATOR_UTILS_EXPORT zmq::context_t &get_zmq_context();

/** @brief Creates the context. Idempotent. */
FEDERATOR_UTILS_EXPORT void zmq_context_startup();

/** @brief Destroys the context; blocks until every socket created from it is closed. */
FEDERATOR_UTILS_EXPORT void zmq_context_shutdown();

FEDERATOR_UTILS_EXPORT ModuleDef GetZMQContextModule();

} // namespace federator::utils
