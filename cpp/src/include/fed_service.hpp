#pragma once
/**
 * @file fed_service.hpp
 * @brief Layer 2: Service modules built on fed_base.
 *
 * Provides lifecycle management, logging, cryptographic utilities and the shared
 * ZeroMQ context. Include this when you need LifecycleGuard, Logger, CryptoUtils
 * or sockets.
 */
#include "fed_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/crypto_utils.hpp"
#include "utils/logger.hpp"
#include "utils/zmq_context.hpp"
