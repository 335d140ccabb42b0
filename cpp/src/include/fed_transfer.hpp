#pragma once
/**
 * @file fed_transfer.hpp
 * @brief Layer 3: The federator data plane built on fed_service.
 *
 * Provides the record consumer, the security-label access filter, the chunk
 * streamer and its sinks, offset stores, transfer sessions, and the ZeroMQ
 * server and client that carry them.
 */
#include "fed_service.hpp"

#include <nlohmann/json.hpp>

#include "transfer/errors.hpp"
#include "transfer/security_label.hpp"
#include "transfer/access_filter.hpp"
#include "transfer/event_source.hpp"
#include "transfer/record_consumer.hpp"
#include "transfer/offset_store.hpp"
#include "transfer/transfer_chunk.hpp"
#include "transfer/chunk_sink.hpp"
#include "transfer/chunk_streamer.hpp"
#include "transfer/chunk_assembler.hpp"
#include "transfer/file_provider.hpp"
#include "transfer/transfer_session.hpp"
#include "transfer/federator_config.hpp"
#include "transfer/transfer_server.hpp"
#include "transfer/transfer_client.hpp"
