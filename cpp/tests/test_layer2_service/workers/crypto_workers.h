// tests/test_layer2_service/workers/crypto_workers.h
#pragma once
/**
 * @file crypto_workers.h
 * @brief Worker functions for the crypto_utils isolated-process tests.
 */

namespace federator::tests::worker::crypto
{

int sha256_known_vectors();
int sha256_stream_matches_oneshot();
int sha256_stream_reusable_after_finish();
int base64_padding();
int checksum_equals_semantics();
int random_u64_unique();
int random_is_thread_safe();
int lifecycle_module_started();

} // namespace federator::tests::worker::crypto
