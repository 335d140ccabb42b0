#pragma once
/**
 * @file crypto_utils.hpp
 * @brief Checksums, encoding and random numbers backed by libsodium.
 *
 * Provides:
 * - SHA-256 over whole buffers and incrementally over a stream of chunks
 * - Standard base64 (RFC 4648, with padding) of digests
 * - Constant-time comparison of checksum strings
 * - Random 64-bit identifiers for transfer sessions
 *
 * libsodium is initialized through the "CryptoUtils" lifecycle module. No
 * libsodium type appears in this header.
 */
#include "federator_utils_export.h"
#include "utils/module_def.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace federator::crypto
{

/** SHA-256 digest size in bytes. */
static constexpr size_t SHA256_HASH_BYTES = 32;

using Sha256Digest = std::array<uint8_t, SHA256_HASH_BYTES>;

/**
 * @class Sha256Stream
 * @brief Incremental SHA-256 over data delivered in pieces.
 *
 * @code
 * federator::crypto::Sha256Stream hash;
 * while (read_chunk(buf)) {
 *     hash.update(buf.data(), buf.size());
 * }
 * std::string checksum = hash.finish_base64();
 * @endcode
 *
 * After `finish()` the stream is reset and may be reused.
 */
class FEDERATOR_UTILS_EXPORT Sha256Stream
{
  public:
    /**
     * @throws std::runtime_error if libsodium cannot be initialized.
     */
    Sha256Stream();
    ~Sha256Stream();

    Sha256Stream(Sha256Stream &&) noexcept;
    Sha256Stream &operator=(Sha256Stream &&) noexcept;
    Sha256Stream(const Sha256Stream &) = delete;
    Sha256Stream &operator=(const Sha256Stream &) = delete;

    void update(const void *data, size_t len) noexcept;
    void update(std::string_view data) noexcept { update(data.data(), data.size()); }

    [[nodiscard]] Sha256Digest finish() noexcept;

    /** @brief `finish()` followed by standard base64 encoding of the digest. */
    [[nodiscard]] std::string finish_base64();

    /** @brief Total number of bytes fed through `update()` since the last reset. */
    [[nodiscard]] uint64_t bytes_hashed() const noexcept { return m_bytes; }

  private:
    struct State;
    std::unique_ptr<State> m_state;
    uint64_t m_bytes{0};
};

/**
 * @brief One-shot SHA-256 of @p data.
 * @return false if libsodium is not usable; @p out is zeroed in that case.
 */
FEDERATOR_UTILS_EXPORT bool compute_sha256(Sha256Digest &out, const void *data,
                                           size_t len) noexcept;

/**
 * @brief One-shot SHA-256 of @p data, base64-encoded.
 * @throws std::runtime_error if libsodium is not usable.
 */
FEDERATOR_UTILS_EXPORT std::string sha256_base64(std::string_view data);

/**
 * @brief Standard base64 with padding of an arbitrary byte buffer.
 */
FEDERATOR_UTILS_EXPORT std::string base64_encode(const uint8_t *data, size_t len);

/**
 * @brief Compares two checksum strings without an early exit on the first
 *        differing byte.
 */
FEDERATOR_UTILS_EXPORT bool checksum_equals(std::string_view a, std::string_view b) noexcept;

/**
 * @brief Cryptographically random 64-bit value (session identifiers).
 */
FEDERATOR_UTILS_EXPORT uint64_t generate_random_u64() noexcept;

/**
 * @brief Lifecycle module "CryptoUtils" that initializes libsodium.
 */
FEDERATOR_UTILS_EXPORT federator::utils::ModuleDef GetLifecycleModule();

} // namespace federator::crypto

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
