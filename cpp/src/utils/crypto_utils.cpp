/**
 * @file crypto_utils.cpp
 * @brief Implementation of cryptographic utilities using libsodium.
 */
#include "utils/crypto_utils.hpp"
#include "fed_service.hpp"

#include <sodium.h>

#include <chrono>
#include <cstring>
#include <stdexcept>

namespace federator::crypto
{

// ============================================================================
// Libsodium Initialization (Internal)
// ============================================================================

namespace
{
std::atomic<bool> g_sodium_initialized{false};

/**
 * @brief Ensures libsodium is initialized, calling sodium_init() if needed.
 * @return True if libsodium is usable.
 */
bool ensure_sodium_init() noexcept
{
    if (g_sodium_initialized.load(std::memory_order_acquire))
    {
        return true;
    }

    // sodium_init() is thread-safe and idempotent: 0 on first init, 1 if already done.
    const int result = sodium_init();
    if (result == -1)
    {
        LOGGER_ERROR("[CryptoUtils] FATAL: sodium_init() failed!");
        return false;
    }

    g_sodium_initialized.store(true, std::memory_order_release);
    if (result == 0)
    {
        LOGGER_INFO("[CryptoUtils] libsodium initialized successfully");
    }
    return true;
}

} // anonymous namespace

// ============================================================================
// SHA-256
// ============================================================================

struct Sha256Stream::State
{
    crypto_hash_sha256_state st;
};

Sha256Stream::Sha256Stream() : m_state(std::make_unique<State>())
{
    if (!ensure_sodium_init())
    {
        throw std::runtime_error("Sha256Stream: libsodium is not available");
    }
    crypto_hash_sha256_init(&m_state->st);
}

Sha256Stream::~Sha256Stream() = default;
Sha256Stream::Sha256Stream(Sha256Stream &&) noexcept = default;
Sha256Stream &Sha256Stream::operator=(Sha256Stream &&) noexcept = default;

void Sha256Stream::update(const void *data, size_t len) noexcept
{
    if (len == 0)
    {
        return;
    }
    crypto_hash_sha256_update(&m_state->st, static_cast<const unsigned char *>(data),
                              static_cast<unsigned long long>(len));
    m_bytes += len;
}

Sha256Digest Sha256Stream::finish() noexcept
{
    Sha256Digest digest{};
    crypto_hash_sha256_final(&m_state->st, digest.data());
    crypto_hash_sha256_init(&m_state->st);
    m_bytes = 0;
    return digest;
}

std::string Sha256Stream::finish_base64()
{
    const auto digest = finish();
    return base64_encode(digest.data(), digest.size());
}

bool compute_sha256(Sha256Digest &out, const void *data, size_t len) noexcept
{
    out.fill(0);
    if (!ensure_sodium_init())
    {
        return false;
    }
    if (data == nullptr && len != 0)
    {
        LOGGER_ERROR("[CryptoUtils] compute_sha256: null data pointer with length {}", len);
        return false;
    }
    static constexpr unsigned char kEmpty = 0;
    const auto *bytes = (len == 0) ? &kEmpty : static_cast<const unsigned char *>(data);
    return crypto_hash_sha256(out.data(), bytes, static_cast<unsigned long long>(len)) == 0;
}

std::string sha256_base64(std::string_view data)
{
    Sha256Digest digest{};
    if (!compute_sha256(digest, data.data(), data.size()))
    {
        throw std::runtime_error("sha256_base64: libsodium is not available");
    }
    return base64_encode(digest.data(), digest.size());
}

// ============================================================================
// Encoding and comparison
// ============================================================================

std::string base64_encode(const uint8_t *data, size_t len)
{
    if (!ensure_sodium_init())
    {
        throw std::runtime_error("base64_encode: libsodium is not available");
    }
    const size_t encoded_len = sodium_base64_ENCODED_LEN(len, sodium_base64_VARIANT_ORIGINAL);
    std::string out(encoded_len, '\0');
    sodium_bin2base64(out.data(), encoded_len, data, len, sodium_base64_VARIANT_ORIGINAL);
    // encoded_len includes the terminating NUL.
    out.resize(encoded_len - 1);
    return out;
}

bool checksum_equals(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }
    if (a.empty())
    {
        return true;
    }
    if (!ensure_sodium_init())
    {
        return a == b;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

// ============================================================================
// Random Number Generation
// ============================================================================

uint64_t generate_random_u64() noexcept
{
    uint64_t value = 0;
    if (!ensure_sodium_init())
    {
        LOGGER_ERROR("[CryptoUtils] Cannot generate random bytes, libsodium not initialized!");
        return value;
    }
    randombytes_buf(&value, sizeof(value));
    return value;
}

// ============================================================================
// Lifecycle Integration
// ============================================================================

namespace
{

void crypto_startup(const char *arg)
{
    (void)arg;
    LOGGER_DEBUG("[CryptoUtils] Module starting up...");
    if (!ensure_sodium_init())
    {
        throw std::runtime_error("CryptoUtils: failed to initialize libsodium");
    }
    LOGGER_INFO("[CryptoUtils] Module initialized successfully");
}

void crypto_shutdown(const char *arg)
{
    (void)arg;
    // libsodium needs no explicit cleanup.
    g_sodium_initialized.store(false, std::memory_order_release);
    LOGGER_INFO("[CryptoUtils] Module shutdown complete");
}

} // anonymous namespace

federator::utils::ModuleDef GetLifecycleModule()
{
    federator::utils::ModuleDef module("CryptoUtils");
    module.add_dependency("federator::utils::Logger");
    module.set_startup(crypto_startup);
    module.set_shutdown(crypto_shutdown, std::chrono::milliseconds(1000));
    return module;
}

} // namespace federator::crypto
