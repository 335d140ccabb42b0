// tests/test_layer2_service/workers/crypto_workers.cpp
#include "crypto_workers.h"
#include "shared_test_helpers.h"
#include "test_entrypoint.h"
#include "fed_service.hpp"

#include <gtest/gtest.h>

#include <mutex>
#include <set>
#include <string>
#include <string_view>

using namespace federator::crypto;
using namespace federator::tests::helper;

namespace federator::tests::worker::crypto
{

static auto logger_module()
{
    return federator::utils::Logger::GetLifecycleModule();
}

static auto crypto_module()
{
    return federator::crypto::GetLifecycleModule();
}

int sha256_known_vectors()
{
    return run_gtest_worker(
        []()
        {
            EXPECT_EQ(sha256_base64(""), "47DEQpj8HBSa+/TImW+5JCeuQeRkm5NMpJWZG3hSuFU=");
            EXPECT_EQ(sha256_base64("abc"), "ungWv48Bz+pBQUDeXa4iI7ADYaOWF3qctBD/YfIAFa0=");

            Sha256Digest digest{};
            const std::string input = "abc";
            ASSERT_TRUE(compute_sha256(digest, input.data(), input.size()));
            EXPECT_EQ(digest[0], 0xba);
            EXPECT_EQ(digest[31], 0xad);
        },
        "crypto.sha256_known_vectors", logger_module(), crypto_module());
}

int sha256_stream_matches_oneshot()
{
    return run_gtest_worker(
        []()
        {
            std::string data;
            for (int i = 0; i < 5000; ++i)
                data.push_back(static_cast<char>('a' + (i % 26)));

            Sha256Stream stream;
            for (size_t pos = 0; pos < data.size(); pos += 777)
                stream.update(std::string_view(data).substr(pos, 777));
            EXPECT_EQ(stream.bytes_hashed(), data.size());
            EXPECT_EQ(stream.finish_base64(), sha256_base64(data));
        },
        "crypto.sha256_stream_matches_oneshot", logger_module(), crypto_module());
}

int sha256_stream_reusable_after_finish()
{
    return run_gtest_worker(
        []()
        {
            Sha256Stream stream;
            stream.update("first resource");
            (void)stream.finish();
            EXPECT_EQ(stream.bytes_hashed(), 0u);

            stream.update("abc");
            EXPECT_EQ(stream.finish_base64(), sha256_base64("abc"));
        },
        "crypto.sha256_stream_reusable_after_finish", logger_module(), crypto_module());
}

int base64_padding()
{
    return run_gtest_worker(
        []()
        {
            const uint8_t bytes[] = {'f', 'o', 'o', 'b', 'a', 'r'};
            EXPECT_EQ(base64_encode(bytes, 0), "");
            EXPECT_EQ(base64_encode(bytes, 1), "Zg==");
            EXPECT_EQ(base64_encode(bytes, 2), "Zm8=");
            EXPECT_EQ(base64_encode(bytes, 3), "Zm9v");
            EXPECT_EQ(base64_encode(bytes, 6), "Zm9vYmFy");
        },
        "crypto.base64_padding", logger_module(), crypto_module());
}

int checksum_equals_semantics()
{
    return run_gtest_worker(
        []()
        {
            const std::string a = sha256_base64("payload");
            EXPECT_TRUE(checksum_equals(a, sha256_base64("payload")));
            EXPECT_FALSE(checksum_equals(a, sha256_base64("payload!")));
            EXPECT_FALSE(checksum_equals(a, a.substr(0, a.size() - 1)));
            EXPECT_TRUE(checksum_equals("", ""));
        },
        "crypto.checksum_equals_semantics", logger_module(), crypto_module());
}

int random_u64_unique()
{
    return run_gtest_worker(
        []()
        {
            std::set<uint64_t> seen;
            for (int i = 0; i < 1000; ++i)
                seen.insert(generate_random_u64());
            EXPECT_EQ(seen.size(), 1000u);
        },
        "crypto.random_u64_unique", logger_module(), crypto_module());
}

int random_is_thread_safe()
{
    return run_gtest_worker(
        []()
        {
            std::mutex mu;
            std::set<uint64_t> seen;
            ThreadRacer racer(8);
            const bool ok = racer.race(
                [&](int)
                {
                    for (int i = 0; i < 250; ++i)
                    {
                        const uint64_t v = generate_random_u64();
                        std::lock_guard<std::mutex> lock(mu);
                        seen.insert(v);
                    }
                });
            ASSERT_TRUE(ok);
            EXPECT_EQ(seen.size(), 2000u);
        },
        "crypto.random_is_thread_safe", logger_module(), crypto_module());
}

int lifecycle_module_started()
{
    return run_gtest_worker(
        []()
        {
            EXPECT_TRUE(federator::utils::IsAppInitialized());
            EXPECT_TRUE(
                federator::utils::LifecycleManager::instance().is_module_started("CryptoUtils"));
            EXPECT_FALSE(sha256_base64("after init").empty());
        },
        "crypto.lifecycle_module_started", logger_module(), crypto_module());
}

} // namespace federator::tests::worker::crypto

namespace
{
struct CryptoWorkerRegistrar
{
    CryptoWorkerRegistrar()
    {
        register_worker_dispatcher(
            [](int argc, char **argv) -> int
            {
                if (argc < 2)
                    return -1;
                std::string_view mode = argv[1];
                auto dot = mode.find('.');
                if (dot == std::string_view::npos || mode.substr(0, dot) != "crypto")
                    return -1;
                std::string scenario(mode.substr(dot + 1));
                using namespace federator::tests::worker::crypto;
                if (scenario == "sha256_known_vectors")
                    return sha256_known_vectors();
                if (scenario == "sha256_stream_matches_oneshot")
                    return sha256_stream_matches_oneshot();
                if (scenario == "sha256_stream_reusable_after_finish")
                    return sha256_stream_reusable_after_finish();
                if (scenario == "base64_padding")
                    return base64_padding();
                if (scenario == "checksum_equals_semantics")
                    return checksum_equals_semantics();
                if (scenario == "random_u64_unique")
                    return random_u64_unique();
                if (scenario == "random_thread_safe")
                    return random_is_thread_safe();
                if (scenario == "lifecycle_module_started")
                    return lifecycle_module_started();
                fmt::print(stderr, "ERROR: Unknown crypto scenario '{}'\n", scenario);
                return 1;
            });
    }
};
static CryptoWorkerRegistrar g_crypto_registrar;
} // namespace
