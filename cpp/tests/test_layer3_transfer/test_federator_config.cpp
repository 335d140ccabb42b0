/**
 * @file test_federator_config.cpp
 * @brief FederatorConfig parsing, validation and the factories built on it.
 */
#include "shared_test_helpers.h"
#include "test_patterns.h"
#include "fed_transfer.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <string>

using namespace federator::transfer;
using namespace std::chrono_literals;
using federator::tests::helper::ScratchDir;
using federator::tests::helper::write_file;
using ::testing::HasSubstr;
using nlohmann::json;

class FederatorConfigTest : public federator::tests::PureApiTest
{
};

TEST_F(FederatorConfigTest, EmptyObjectGivesValidDefaults)
{
    auto cfg = FederatorConfig::from_json(json::object());
    ASSERT_TRUE(cfg.is_ok()) << cfg.error_message();
    const auto &c = cfg.content();
    EXPECT_EQ(c.stream.chunk_size, 1000000u);
    EXPECT_EQ(c.stream.poll_interval, 2000ms);
    EXPECT_EQ(c.stream.idle_timeout, 30000ms);
    EXPECT_EQ(c.topics.source, EventSourceKind::Journal);
    EXPECT_EQ(c.offsets.store, OffsetStoreKind::Memory);
    EXPECT_EQ(c.logging.level, "info");
    EXPECT_TRUE(c.clients.empty());
}

TEST_F(FederatorConfigTest, ReadsEverySection)
{
    const json doc = json::parse(R"({
        "server": {"control_endpoint": "tcp://127.0.0.1:7000", "data_bind_host": "127.0.0.1",
                   "send_timeout_ms": 500},
        "stream": {"chunk_size": 4096, "poll_interval_ms": 50, "idle_timeout_ms": 400},
        "topics": {"source": "memory"},
        "files": {"local_root": "/srv/files", "object_store_a_root": "/srv/a"},
        "offsets": {"store": "FILE", "path": "/var/lib/fed/offsets.json"},
        "clients": {
            "client-a": {"topics": {"orders": {"nationality": ["gbr", "fra"]},
                                     "files": {}}},
            "client-b": {}
        },
        "client": {"id": "client-a", "server_endpoint": "tcp://10.0.0.1:7000",
                   "request_timeout_ms": 1500, "stream_timeout_ms": 9000},
        "logging": {"level": "debug", "file": "/tmp/fed.log"}
    })");
    auto parsed = FederatorConfig::from_json(doc);
    ASSERT_TRUE(parsed.is_ok()) << parsed.error_message();
    const auto &c = parsed.content();

    EXPECT_EQ(c.server.control_endpoint, "tcp://127.0.0.1:7000");
    EXPECT_EQ(c.server.send_timeout, 500ms);
    EXPECT_EQ(c.stream.chunk_size, 4096u);
    EXPECT_EQ(c.topics.source, EventSourceKind::Memory);
    EXPECT_EQ(c.files.local_root, "/srv/files");
    EXPECT_TRUE(c.files.object_store_b_root.empty());
    EXPECT_EQ(c.offsets.store, OffsetStoreKind::File);
    EXPECT_EQ(c.client.id, "client-a");
    EXPECT_EQ(c.client.stream_timeout, 9000ms);
    EXPECT_EQ(c.logging.file, "/tmp/fed.log");

    const auto settings = c.session_settings();
    EXPECT_EQ(settings.chunk_size, 4096u);
    EXPECT_EQ(settings.poll_interval, 50ms);
    EXPECT_EQ(settings.idle_timeout, 400ms);

    auto grant = c.find_grant("client-a", "orders");
    ASSERT_TRUE(grant.has_value());
    EXPECT_THAT(grant->requirements().at("NATIONALITY"), ::testing::ElementsAre("FRA", "GBR"));
    auto open_grant = c.find_grant("client-a", "files");
    ASSERT_TRUE(open_grant.has_value());
    EXPECT_TRUE(open_grant->requires_nothing());
    EXPECT_FALSE(c.find_grant("client-a", "payroll").has_value());
    EXPECT_FALSE(c.find_grant("client-b", "orders").has_value());
    EXPECT_FALSE(c.find_grant("stranger", "orders").has_value());
}

TEST_F(FederatorConfigTest, RejectsInvalidValues)
{
    const char *bad_docs[] = {
        R"([1, 2])",
        R"({"stream": {"chunk_size": 0}})",
        R"({"stream": {"chunk_size": -1}})",
        R"({"stream": {"chunk_size": 18446744073709551615}})",
        R"({"stream": {"poll_interval_ms": 0}})",
        R"({"stream": {"poll_interval_ms": 500, "idle_timeout_ms": 100}})",
        R"({"stream": {"chunk_size": "big"}})",
        R"({"topics": {"source": "kafka"}})",
        R"({"topics": {"journal_dir": ""}})",
        R"({"offsets": {"store": "redis"}})",
        R"({"offsets": {"store": "file", "path": ""}})",
        R"({"server": {"control_endpoint": ""}})",
        R"({"client": {"stream_timeout_ms": 10}})",
        R"({"logging": {"level": "loud"}})",
        R"({"clients": {"c": {"topics": {"t": ["GBR"]}}}})",
        R"({"clients": {"c": {"topics": {"t": {"nationality": "GBR"}}}}})",
        R"({"clients": {"c": {"topics": {"t": {"nationality": [1]}}}}})",
    };
    for (const char *text : bad_docs)
    {
        auto parsed = FederatorConfig::from_json(json::parse(text));
        ASSERT_TRUE(parsed.is_error()) << text;
        EXPECT_EQ(parsed.error(), TransferError::Configuration) << text;
    }
}

TEST_F(FederatorConfigTest, NegativeChunkSizeIsNamedInError)
{
    auto parsed = FederatorConfig::from_json(json::parse(R"({"stream": {"chunk_size": -1}})"));
    ASSERT_TRUE(parsed.is_error());
    EXPECT_THAT(parsed.error_message(), HasSubstr("chunk_size must be positive, got -1"));
}

TEST_F(FederatorConfigTest, ValidateRejectsChunkSizeAboveStreamerLimit)
{
    FederatorConfig cfg;
    cfg.stream.chunk_size = ChunkStreamer::kMaxChunkSize + 1;
    auto valid = cfg.validate();
    ASSERT_TRUE(valid.is_error());
    EXPECT_EQ(valid.error(), TransferError::Configuration);

    cfg.stream.chunk_size = ChunkStreamer::kMaxChunkSize;
    EXPECT_TRUE(cfg.validate().is_ok());
}

TEST_F(FederatorConfigTest, LoadReadsFile)
{
    ScratchDir dir("config_load");
    write_file(dir / "fed.json", R"({"client": {"id": "from-file"}, "stream": {"chunk_size": 64}})");
    auto cfg = FederatorConfig::load(dir / "fed.json");
    ASSERT_TRUE(cfg.is_ok()) << cfg.error_message();
    EXPECT_EQ(cfg.content().stream.chunk_size, 64u);
}

TEST_F(FederatorConfigTest, LoadReportsUnreadableOrInvalidFile)
{
    ScratchDir dir("config_bad");
    auto missing = FederatorConfig::load(dir / "absent.json");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error(), TransferError::Configuration);

    write_file(dir / "broken.json", "{ \"stream\": ");
    auto broken = FederatorConfig::load(dir / "broken.json");
    ASSERT_TRUE(broken.is_error());
    EXPECT_THAT(broken.error_message(), HasSubstr("is not valid JSON"));
}

#if defined(FEDERATOR_IS_POSIX)
TEST_F(FederatorConfigTest, EnvironmentOverridesApplyOnlyOnLoad)
{
    ScratchDir dir("config_env");
    write_file(dir / "fed.json", R"({"client": {"id": "from-file"}})");

    ::setenv("FEDERATOR_CLIENT_ID", "from-env", 1);
    ::setenv("FEDERATOR_CONTROL_ENDPOINT", "tcp://192.0.2.1:6000", 1);
    auto restore = federator::basics::make_scope_guard(
        []() noexcept
        {
            ::unsetenv("FEDERATOR_CLIENT_ID");
            ::unsetenv("FEDERATOR_CONTROL_ENDPOINT");
        });

    auto loaded = FederatorConfig::load(dir / "fed.json");
    ASSERT_TRUE(loaded.is_ok()) << loaded.error_message();
    EXPECT_EQ(loaded.content().client.id, "from-env");
    EXPECT_EQ(loaded.content().server.control_endpoint, "tcp://192.0.2.1:6000");
    EXPECT_EQ(loaded.content().client.server_endpoint, "tcp://192.0.2.1:6000");

    auto direct = FederatorConfig::from_json(json::parse(R"({"client": {"id": "from-file"}})"));
    ASSERT_TRUE(direct.is_ok());
    EXPECT_EQ(direct.content().client.id, "from-file");
}
#endif

TEST_F(FederatorConfigTest, ApplyLoggingRejectsUnknownLevel)
{
    LoggingSection logging;
    logging.level = "chatty";
    auto applied = apply_logging(logging);
    ASSERT_TRUE(applied.is_error());
    EXPECT_EQ(applied.error(), TransferError::Configuration);
}
