/**
 * @file test_offset_store.cpp
 * @brief InMemoryOffsetStore and JsonFileOffsetStore.
 */
#include "shared_test_helpers.h"
#include "test_patterns.h"
#include "fed_transfer.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

using namespace federator::transfer;
using federator::tests::helper::read_file_contents;
using federator::tests::helper::ScratchDir;
using federator::tests::helper::ThreadRacer;
using federator::tests::helper::write_file;

class OffsetStoreTest : public federator::tests::PureApiTest
{
};

TEST_F(OffsetStoreTest, AbsentKeyReadsAsZeroAndResumesAtZero)
{
    InMemoryOffsetStore store;
    EXPECT_FALSE(store.find_offset("c1", "orders").content().has_value());
    EXPECT_EQ(store.get_offset("c1", "orders").content(), 0);
    EXPECT_EQ(store.resume_offset("c1", "orders").content(), 0);
}

TEST_F(OffsetStoreTest, ResumeIsOnePastLastStored)
{
    InMemoryOffsetStore store;
    ASSERT_TRUE(store.set_offset("c1", "orders", 10).is_ok());
    ASSERT_TRUE(store.set_offset("c1", "orders", 11).is_ok());
    EXPECT_EQ(store.get_offset("c1", "orders").content(), 11);
    EXPECT_EQ(store.resume_offset("c1", "orders").content(), 12);
}

TEST_F(OffsetStoreTest, StoredZeroResumesAtOne)
{
    InMemoryOffsetStore store;
    ASSERT_TRUE(store.set_offset("c1", "t", 0).is_ok());
    EXPECT_EQ(store.resume_offset("c1", "t").content(), 1);
}

TEST_F(OffsetStoreTest, KeysAreClientAndTopic)
{
    InMemoryOffsetStore store;
    ASSERT_TRUE(store.set_offset("c1", "orders", 5).is_ok());
    ASSERT_TRUE(store.set_offset("c2", "orders", 9).is_ok());
    ASSERT_TRUE(store.set_offset("c1", "files", 2).is_ok());
    EXPECT_EQ(store.get_offset("c1", "orders").content(), 5);
    EXPECT_EQ(store.get_offset("c2", "orders").content(), 9);
    EXPECT_EQ(store.get_offset("c1", "files").content(), 2);
    EXPECT_EQ(store.get_offset("c2", "files").content(), 0);
}

TEST_F(OffsetStoreTest, ConcurrentWritersOnDistinctKeys)
{
    InMemoryOffsetStore store;
    ThreadRacer racer(8);
    ASSERT_TRUE(racer.race(
        [&](int i)
        {
            const std::string topic = "t" + std::to_string(i);
            for (int64_t off = 0; off < 200; ++off)
                if (store.set_offset("c", topic, off).is_error())
                    throw std::runtime_error("set_offset failed");
        }));
    for (int i = 0; i < 8; ++i)
        EXPECT_EQ(store.get_offset("c", "t" + std::to_string(i)).content(), 199);
}

class JsonFileOffsetStoreTest : public federator::tests::PureApiTest
{
  protected:
    ScratchDir dir{"offsets"};
};

TEST_F(JsonFileOffsetStoreTest, EmptyPathIsConfigurationError)
{
    auto opened = JsonFileOffsetStore::open({});
    ASSERT_TRUE(opened.is_error());
    EXPECT_EQ(opened.error(), TransferError::Configuration);
}

TEST_F(JsonFileOffsetStoreTest, MissingFileStartsEmpty)
{
    auto opened = JsonFileOffsetStore::open(dir / "offsets.json");
    ASSERT_TRUE(opened.is_ok());
    EXPECT_EQ(opened.content()->resume_offset("c", "t").content(), 0);
    EXPECT_FALSE(std::filesystem::exists(dir / "offsets.json"));
}

TEST_F(JsonFileOffsetStoreTest, OffsetsSurviveReopen)
{
    const auto path = dir / "state" / "offsets.json";
    {
        auto store = std::move(JsonFileOffsetStore::open(path)).content();
        ASSERT_TRUE(store->set_offset("client-a", "orders", 41).is_ok());
        ASSERT_TRUE(store->set_offset("client-a", "files", 3).is_ok());
        EXPECT_EQ(store->path(), path);
    }

    std::string text;
    ASSERT_TRUE(read_file_contents(path.string(), text));
    const auto doc = nlohmann::json::parse(text);
    EXPECT_EQ(doc.at("offsets").at("client-a").at("orders"), 41);
    EXPECT_FALSE(std::filesystem::exists(path.string() + ".tmp"));

    auto reopened = std::move(JsonFileOffsetStore::open(path)).content();
    EXPECT_EQ(reopened->resume_offset("client-a", "orders").content(), 42);
    EXPECT_EQ(reopened->get_offset("client-a", "files").content(), 3);
}

TEST_F(JsonFileOffsetStoreTest, CorruptFileIsOffsetStoreError)
{
    write_file(dir / "offsets.json", "{ not json");
    auto opened = JsonFileOffsetStore::open(dir / "offsets.json");
    ASSERT_TRUE(opened.is_error());
    EXPECT_EQ(opened.error(), TransferError::OffsetStore);

    write_file(dir / "typed.json", R"({"offsets": {"c": {"t": "seven"}}})");
    auto typed = JsonFileOffsetStore::open(dir / "typed.json");
    ASSERT_TRUE(typed.is_error());
    EXPECT_EQ(typed.error(), TransferError::OffsetStore);
}

TEST_F(JsonFileOffsetStoreTest, FailedWriteLeavesPreviousValue)
{
    write_file(dir / "blocker", "a file, not a directory");
    auto store = std::move(JsonFileOffsetStore::open(dir / "blocker" / "offsets.json")).content();
    auto stored = store->set_offset("c", "t", 5);
    ASSERT_TRUE(stored.is_error());
    EXPECT_EQ(stored.error(), TransferError::OffsetStore);
    EXPECT_FALSE(store->find_offset("c", "t").content().has_value());
    EXPECT_EQ(store->resume_offset("c", "t").content(), 0);
}

TEST_F(JsonFileOffsetStoreTest, FailedWriteRestoresEarlierOffset)
{
    auto store = std::move(JsonFileOffsetStore::open(dir / "sub" / "offsets.json")).content();
    ASSERT_TRUE(store->set_offset("c", "t", 3).is_ok());

    std::filesystem::remove_all(dir / "sub");
    write_file(dir / "sub", "now a file");
    auto stored = store->set_offset("c", "t", 9);
    ASSERT_TRUE(stored.is_error());
    EXPECT_EQ(store->find_offset("c", "t").content(), std::optional<int64_t>(3));
    EXPECT_EQ(store->resume_offset("c", "t").content(), 4);
}

TEST_F(JsonFileOffsetStoreTest, FactoryFollowsConfiguredKind)
{
    OffsetsSection memory;
    memory.store = OffsetStoreKind::Memory;
    auto mem = make_offset_store(memory);
    ASSERT_TRUE(mem.is_ok());
    EXPECT_NE(dynamic_cast<InMemoryOffsetStore *>(mem.content().get()), nullptr);

    OffsetsSection file;
    file.store = OffsetStoreKind::File;
    file.path = dir / "f.json";
    auto disk = make_offset_store(file);
    ASSERT_TRUE(disk.is_ok());
    EXPECT_NE(dynamic_cast<JsonFileOffsetStore *>(disk.content().get()), nullptr);

    file.path.clear();
    EXPECT_TRUE(make_offset_store(file).is_error());
}
