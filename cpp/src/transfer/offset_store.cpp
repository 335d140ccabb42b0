#include "transfer/offset_store.hpp"
#include "fed_service.hpp"

#include <nlohmann/json.hpp>

#include <fstream>

namespace federator::transfer
{

TransferResult<int64_t> OffsetStore::get_offset(const std::string &client, const std::string &topic)
{
    auto found = find_offset(client, topic);
    if (found.is_error())
    {
        return found.forward_error<int64_t>();
    }
    return TransferResult<int64_t>::ok(found.content().value_or(0));
}

TransferResult<int64_t> OffsetStore::resume_offset(const std::string &client,
                                                   const std::string &topic)
{
    auto found = find_offset(client, topic);
    if (found.is_error())
    {
        return found.forward_error<int64_t>();
    }
    const auto &last = found.content();
    return TransferResult<int64_t>::ok(last ? *last + 1 : 0);
}

// ============================================================================
// InMemoryOffsetStore
// ============================================================================

TransferResult<std::optional<int64_t>> InMemoryOffsetStore::find_offset(const std::string &client,
                                                                        const std::string &topic)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_offsets.find({client, topic});
    if (it == m_offsets.end())
    {
        return TransferResult<std::optional<int64_t>>::ok(std::nullopt);
    }
    return TransferResult<std::optional<int64_t>>::ok(it->second);
}

TransferVoid InMemoryOffsetStore::set_offset(const std::string &client, const std::string &topic,
                                             int64_t offset)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_offsets[{client, topic}] = offset;
    return transfer_ok();
}

// ============================================================================
// JsonFileOffsetStore
// ============================================================================

TransferResult<std::unique_ptr<JsonFileOffsetStore>>
JsonFileOffsetStore::open(const std::filesystem::path &path)
{
    using R = TransferResult<std::unique_ptr<JsonFileOffsetStore>>;
    if (path.empty())
    {
        return R::error(TransferError::Configuration, "offset store path is empty");
    }

    auto store = std::make_unique<JsonFileOffsetStore>(PrivateTag{}, path);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        LOGGER_INFO("Offset store '{}' does not exist yet; starting empty", path.string());
        return R::ok(std::move(store));
    }

    std::ifstream in(path);
    if (!in)
    {
        return R::error(TransferError::OffsetStore,
                        fmt::format("cannot open offset store '{}'", path.string()));
    }
    try
    {
        const auto doc = nlohmann::json::parse(in);
        if (doc.contains("offsets"))
        {
            for (const auto &[client, topics] : doc.at("offsets").items())
            {
                for (const auto &[topic, value] : topics.items())
                {
                    store->m_offsets[client][topic] = value.get<int64_t>();
                }
            }
        }
    }
    catch (const nlohmann::json::exception &e)
    {
        return R::error(TransferError::OffsetStore,
                        fmt::format("corrupt offset store '{}': {}", path.string(), e.what()));
    }
    return R::ok(std::move(store));
}

TransferResult<std::optional<int64_t>> JsonFileOffsetStore::find_offset(const std::string &client,
                                                                        const std::string &topic)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto client_it = m_offsets.find(client);
    if (client_it == m_offsets.end())
    {
        return TransferResult<std::optional<int64_t>>::ok(std::nullopt);
    }
    auto topic_it = client_it->second.find(topic);
    if (topic_it == client_it->second.end())
    {
        return TransferResult<std::optional<int64_t>>::ok(std::nullopt);
    }
    return TransferResult<std::optional<int64_t>>::ok(topic_it->second);
}

TransferVoid JsonFileOffsetStore::set_offset(const std::string &client, const std::string &topic,
                                             int64_t offset)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto &topics = m_offsets[client];
    auto it = topics.find(topic);
    const std::optional<int64_t> previous =
        it == topics.end() ? std::nullopt : std::optional<int64_t>(it->second);
    topics[topic] = offset;

    // A failed write must not change what find_offset() reports.
    auto rollback = basics::make_scope_guard(
        [&topics, &topic, previous]() noexcept
        {
            if (previous)
            {
                topics[topic] = *previous;
            }
            else
            {
                topics.erase(topic);
            }
        });
    auto written = write_locked();
    if (written.is_ok())
    {
        rollback.dismiss();
    }
    return written;
}

TransferVoid JsonFileOffsetStore::write_locked() const
{
    nlohmann::json doc;
    doc["offsets"] = nlohmann::json::object();
    for (const auto &[client, topics] : m_offsets)
    {
        for (const auto &[topic, value] : topics)
        {
            doc["offsets"][client][topic] = value;
        }
    }

    const auto parent = m_path.parent_path();
    std::error_code ec;
    if (!parent.empty())
    {
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            return TransferVoid::error(TransferError::OffsetStore,
                                       fmt::format("cannot create '{}': {}", parent.string(),
                                                   ec.message()),
                                       ec.value());
        }
    }

    auto tmp = m_path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc);
        out << doc.dump(2) << '\n';
        out.flush();
        if (!out)
        {
            return TransferVoid::error(TransferError::OffsetStore,
                                       fmt::format("cannot write '{}'", tmp.string()));
        }
    }
    std::filesystem::rename(tmp, m_path, ec);
    if (ec)
    {
        return TransferVoid::error(TransferError::OffsetStore,
                                   fmt::format("cannot replace '{}': {}", m_path.string(),
                                               ec.message()),
                                   ec.value());
    }
    return transfer_ok();
}

} // namespace federator::transfer
