#pragma once
/**
 * @file offset_store.hpp
 * @brief Durable `(client, topic) -> last delivered offset` cursors.
 *
 * A stored value is the offset of the last delivered record, so a session
 * resumes at `stored + 1`, or at 0 when nothing is stored. Implementations are
 * safe for concurrent use by many sessions.
 */
#include "federator_utils_export.h"
#include "transfer/errors.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace federator::transfer
{

class FEDERATOR_UTILS_EXPORT OffsetStore
{
  public:
    virtual ~OffsetStore() = default;

    /// Stored offset, or nullopt when nothing was ever stored for the key.
    [[nodiscard]] virtual TransferResult<std::optional<int64_t>>
    find_offset(const std::string &client, const std::string &topic) = 0;

    virtual TransferVoid set_offset(const std::string &client, const std::string &topic,
                                    int64_t offset) = 0;

    /// Stored offset, 0 when absent.
    [[nodiscard]] TransferResult<int64_t> get_offset(const std::string &client,
                                                     const std::string &topic);

    /// First offset a new session should request: stored + 1, or 0 when absent.
    [[nodiscard]] TransferResult<int64_t> resume_offset(const std::string &client,
                                                        const std::string &topic);
};

class FEDERATOR_UTILS_EXPORT InMemoryOffsetStore : public OffsetStore
{
  public:
    TransferResult<std::optional<int64_t>> find_offset(const std::string &client,
                                                       const std::string &topic) override;
    TransferVoid set_offset(const std::string &client, const std::string &topic,
                            int64_t offset) override;

  private:
    std::mutex m_mutex;
    std::map<std::pair<std::string, std::string>, int64_t> m_offsets;
};

/**
 * @class JsonFileOffsetStore
 * @brief Offsets kept in one JSON document: `{"offsets": {"<client>": {"<topic>": N}}}`.
 *
 * Every `set_offset` rewrites the document to `<path>.tmp` and renames it over
 * `<path>`, so a crash leaves either the old or the new document.
 */
class FEDERATOR_UTILS_EXPORT JsonFileOffsetStore : public OffsetStore
{
  public:
    /// Loads @p path if it exists. A missing file is an empty store.
    [[nodiscard]] static TransferResult<std::unique_ptr<JsonFileOffsetStore>>
    open(const std::filesystem::path &path);

    TransferResult<std::optional<int64_t>> find_offset(const std::string &client,
                                                       const std::string &topic) override;
    TransferVoid set_offset(const std::string &client, const std::string &topic,
                            int64_t offset) override;

    [[nodiscard]] const std::filesystem::path &path() const noexcept { return m_path; }

  private:
    struct PrivateTag
    {
        explicit PrivateTag() = default;
    };

  public:
    /// Use open().
    JsonFileOffsetStore(PrivateTag, std::filesystem::path path) : m_path(std::move(path)) {}

  private:
    TransferVoid write_locked() const;

    std::filesystem::path m_path;
    std::mutex m_mutex;
    std::map<std::string, std::map<std::string, int64_t>> m_offsets;
};

} // namespace federator::transfer

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
