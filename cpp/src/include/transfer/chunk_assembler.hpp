#pragma once
/**
 * @file chunk_assembler.hpp
 * @brief Receiver side of the chunk stream.
 *
 * `ChunkAssembler` writes file chunks to `<destination>/.parts/<name>.<seq>.part`
 * as they arrive and hashes them on the way. The terminal chunk triggers the
 * size and checksum checks and a rename to `<destination>/<name>`. Any failure
 * deletes the part file. Resources whose terminal chunk never arrives are
 * removed by `discard_incomplete()`.
 *
 * `RecordCollector` applies the same checks to topic records kept in memory.
 *
 * Neither class is thread-safe; one instance serves one data socket.
 */
#include "federator_utils_export.h"
#include "transfer/errors.hpp"
#include "transfer/transfer_chunk.hpp"
#include "utils/crypto_utils.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <utility>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace federator::transfer
{

/// Final file name for @p resource_name: its basename with unsafe characters replaced.
FEDERATOR_UTILS_EXPORT std::string sanitize_resource_name(const std::string &resource_name,
                                                          int64_t sequence_id);

class FEDERATOR_UTILS_EXPORT ChunkAssembler
{
  public:
    /// Creates @p destination and its `.parts` directory.
    [[nodiscard]] static TransferResult<ChunkAssembler> create(std::filesystem::path destination);

    ChunkAssembler(ChunkAssembler &&) noexcept = default;
    ChunkAssembler &operator=(ChunkAssembler &&) noexcept = default;
    ~ChunkAssembler();

    /**
     * @brief Consumes one chunk.
     *
     * A completed resource is stored as `destination/<sanitized name>`. When that name
     * is already taken by a file this assembler stored for another sequence id, or by
     * a file it did not write, the sequence id is inserted before the extension.
     * @return The final path when @p chunk completed its resource, empty otherwise.
     *         FileIO on a gap in chunk indices, a size or checksum mismatch, or a write failure.
     */
    TransferResult<std::optional<std::filesystem::path>> accept(const TransferChunk &chunk);

    /// Deletes every part file still waiting for its terminal chunk. Returns how many.
    size_t discard_incomplete();

    [[nodiscard]] size_t pending() const noexcept { return m_assemblies.size(); }
    [[nodiscard]] const std::filesystem::path &destination() const noexcept { return m_destination; }

  private:
    struct Assembly
    {
        std::filesystem::path part_file;
        std::ofstream out;
        crypto::Sha256Stream digest;
        int32_t next_index{0};
        int64_t bytes{0};
    };
    using Key = std::pair<std::string, int64_t>;

    explicit ChunkAssembler(std::filesystem::path destination)
        : m_destination(std::move(destination))
    {
    }

    TransferResult<std::optional<std::filesystem::path>> fail(const Key &key, std::string message);
    std::filesystem::path final_path_for(const std::string &safe_name, int64_t sequence_id);

    std::filesystem::path m_destination;
    std::map<Key, Assembly> m_assemblies;
    std::map<std::string, int64_t> m_stored_names; // final file name -> sequence id
};

struct ReceivedRecord
{
    int64_t sequence_id{0};
    std::string resource_name;
    std::string payload;
};

class FEDERATOR_UTILS_EXPORT RecordCollector
{
  public:
    /// Same contract as ChunkAssembler::accept(), with the payload returned instead of a path.
    TransferResult<std::optional<ReceivedRecord>> accept(const TransferChunk &chunk);

    size_t discard_incomplete();
    [[nodiscard]] size_t pending() const noexcept { return m_partial.size(); }

  private:
    struct Partial
    {
        std::string data;
        crypto::Sha256Stream digest;
        int32_t next_index{0};
    };
    std::map<std::pair<std::string, int64_t>, Partial> m_partial;
};

} // namespace federator::transfer

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
