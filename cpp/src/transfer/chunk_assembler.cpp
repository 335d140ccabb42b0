#include "transfer/chunk_assembler.hpp"
#include "fed_service.hpp"

#include <cctype>

namespace federator::transfer
{

namespace fs = std::filesystem;

namespace
{
constexpr const char *kPartsDir = ".parts";

/// Checks shared by both receivers once the terminal chunk arrives.
std::optional<std::string> terminal_mismatch(const TransferChunk &terminal, int32_t received_chunks,
                                             int64_t received_bytes, const std::string &checksum)
{
    if (terminal.chunk_index != received_chunks || terminal.total_chunks != received_chunks)
    {
        return fmt::format("'{}' seq {}: received {} chunks, terminal says {}",
                           terminal.resource_name, terminal.sequence_id, received_chunks,
                           terminal.total_chunks);
    }
    if (terminal.file_size != received_bytes)
    {
        return fmt::format("'{}' seq {}: size mismatch, expected {} got {}", terminal.resource_name,
                           terminal.sequence_id, terminal.file_size, received_bytes);
    }
    if (!crypto::checksum_equals(terminal.checksum, checksum))
    {
        return fmt::format("'{}' seq {}: checksum mismatch", terminal.resource_name,
                           terminal.sequence_id);
    }
    return std::nullopt;
}
} // namespace

std::string sanitize_resource_name(const std::string &resource_name, int64_t sequence_id)
{
    std::string name = fs::path(resource_name).filename().string();
    for (char &c : name)
    {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) == 0 && c != '.' && c != '-' && c != '_')
        {
            c = '_';
        }
    }
    if (name.empty() || name == "." || name == "..")
    {
        return fmt::format("resource-{}", sequence_id);
    }
    return name;
}

// ============================================================================
// ChunkAssembler
// ============================================================================

TransferResult<ChunkAssembler> ChunkAssembler::create(fs::path destination)
{
    std::error_code ec;
    fs::create_directories(destination / kPartsDir, ec);
    if (ec)
    {
        return TransferResult<ChunkAssembler>::error(
            TransferError::FileIO,
            fmt::format("cannot create '{}': {}", destination.string(), ec.message()), ec.value());
    }
    return TransferResult<ChunkAssembler>::ok(ChunkAssembler(std::move(destination)));
}

ChunkAssembler::~ChunkAssembler()
{
    if (!m_assemblies.empty())
    {
        LOGGER_WARN("Discarding {} incomplete resource(s) in '{}'", m_assemblies.size(),
                    m_destination.string());
        discard_incomplete();
    }
}

TransferResult<std::optional<fs::path>> ChunkAssembler::fail(const Key &key, std::string message)
{
    auto it = m_assemblies.find(key);
    if (it != m_assemblies.end())
    {
        it->second.out.close();
        std::error_code ec;
        fs::remove(it->second.part_file, ec);
        m_assemblies.erase(it);
    }
    LOGGER_ERROR("Assembly failed: {}", message);
    return TransferResult<std::optional<fs::path>>::error(TransferError::FileIO, std::move(message));
}

fs::path ChunkAssembler::final_path_for(const std::string &safe_name, int64_t sequence_id)
{
    auto owner = m_stored_names.find(safe_name);
    const bool taken = owner != m_stored_names.end()
                           ? owner->second != sequence_id
                           : fs::exists(m_destination / safe_name);
    if (!taken)
    {
        return m_destination / safe_name;
    }
    const fs::path base(safe_name);
    const std::string suffixed = fmt::format("{}.{}{}", base.stem().string(), sequence_id,
                                             base.extension().string());
    LOGGER_WARN("'{}' already exists in '{}'; storing seq {} as '{}'", safe_name,
                m_destination.string(), sequence_id, suffixed);
    return m_destination / suffixed;
}

TransferResult<std::optional<fs::path>> ChunkAssembler::accept(const TransferChunk &chunk)
{
    using R = TransferResult<std::optional<fs::path>>;
    const Key key{chunk.resource_name, chunk.sequence_id};
    const std::string safe_name = sanitize_resource_name(chunk.resource_name, chunk.sequence_id);

    auto it = m_assemblies.find(key);
    if (it == m_assemblies.end())
    {
        Assembly assembly;
        assembly.part_file =
            m_destination / kPartsDir / fmt::format("{}.{}.part", safe_name, chunk.sequence_id);
        assembly.out.open(assembly.part_file, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!assembly.out.is_open())
        {
            return R::error(TransferError::FileIO,
                            fmt::format("cannot create '{}'", assembly.part_file.string()));
        }
        it = m_assemblies.emplace(key, std::move(assembly)).first;
    }
    Assembly &state = it->second;

    if (!chunk.is_last_chunk)
    {
        if (chunk.chunk_index != state.next_index)
        {
            return fail(key, fmt::format("'{}' seq {}: expected chunk {} got {}", chunk.resource_name,
                                         chunk.sequence_id, state.next_index, chunk.chunk_index));
        }
        state.out.write(chunk.payload.data(), static_cast<std::streamsize>(chunk.payload.size()));
        if (!state.out)
        {
            return fail(key, fmt::format("write to '{}' failed", state.part_file.string()));
        }
        state.digest.update(chunk.payload);
        state.bytes += static_cast<int64_t>(chunk.payload.size());
        ++state.next_index;
        LOGGER_DEBUG("Received chunk {} of {} for '{}' ({} bytes)", chunk.chunk_index,
                     chunk.total_chunks, chunk.resource_name, chunk.payload.size());
        return R::ok(std::nullopt);
    }

    state.out.close();
    if (state.out.fail())
    {
        return fail(key, fmt::format("flush of '{}' failed", state.part_file.string()));
    }
    const std::string actual = state.digest.finish_base64();
    if (auto mismatch = terminal_mismatch(chunk, state.next_index, state.bytes, actual))
    {
        return fail(key, std::move(*mismatch));
    }

    const fs::path target = final_path_for(safe_name, chunk.sequence_id);
    std::error_code ec;
    fs::rename(state.part_file, target, ec);
    if (ec)
    {
        return fail(key, fmt::format("cannot move '{}' to '{}': {}", state.part_file.string(),
                                     target.string(), ec.message()));
    }
    m_assemblies.erase(it);
    m_stored_names.emplace(target.filename().string(), chunk.sequence_id);
    LOGGER_INFO("Stored received file at '{}' ({} bytes)", target.string(), chunk.file_size);
    return R::ok(target);
}

size_t ChunkAssembler::discard_incomplete()
{
    const size_t count = m_assemblies.size();
    for (auto &[key, state] : m_assemblies)
    {
        state.out.close();
        std::error_code ec;
        if (!fs::remove(state.part_file, ec) && ec)
        {
            LOGGER_WARN("Failed to delete '{}': {}", state.part_file.string(), ec.message());
        }
    }
    m_assemblies.clear();
    return count;
}

// ============================================================================
// RecordCollector
// ============================================================================

TransferResult<std::optional<ReceivedRecord>> RecordCollector::accept(const TransferChunk &chunk)
{
    using R = TransferResult<std::optional<ReceivedRecord>>;
    const auto key = std::make_pair(chunk.resource_name, chunk.sequence_id);
    auto &partial = m_partial[key];

    if (!chunk.is_last_chunk)
    {
        if (chunk.chunk_index != partial.next_index)
        {
            m_partial.erase(key);
            return R::error(TransferError::FileIO,
                            fmt::format("record seq {}: expected chunk {} got {}", chunk.sequence_id,
                                        partial.next_index, chunk.chunk_index));
        }
        partial.digest.update(chunk.payload);
        partial.data += chunk.payload;
        ++partial.next_index;
        return R::ok(std::nullopt);
    }

    const std::string actual = partial.digest.finish_base64();
    auto mismatch = terminal_mismatch(chunk, partial.next_index,
                                      static_cast<int64_t>(partial.data.size()), actual);
    ReceivedRecord record{chunk.sequence_id, chunk.resource_name, std::move(partial.data)};
    m_partial.erase(key);
    if (mismatch)
    {
        return R::error(TransferError::FileIO, std::move(*mismatch));
    }
    return R::ok(std::move(record));
}

size_t RecordCollector::discard_incomplete()
{
    const size_t count = m_partial.size();
    m_partial.clear();
    return count;
}

} // namespace federator::transfer
