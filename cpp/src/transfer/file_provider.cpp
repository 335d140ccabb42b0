#include "transfer/file_provider.hpp"
#include "fed_service.hpp"

#include <nlohmann/json.hpp>

namespace federator::transfer
{

namespace fs = std::filesystem;

std::string_view to_string(FileSourceKind kind) noexcept
{
    switch (kind)
    {
    case FileSourceKind::Local:
        return "LOCAL";
    case FileSourceKind::ObjectStoreA:
        return "OBJECT_STORE_A";
    case FileSourceKind::ObjectStoreB:
        return "OBJECT_STORE_B";
    }
    return "UNKNOWN";
}

std::optional<FileSourceKind> file_source_kind_from_string(std::string_view s)
{
    for (const auto kind :
         {FileSourceKind::Local, FileSourceKind::ObjectStoreA, FileSourceKind::ObjectStoreB})
    {
        if (format_tools::iequals(s, to_string(kind)))
        {
            return kind;
        }
    }
    return std::nullopt;
}

std::string_view to_string(RequestRejection r) noexcept
{
    return r == RequestRejection::Deserialization ? "DESERIALIZATION" : "VALIDATION";
}

// ============================================================================
// FileTransferRequest
// ============================================================================

utils::Result<FileTransferRequest, RequestRejection>
FileTransferRequest::from_payload(std::string_view payload)
{
    using R = utils::Result<FileTransferRequest, RequestRejection>;
    FileTransferRequest request;
    try
    {
        const auto j = nlohmann::json::parse(payload);
        if (!j.is_object())
        {
            return R::error(RequestRejection::Deserialization, "request is not a JSON object");
        }
        const auto kind_str = j.at("sourceType").get<std::string>();
        const auto kind = file_source_kind_from_string(kind_str);
        if (!kind)
        {
            return R::error(RequestRejection::Validation,
                            fmt::format("unknown sourceType '{}'", kind_str));
        }
        request.kind = *kind;
        if (j.contains("storageContainer") && !j.at("storageContainer").is_null())
        {
            request.container = j.at("storageContainer").get<std::string>();
        }
        request.path = j.at("path").get<std::string>();
    }
    catch (const nlohmann::json::exception &e)
    {
        return R::error(RequestRejection::Deserialization,
                        fmt::format("cannot read file request: {}", e.what()));
    }

    auto valid = request.validate();
    if (valid.is_error())
    {
        return valid.forward_error<FileTransferRequest>();
    }
    return R::ok(std::move(request));
}

utils::VoidResult<RequestRejection> FileTransferRequest::validate() const
{
    using R = utils::VoidResult<RequestRejection>;
    if (format_tools::trim(path).empty())
    {
        return R::error(RequestRejection::Validation, "path is blank");
    }
    if (kind != FileSourceKind::Local && format_tools::trim(container).empty())
    {
        return R::error(RequestRejection::Validation,
                        fmt::format("{} request needs a storageContainer", to_string(kind)));
    }
    return utils::ok_void<RequestRejection>();
}

// ============================================================================
// Providers
// ============================================================================

namespace
{

/// @p relative resolved under @p root; InvalidRequest if the result leaves @p root.
TransferResult<fs::path> resolve_under(const fs::path &root, const fs::path &relative)
{
    std::error_code ec;
    const auto base = fs::weakly_canonical(root, ec);
    if (ec)
    {
        return TransferResult<fs::path>::error(
            TransferError::Configuration,
            fmt::format("cannot resolve root '{}': {}", root.string(), ec.message()), ec.value());
    }
    const auto target = fs::weakly_canonical(relative.is_absolute() ? relative : base / relative, ec);
    if (ec)
    {
        return TransferResult<fs::path>::error(
            TransferError::InvalidRequest,
            fmt::format("cannot resolve '{}': {}", relative.string(), ec.message()), ec.value());
    }
    const auto rel = target.lexically_relative(base);
    if (rel.empty() || *rel.begin() == "..")
    {
        return TransferResult<fs::path>::error(
            TransferError::InvalidRequest,
            fmt::format("'{}' is outside '{}'", relative.string(), base.string()));
    }
    return TransferResult<fs::path>::ok(target);
}

TransferResult<OpenedFile> open_regular_file(const fs::path &path)
{
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
    {
        return TransferResult<OpenedFile>::error(
            TransferError::InvalidRequest,
            fmt::format("'{}' does not exist or is not a file", path.string()));
    }
    const auto size = fs::file_size(path, ec);
    if (ec)
    {
        return TransferResult<OpenedFile>::error(
            TransferError::FileIO, fmt::format("cannot stat '{}': {}", path.string(), ec.message()),
            ec.value());
    }

    OpenedFile file;
    file.stream.open(path, std::ios::in | std::ios::binary);
    if (!file.stream.is_open())
    {
        return TransferResult<OpenedFile>::error(TransferError::FileIO,
                                                 fmt::format("cannot open '{}'", path.string()));
    }
    file.size = static_cast<int64_t>(size);
    file.resource_name = path.filename().string();
    file.resolved_path = path;
    return TransferResult<OpenedFile>::ok(std::move(file));
}

} // namespace

TransferResult<fs::path> LocalFileProvider::resolve(const FileTransferRequest &request) const
{
    return resolve_under(m_root, fs::path(request.path));
}

TransferResult<OpenedFile> LocalFileProvider::open(const FileTransferRequest &request) const
{
    auto path = resolve(request);
    if (path.is_error())
    {
        return path.forward_error<OpenedFile>();
    }
    return open_regular_file(path.content());
}

TransferResult<fs::path> ObjectStoreFileProvider::resolve(const FileTransferRequest &request) const
{
    if (request.container.empty() || request.container.find_first_of("/\\") != std::string::npos ||
        request.container == "." || request.container == "..")
    {
        return TransferResult<fs::path>::error(
            TransferError::InvalidRequest,
            fmt::format("invalid storage container '{}'", request.container));
    }
    // Object keys are relative to their container even when written with a leading '/'.
    const fs::path key = fs::path(request.path).relative_path();
    return resolve_under(m_root / request.container, key);
}

TransferResult<OpenedFile> ObjectStoreFileProvider::open(const FileTransferRequest &request) const
{
    auto path = resolve(request);
    if (path.is_error())
    {
        return path.forward_error<OpenedFile>();
    }
    return open_regular_file(path.content());
}

FileSourceKind FileProvider::kind() const noexcept
{
    if (const auto *store = std::get_if<ObjectStoreFileProvider>(&m_impl))
    {
        return store->kind();
    }
    return FileSourceKind::Local;
}

TransferResult<OpenedFile> FileProvider::open(const FileTransferRequest &request) const
{
    if (request.kind != kind())
    {
        return TransferResult<OpenedFile>::error(
            TransferError::InvalidRequest,
            fmt::format("{} request sent to {} provider", to_string(request.kind), to_string(kind())));
    }
    return std::visit([&request](const auto &provider) { return provider.open(request); }, m_impl);
}

TransferResult<FileProvider> make_file_provider(FileSourceKind kind, const FileRoots &roots)
{
    const fs::path *root = nullptr;
    switch (kind)
    {
    case FileSourceKind::Local:
        root = &roots.local_root;
        break;
    case FileSourceKind::ObjectStoreA:
        root = &roots.object_store_a_root;
        break;
    case FileSourceKind::ObjectStoreB:
        root = &roots.object_store_b_root;
        break;
    }
    if (root == nullptr || root->empty())
    {
        return TransferResult<FileProvider>::error(
            TransferError::Configuration, fmt::format("no root configured for {}", to_string(kind)));
    }
    if (kind == FileSourceKind::Local)
    {
        return TransferResult<FileProvider>::ok(FileProvider(LocalFileProvider(*root)));
    }
    return TransferResult<FileProvider>::ok(FileProvider(ObjectStoreFileProvider(kind, *root)));
}

} // namespace federator::transfer
