#pragma once
/**
 * @file file_provider.hpp
 * @brief File transfer requests and the providers that open the files they name.
 *
 * A file topic carries one JSON request per record:
 * @code
 * {"sourceType": "LOCAL", "storageContainer": "", "path": "reports/q1.csv"}
 * @endcode
 * `LOCAL` paths resolve under `files.local_root`. `OBJECT_STORE_A` and
 * `OBJECT_STORE_B` resolve `<container>/<path>` under the root configured for
 * that store. A path that escapes its root is rejected.
 */
#include "federator_utils_export.h"
#include "transfer/errors.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace federator::transfer
{

enum class FileSourceKind
{
    Local,
    ObjectStoreA,
    ObjectStoreB,
};

FEDERATOR_UTILS_EXPORT std::string_view to_string(FileSourceKind kind) noexcept;
FEDERATOR_UTILS_EXPORT std::optional<FileSourceKind> file_source_kind_from_string(std::string_view s);

/// Why a file-topic record could not become a transfer.
enum class RequestRejection
{
    Deserialization, ///< Payload is not a request object.
    Validation,      ///< Request is well-formed but unusable.
};

FEDERATOR_UTILS_EXPORT std::string_view to_string(RequestRejection r) noexcept;

struct FEDERATOR_UTILS_EXPORT FileTransferRequest
{
    FileSourceKind kind{FileSourceKind::Local};
    std::string container;
    std::string path;

    /// Parses and validates a record payload.
    static utils::Result<FileTransferRequest, RequestRejection> from_payload(std::string_view payload);

    /// Path non-blank; container present for object stores.
    [[nodiscard]] utils::VoidResult<RequestRejection> validate() const;
};

struct FileRoots
{
    std::filesystem::path local_root;
    std::filesystem::path object_store_a_root;
    std::filesystem::path object_store_b_root;
};

struct OpenedFile
{
    std::ifstream stream;
    int64_t size{0};
    std::string resource_name;
    std::filesystem::path resolved_path;
};

class FEDERATOR_UTILS_EXPORT LocalFileProvider
{
  public:
    explicit LocalFileProvider(std::filesystem::path root) : m_root(std::move(root)) {}

    [[nodiscard]] TransferResult<std::filesystem::path> resolve(const FileTransferRequest &request) const;
    TransferResult<OpenedFile> open(const FileTransferRequest &request) const;

  private:
    std::filesystem::path m_root;
};

class FEDERATOR_UTILS_EXPORT ObjectStoreFileProvider
{
  public:
    ObjectStoreFileProvider(FileSourceKind kind, std::filesystem::path root)
        : m_kind(kind), m_root(std::move(root))
    {
    }

    [[nodiscard]] FileSourceKind kind() const noexcept { return m_kind; }

    [[nodiscard]] TransferResult<std::filesystem::path> resolve(const FileTransferRequest &request) const;
    TransferResult<OpenedFile> open(const FileTransferRequest &request) const;

  private:
    FileSourceKind m_kind;
    std::filesystem::path m_root;
};

class FEDERATOR_UTILS_EXPORT FileProvider
{
  public:
    using Variant = std::variant<LocalFileProvider, ObjectStoreFileProvider>;

    explicit FileProvider(Variant impl) : m_impl(std::move(impl)) {}

    [[nodiscard]] FileSourceKind kind() const noexcept;

    /**
     * @brief Opens the file named by @p request for streaming.
     * @return InvalidRequest for traversal or a missing or non-regular file,
     *         FileIO when the file exists but cannot be opened.
     */
    TransferResult<OpenedFile> open(const FileTransferRequest &request) const;

  private:
    Variant m_impl;
};

/// Provider for @p kind; Configuration error when its root is not configured.
FEDERATOR_UTILS_EXPORT TransferResult<FileProvider> make_file_provider(FileSourceKind kind,
                                                                       const FileRoots &roots);

} // namespace federator::transfer

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
