#pragma once
/**
 * @file security_label.hpp
 * @brief Parsed form of the `Security-Label` record header.
 *
 * A label is a comma-separated list of `KEY=VALUE` or `KEY:VALUE` pairs, for
 * example `"nationality=GBR, clearance:O"`. Keys and values are trimmed and
 * upper-cased. Blank segments are skipped; any other segment that does not split
 * into exactly one non-empty key and one non-empty value fails the whole parse.
 * When a key repeats, the later value replaces the earlier one in place.
 */
#include "federator_utils_export.h"
#include "transfer/errors.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace federator::transfer
{

/// Name of the record header that carries the label. Matched case-insensitively.
inline constexpr std::string_view kSecurityLabelHeader = "Security-Label";

class FEDERATOR_UTILS_EXPORT SecurityLabel
{
  public:
    using Attribute = std::pair<std::string, std::string>;

    SecurityLabel() = default;

    [[nodiscard]] static TransferResult<SecurityLabel> parse(std::string_view raw);

    /// Value for @p key (any case), or nullopt when the label does not carry it.
    [[nodiscard]] std::optional<std::string_view> get(std::string_view key) const;

    /// Attributes in first-appearance order.
    [[nodiscard]] const std::vector<Attribute> &attributes() const noexcept { return m_attributes; }
    [[nodiscard]] bool empty() const noexcept { return m_attributes.empty(); }
    [[nodiscard]] size_t size() const noexcept { return m_attributes.size(); }

    /// Canonical `KEY=VALUE,KEY=VALUE` form.
    [[nodiscard]] std::string to_string() const;

    bool operator==(const SecurityLabel &) const = default;

  private:
    void set(std::string key, std::string value);

    std::vector<Attribute> m_attributes;
};

} // namespace federator::transfer

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
