#pragma once
/**
 * @file access_filter.hpp
 * @brief Security-label access decisions for one recipient.
 *
 * An `AccessGrant` lists, per attribute key, the values a client may receive.
 * A record is allowed only if, for every key in the grant, the record's label
 * carries that key with one of the listed values (AND across keys, OR within a
 * key). A missing attribute or an unparseable label is a denial. A grant with no
 * keys admits every record whose label parses, including unlabelled ones.
 */
#include "federator_utils_export.h"
#include "transfer/errors.hpp"
#include "transfer/event_source.hpp"
#include "transfer/security_label.hpp"

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace federator::transfer
{

class FEDERATOR_UTILS_EXPORT AccessGrant
{
  public:
    using Requirements = std::map<std::string, std::set<std::string>>;

    AccessGrant() = default;

    /// Adds (or extends) the allowed values for @p key. Key and values are upper-cased.
    AccessGrant &require(std::string_view key, const std::vector<std::string> &values);

    [[nodiscard]] const Requirements &requirements() const noexcept { return m_requirements; }
    [[nodiscard]] bool requires_nothing() const noexcept { return m_requirements.empty(); }

    bool operator==(const AccessGrant &) const = default;

  private:
    Requirements m_requirements;
};

enum class AccessDecision
{
    Allow,
    Deny,
};

/// Outcome of evaluating one record, with the reason recorded for audit logs.
struct DecisionDetail
{
    AccessDecision decision{AccessDecision::Deny};
    std::string reason;

    [[nodiscard]] bool allowed() const noexcept { return decision == AccessDecision::Allow; }
};

class FEDERATOR_UTILS_EXPORT AccessFilter
{
  public:
    AccessFilter(std::string client_id, AccessGrant grant);

    [[nodiscard]] static TransferResult<SecurityLabel> parse_label(std::string_view raw)
    {
        return SecurityLabel::parse(raw);
    }

    /// Pure decision over an already parsed label.
    [[nodiscard]] static DecisionDetail decide(const SecurityLabel &label, const AccessGrant &grant);

    /// Reads the record's label header, parses it and decides. Parse failures deny.
    [[nodiscard]] DecisionDetail evaluate(const Record &record) const;

    /**
     * @brief True when @p record must not be released to this client.
     * @return LabelParse error when the label cannot be parsed; callers treat that as a denial.
     */
    [[nodiscard]] TransferResult<bool> filter_out(const Record &record) const;

    /// Stateless filter; nothing to release.
    void close() noexcept {}

    [[nodiscard]] const std::string &client_id() const noexcept { return m_client_id; }
    [[nodiscard]] const AccessGrant &grant() const noexcept { return m_grant; }

  private:
    std::string m_client_id;
    AccessGrant m_grant;
};

} // namespace federator::transfer

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
