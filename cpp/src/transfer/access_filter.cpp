#include "transfer/access_filter.hpp"
#include "fed_service.hpp"

#include <fmt/ranges.h>

namespace federator::transfer
{

using format_tools::to_upper;
using format_tools::trim;

AccessGrant &AccessGrant::require(std::string_view key, const std::vector<std::string> &values)
{
    auto &allowed = m_requirements[to_upper(trim(key))];
    for (const auto &v : values)
    {
        allowed.insert(to_upper(trim(v)));
    }
    return *this;
}

DecisionDetail AccessFilter::decide(const SecurityLabel &label, const AccessGrant &grant)
{
    for (const auto &[key, allowed] : grant.requirements())
    {
        const auto value = label.get(key);
        if (!value)
        {
            return {AccessDecision::Deny, fmt::format("label has no '{}' attribute", key)};
        }
        if (!allowed.contains(std::string(*value)))
        {
            return {AccessDecision::Deny,
                    fmt::format("'{}' is '{}', allowed [{}]", key, *value, fmt::join(allowed, ", "))};
        }
    }
    return {AccessDecision::Allow, {}};
}

AccessFilter::AccessFilter(std::string client_id, AccessGrant grant)
    : m_client_id(std::move(client_id)), m_grant(std::move(grant))
{
}

DecisionDetail AccessFilter::evaluate(const Record &record) const
{
    const auto raw = record.header(kSecurityLabelHeader).value_or(std::string_view{});
    auto label = parse_label(raw);
    if (label.is_error())
    {
        return {AccessDecision::Deny, label.error_message()};
    }
    return decide(label.content(), m_grant);
}

TransferResult<bool> AccessFilter::filter_out(const Record &record) const
{
    const auto raw = record.header(kSecurityLabelHeader).value_or(std::string_view{});
    auto label = parse_label(raw);
    if (label.is_error())
    {
        LOGGER_ERROR("client '{}' offset {}: {}", m_client_id, record.offset, label.error_message());
        return label.forward_error<bool>();
    }
    return TransferResult<bool>::ok(!decide(label.content(), m_grant).allowed());
}

} // namespace federator::transfer
