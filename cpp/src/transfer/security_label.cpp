#include "transfer/security_label.hpp"
#include "fed_service.hpp"

#include <algorithm>

namespace federator::transfer
{

using format_tools::to_upper;
using format_tools::trim;

namespace
{

std::vector<std::string_view> split_any(std::string_view text, std::string_view delimiters)
{
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true)
    {
        const size_t pos = text.find_first_of(delimiters, start);
        if (pos == std::string_view::npos)
        {
            parts.push_back(text.substr(start));
            return parts;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
}

} // namespace

TransferResult<SecurityLabel> SecurityLabel::parse(std::string_view raw)
{
    SecurityLabel label;
    for (const auto raw_segment : split_any(raw, ","))
    {
        const std::string segment = trim(raw_segment);
        if (segment.empty())
        {
            continue;
        }
        const auto tokens = split_any(segment, "=:");
        if (tokens.size() != 2)
        {
            return TransferResult<SecurityLabel>::error(
                TransferError::LabelParse,
                fmt::format("cannot map security label segment '{}': expected one key and one value",
                            segment));
        }
        std::string key = to_upper(trim(tokens[0]));
        std::string value = to_upper(trim(tokens[1]));
        if (key.empty() || value.empty())
        {
            return TransferResult<SecurityLabel>::error(
                TransferError::LabelParse,
                fmt::format("cannot map security label segment '{}': empty key or value", segment));
        }
        label.set(std::move(key), std::move(value));
    }
    return TransferResult<SecurityLabel>::ok(std::move(label));
}

void SecurityLabel::set(std::string key, std::string value)
{
    auto it = std::find_if(m_attributes.begin(), m_attributes.end(),
                           [&key](const Attribute &attr) { return attr.first == key; });
    if (it != m_attributes.end())
    {
        if (it->second != value)
        {
            LOGGER_DEBUG("Security label key '{}' repeated: '{}' replaces '{}'", key, value,
                         it->second);
        }
        it->second = std::move(value);
        return;
    }
    m_attributes.emplace_back(std::move(key), std::move(value));
}

std::optional<std::string_view> SecurityLabel::get(std::string_view key) const
{
    const std::string wanted = to_upper(trim(key));
    for (const auto &[k, v] : m_attributes)
    {
        if (k == wanted)
        {
            return std::string_view(v);
        }
    }
    return std::nullopt;
}

std::string SecurityLabel::to_string() const
{
    std::string out;
    for (const auto &[k, v] : m_attributes)
    {
        if (!out.empty())
        {
            out += ',';
        }
        out += k;
        out += '=';
        out += v;
    }
    return out;
}

} // namespace federator::transfer
