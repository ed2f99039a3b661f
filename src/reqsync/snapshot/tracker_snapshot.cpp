/**
 * @file tracker_snapshot.cpp
 */
#include "reqsync/snapshot/tracker_snapshot.hpp"

namespace reqsync
{

namespace
{

/// (attribute name, text value) pairs that are hints, not attributes.
const std::set<std::pair<std::string, std::string>> kAttributeBlacklist{
    {"Type", "Folder"},
};

bool is_blacklisted_text(const std::string& name, const std::string& value)
{
    return kAttributeBlacklist.count({name, value}) != 0;
}

} // namespace

bool is_blacklisted(const std::string& name, const Primitive& value)
{
    if (const auto* text = std::get_if<std::string>(&value))
    {
        return is_blacklisted_text(name, *text);
    }
    if (const auto* list = std::get_if<std::vector<std::string>>(&value))
    {
        if (list->empty())
        {
            return false;
        }
        return std::all_of(list->begin(), list->end(),
                           [&name](const std::string& element) { return is_blacklisted_text(name, element); });
    }
    return false;
}

bool is_folder_marker(const std::string& name, const Primitive& value)
{
    return name == "Type" && is_blacklisted(name, value);
}

WorkItemSpec::WorkItemSpec(RmIdentifier identifier,
                           std::string long_name,
                           std::optional<RmIdentifier> type,
                           AttributeMap attributes,
                           std::vector<WorkItemSpec> children,
                           std::optional<std::string> text)
    : m_identifier(std::move(identifier))
    , m_long_name(std::move(long_name))
    , m_type(std::move(type))
    , m_attributes(std::move(attributes))
    , m_children(std::move(children))
    , m_text(std::move(text))
    , m_kind(ItemKind::Requirement)
{
    bool folder_hint = std::any_of(m_attributes.begin(), m_attributes.end(),
                                   [](const AttributeMap::value_type& entry) {
                                       return is_folder_marker(entry.first, entry.second);
                                   });
    if (!m_children.empty() || folder_hint)
    {
        m_kind = ItemKind::Folder;
    }
}

} // namespace reqsync
