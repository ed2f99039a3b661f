/**
 * @file change_action.cpp
 */
#include "reqsync/changeset/change_action.hpp"

namespace reqsync
{

namespace
{

bool extend_maps_equal(const ExtendMap& lhs, const ExtendMap& rhs)
{
    if (lhs.size() != rhs.size())
    {
        return false;
    }
    for (auto lit = lhs.begin(), rit = rhs.begin(); lit != lhs.end(); ++lit, ++rit)
    {
        if (lit->first != rit->first || lit->second.size() != rit->second.size())
        {
            return false;
        }
        for (std::size_t i = 0; i < lit->second.size(); ++i)
        {
            if (!entries_equal(lit->second[i], rit->second[i]))
            {
                return false;
            }
        }
    }
    return true;
}

} // namespace

// ============================================================================
// CreatePayload
// ============================================================================

const FieldValue* CreatePayload::field(const std::string& name) const
{
    auto it = fields.find(name);
    return it == fields.end() ? nullptr : &it->second;
}

const SlotEntries* CreatePayload::slot(const std::string& name) const
{
    auto it = children.find(name);
    return it == children.end() ? nullptr : &it->second;
}

bool operator==(const CreatePayload& lhs, const CreatePayload& rhs)
{
    return lhs.type_name == rhs.type_name
        && lhs.promise_id == rhs.promise_id
        && lhs.fields == rhs.fields
        && extend_maps_equal(lhs.children, rhs.children);
}

bool operator!=(const CreatePayload& lhs, const CreatePayload& rhs)
{
    return !(lhs == rhs);
}

bool entries_equal(const ExtendEntry& lhs, const ExtendEntry& rhs)
{
    if (lhs.index() != rhs.index())
    {
        return false;
    }
    if (const auto* ref = std::get_if<Reference>(&lhs))
    {
        return *ref == std::get<Reference>(rhs);
    }
    const auto& lpayload = std::get<CreatePayloadPtr>(lhs);
    const auto& rpayload = std::get<CreatePayloadPtr>(rhs);
    if (!lpayload || !rpayload)
    {
        return lpayload == rpayload;
    }
    return *lpayload == *rpayload;
}

// ============================================================================
// ChangeAction
// ============================================================================

bool operator==(const ChangeAction& lhs, const ChangeAction& rhs)
{
    return lhs.parent == rhs.parent
        && extend_maps_equal(lhs.extend, rhs.extend)
        && lhs.modify == rhs.modify
        && lhs.deletions == rhs.deletions;
}

bool operator!=(const ChangeAction& lhs, const ChangeAction& rhs)
{
    return !(lhs == rhs);
}

} // namespace reqsync
