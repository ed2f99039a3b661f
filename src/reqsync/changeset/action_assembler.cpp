/**
 * @file action_assembler.cpp
 */
#include "reqsync/changeset/action_assembler.hpp"

namespace reqsync
{

void set_modify(ChangeAction& target, const std::string& field, FieldValue value)
{
    auto* incoming = std::get_if<AttributeChanges>(&value);
    if (incoming != nullptr && incoming->empty())
    {
        return;
    }

    auto it = target.modify.find(field);
    if (incoming != nullptr && it != target.modify.end())
    {
        if (auto* existing = std::get_if<AttributeChanges>(&it->second))
        {
            for (auto& [name, change] : *incoming)
            {
                (*existing)[name] = std::move(change);
            }
            return;
        }
    }
    target.modify[field] = std::move(value);
}

void deep_merge(ChangeAction& target, const ChangeAction& fragment)
{
    for (const auto& [slot, entries] : fragment.extend)
    {
        if (!entries.empty())
        {
            target.extend[slot] = entries;
        }
    }
    for (const auto& [field, value] : fragment.modify)
    {
        set_modify(target, field, value);
    }
    for (const auto& [slot, refs] : fragment.deletions)
    {
        if (!refs.empty())
        {
            target.deletions[slot] = refs;
        }
    }
}

void append_extend(ChangeAction& target, const std::string& slot, ExtendEntry entry)
{
    target.extend[slot].push_back(std::move(entry));
}

std::size_t prune_void_actions(std::vector<ChangeActionPtr>& actions)
{
    auto first_void = std::remove_if(actions.begin(), actions.end(),
                                     [](const ChangeActionPtr& action) { return !action || action->is_void(); });
    auto removed = static_cast<std::size_t>(std::distance(first_void, actions.end()));
    actions.erase(first_void, actions.end());
    return removed;
}

} // namespace reqsync
