/**
 * @file reference_resolver.hpp
 */
#pragma once
#include "reqsync/common/common.hpp"
#include "reqsync/changeset/reference.hpp"
#include "reqsync/model/req_finder.hpp"

namespace reqsync
{

/**
 * @brief Resolves name-scoped references into one module's type system.
 *
 * @details
 * Each method returns a concrete reference if the entity exists in the live
 * graph, and otherwise a promise whose label is exactly the one the
 * corresponding creation declares (see `reqsync::promise_label`). Resolution
 * never creates or reserves anything.
 *
 * If the module has no requirement types folder yet, every lookup yields a
 * promise.
 */
class ReferenceResolver
{
public:
    ReferenceResolver(const ReqFinder& finder, const RequirementTypesFolder* types_folder)
        : m_finder(finder)
        , m_types_folder(types_folder)
    {
    }

    Reference data_type_definition(const std::string& name) const;

    /**
     * @brief Resolve a literal of the data-type definition named `data_type_name`.
     */
    Reference enum_value(const std::string& data_type_name, const std::string& value) const;

    Reference requirement_type(const RmIdentifier& identifier) const;

    /**
     * @brief Resolve the definition of attribute `name` of requirement type `reqtype_identifier`.
     */
    Reference attribute_definition(const std::string& name, const RmIdentifier& reqtype_identifier,
                                   AttributeKind kind) const;

    const RequirementTypesFolder* types_folder() const noexcept
    {
        return m_types_folder;
    }

private:
    const ReqFinder& m_finder;
    const RequirementTypesFolder* m_types_folder;
};

} // namespace reqsync
