/**
 * @file type_system_reconciler.hpp
 * @brief Reconciliation of data-type definitions and requirement types.
 */
#pragma once
#include "reqsync/common/common.hpp"
#include "reqsync/changeset/change_action.hpp"
#include "reqsync/changeset/reconcile_context.hpp"

namespace reqsync
{

/**
 * @brief Brings a module's requirement types folder in line with the snapshot.
 *
 * @details
 * The type system is reconciled before any work item, because attribute
 * values refer to attribute definitions and enumeration literals, which may
 * be created in the same batch and are then referenced by promise.
 *
 * @par Folder missing
 * `types_folder_create_payload()` describes the complete folder with every
 * data-type definition and requirement type nested inside it.
 *
 * @par Folder present
 * `actions()` yields, in order:
 * 1. one action on the folder creating new and deleting obsolete data-type
 *    definitions,
 * 2. one action per changed data-type definition (literals added, removed,
 *    or renamed),
 * 3. one action on the folder creating new and deleting obsolete requirement
 *    types,
 * 4. per changed requirement type, one action for the type itself followed by
 *    one action per changed attribute definition.
 * Void actions are omitted.
 *
 * An attribute definition whose kind changed is deleted and created anew; the
 * change is reported as a warning.
 */
class TypeSystemReconciler
{
public:
    explicit TypeSystemReconciler(const ReconcileContext& ctx)
        : m_ctx(ctx)
    {
    }

    /**
     * @brief Describe the creation of the whole requirement types folder.
     */
    CreatePayloadPtr types_folder_create_payload() const;

    /**
     * @brief Compute the actions updating an existing requirement types folder.
     * @throw std::logic_error if the module has no requirement types folder.
     */
    std::vector<ChangeActionPtr> actions() const;

    std::vector<ChangeActionPtr> data_type_definition_actions() const;

    std::vector<ChangeActionPtr> requirement_type_actions() const;

    CreatePayloadPtr data_type_definition_payload(const std::string& name,
                                                  const std::vector<std::string>& values) const;

    CreatePayloadPtr requirement_type_payload(const RmIdentifier& identifier,
                                              const RequirementTypeSpec& spec) const;

    CreatePayloadPtr attribute_definition_payload(const std::string& name,
                                                  const AttributeDefinitionSpec& spec,
                                                  const RmIdentifier& reqtype_identifier) const;

private:
    const RequirementTypesFolder& folder() const;

    CreatePayloadPtr enum_value_payload(const std::string& data_type_name, const std::string& value) const;

    ChangeActionPtr data_type_definition_mod_action(const DataTypeDefinition& dtdef,
                                                    const std::string& name,
                                                    const std::vector<std::string>& values) const;

    void requirement_type_mod_actions(const RequirementType& reqtype,
                                      const RequirementTypeSpec& spec,
                                      std::vector<ChangeActionPtr>& out) const;

    ChangeActionPtr attribute_definition_mod_action(const AttributeDefinition& adef,
                                                    const std::string& name,
                                                    const AttributeDefinitionSpec& spec) const;

    /// Reference to the data-type definition of an Enum attribute, if the snapshot declares one.
    std::optional<Reference> enum_data_type(const std::string& name) const;

private:
    const ReconcileContext& m_ctx;
};

} // namespace reqsync
