/**
 * @file live_model.hpp
 * @brief In-memory view of the persisted requirements graph.
 */
#pragma once
#include "reqsync/common/common.hpp"
#include "reqsync/common/reqsync_enums.hpp"

namespace reqsync
{

struct EnumValue;
struct DataTypeDefinition;
struct AttributeDefinition;
struct AttributeValue;
struct RequirementType;
struct RequirementTypesFolder;
struct ItemContainer;
struct WorkItem;
struct Module;

using EnumValuePtr = std::shared_ptr<EnumValue>;
using DataTypeDefinitionPtr = std::shared_ptr<DataTypeDefinition>;
using AttributeDefinitionPtr = std::shared_ptr<AttributeDefinition>;
using AttributeValuePtr = std::shared_ptr<AttributeValue>;
using RequirementTypePtr = std::shared_ptr<RequirementType>;
using RequirementTypesFolderPtr = std::shared_ptr<RequirementTypesFolder>;
using WorkItemPtr = std::shared_ptr<WorkItem>;
using ModulePtr = std::shared_ptr<Module>;

// ============================================================================
// Type system
// ============================================================================

/**
 * @brief A literal of an enumeration data type.
 */
struct EnumValue
{
    Uuid uuid;
    std::string long_name;
};

/**
 * @brief An enumeration data type: a named, ordered set of literals.
 */
struct DataTypeDefinition
{
    Uuid uuid;
    std::string long_name;
    std::vector<EnumValuePtr> values;

    /**
     * @brief Find a literal by its long name.
     * @return The literal, or nullptr if absent.
     */
    EnumValuePtr value_by_long_name(const std::string& name) const;
};

/**
 * @brief Definition of one attribute slot of a requirement type.
 *
 * @details
 * `data_type` and `multi_valued` are only meaningful for `AttributeKind::Enum`.
 * The identifier is formed from the attribute name and the owning requirement
 * type's identifier, see `attribute_definition_identifier()`.
 */
struct AttributeDefinition
{
    Uuid uuid;
    std::string identifier;
    std::string long_name;
    AttributeKind kind{AttributeKind::String};
    DataTypeDefinitionPtr data_type;
    bool multi_valued{false};
};

/**
 * @brief A requirement type and the attribute definitions it declares.
 */
struct RequirementType
{
    Uuid uuid;
    RmIdentifier identifier;
    std::string long_name;
    std::vector<AttributeDefinitionPtr> attribute_definitions;

    AttributeDefinitionPtr attribute_definition_by_long_name(const std::string& name) const;
};

/**
 * @brief Container for a module's data-type definitions and requirement types.
 */
struct RequirementTypesFolder
{
    Uuid uuid;
    std::string identifier;
    std::string long_name;
    std::vector<DataTypeDefinitionPtr> data_type_definitions;
    std::vector<RequirementTypePtr> requirement_types;
};

// ============================================================================
// Work items
// ============================================================================

/**
 * @brief A stored value of one attribute on a work item.
 *
 * @details
 * Enum attributes keep references to literals in `values` and leave `value`
 * null; every other kind keeps its scalar in `value`.
 */
struct AttributeValue
{
    Uuid uuid;
    AttributeDefinitionPtr definition;
    Primitive value;
    std::vector<EnumValuePtr> values;
};

/**
 * @brief Anything that owns folders and requirements: a module or a folder.
 *
 * @par Ownership
 * - Children are owned through `std::shared_ptr`.
 * - Each work item refers back to its container through a raw, non-owning
 *   pointer; containers outlive their children.
 */
struct ItemContainer
{
    virtual ~ItemContainer() = default;

    Uuid uuid;
    std::vector<WorkItemPtr> folders;
    std::vector<WorkItemPtr> requirements;
};

/**
 * @brief A folder or a requirement in the live graph.
 *
 * @details
 * Requirements never own children; their `folders` and `requirements` stay
 * empty.
 */
struct WorkItem : ItemContainer
{
    ItemKind kind{ItemKind::Requirement};
    RmIdentifier identifier;
    std::string long_name;
    std::string text;
    RequirementTypePtr type;
    std::vector<AttributeValuePtr> attributes;

    /// The owning module or folder. Non-owning.
    const ItemContainer* parent{nullptr};

    bool is_folder() const noexcept
    {
        return kind == ItemKind::Folder;
    }
};

/**
 * @brief Root container of one tracker's requirements.
 */
struct Module : ItemContainer
{
    RmIdentifier identifier;
    std::string long_name;
    RequirementTypesFolderPtr types_folder;
};

/**
 * @brief Build the identifier of an attribute definition.
 * @return `"<attribute name> <requirement type identifier>"`.
 */
std::string attribute_definition_identifier(
    const std::string& attribute_name, const RmIdentifier& reqtype_identifier);

// ============================================================================
// LiveModel
// ============================================================================

/**
 * @brief Owner of the live graph and its identity indices.
 *
 * @details
 * `LiveModel` is the in-memory stand-in for the persisted model. The mutating
 * `add_*` methods are used by model loaders and tests to populate the graph;
 * the change-set calculation only ever reads it (through `ReqFinder`).
 *
 * @par Identity
 * - Every entity's uuid must be unique across the whole model.
 * - Work item identifiers must be unique within their module.
 * - Violations throw `std::invalid_argument` and leave the model unchanged.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Concurrent reads are safe if no concurrent writes occur.
 */
class LiveModel
{
public:
    ModulePtr add_module(const Uuid& uuid, const RmIdentifier& identifier, const std::string& long_name);

    RequirementTypesFolderPtr add_types_folder(Module& module, const Uuid& uuid,
                                               const std::string& identifier = "-2",
                                               const std::string& long_name = "Types");

    DataTypeDefinitionPtr add_data_type_definition(RequirementTypesFolder& folder, const Uuid& uuid,
                                                   const std::string& long_name);

    EnumValuePtr add_enum_value(DataTypeDefinition& dtdef, const Uuid& uuid, const std::string& long_name);

    RequirementTypePtr add_requirement_type(RequirementTypesFolder& folder, const Uuid& uuid,
                                            const RmIdentifier& identifier, const std::string& long_name);

    /**
     * @brief Add an attribute definition to a requirement type.
     * @param data_type Data-type definition of Enum definitions; ignored otherwise.
     * @note The identifier is derived with `attribute_definition_identifier()`.
     */
    AttributeDefinitionPtr add_attribute_definition(RequirementType& reqtype, const Uuid& uuid,
                                                    const std::string& long_name, AttributeKind kind,
                                                    DataTypeDefinitionPtr data_type = nullptr,
                                                    bool multi_valued = false);

    /**
     * @brief Add a folder or requirement below a module or folder.
     * @param parent The owning container. Must belong to `module`.
     * @throw std::invalid_argument if `parent` is a requirement, or the uuid or
     *        identifier is already taken.
     */
    WorkItemPtr add_work_item(Module& module, ItemContainer& parent, ItemKind kind, const Uuid& uuid,
                              const RmIdentifier& identifier, const std::string& long_name,
                              RequirementTypePtr type = nullptr, const std::string& text = {});

    /**
     * @brief Add a scalar attribute value to a work item.
     * @throw std::invalid_argument if `definition` is of Enum kind.
     */
    AttributeValuePtr add_attribute_value(WorkItem& item, const Uuid& uuid,
                                          AttributeDefinitionPtr definition, Primitive value);

    /**
     * @brief Add an enumeration attribute value to a work item.
     * @throw std::invalid_argument if `definition` is not of Enum kind.
     */
    AttributeValuePtr add_enum_attribute_value(WorkItem& item, const Uuid& uuid,
                                               AttributeDefinitionPtr definition,
                                               std::vector<EnumValuePtr> values);

    const std::vector<ModulePtr>& modules() const noexcept
    {
        return m_modules;
    }

    /**
     * @brief Find a work item by identifier anywhere below a module.
     * @return The item, or nullptr if absent.
     */
    WorkItemPtr work_item_by_identifier(const Module& module, const RmIdentifier& identifier) const;

    bool contains_uuid(const Uuid& uuid) const
    {
        return m_uuids.count(uuid) != 0;
    }

private:
    void claim_uuid(const Uuid& uuid);

private:
    std::vector<ModulePtr> m_modules;
    std::unordered_set<Uuid> m_uuids;

    /// Per module uuid: work item identifier to work item.
    std::unordered_map<Uuid, std::unordered_map<RmIdentifier, WorkItemPtr>> m_work_items;
};

} // namespace reqsync
