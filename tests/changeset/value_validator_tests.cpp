/**
 * @file value_validator_tests.cpp
 * @brief Unit tests for ValueValidator
 */
#include <gtest/gtest.h>
#include "reqsync/changeset/value_validator.hpp"
#include "support/reqsync_fixtures.hpp"

using namespace reqsync;
using namespace reqsync_test;

namespace
{

/// A requirement type declaring one attribute of every kind.
TrackerSnapshot all_kinds_snapshot()
{
    TrackerSnapshot snapshot;
    snapshot.id = "project-1";
    snapshot.data_types.insert("Status", {"Open", "Closed"});

    RequirementTypeSpec spec;
    spec.long_name = "All kinds";
    spec.attributes.insert("Title", AttributeDefinitionSpec{AttributeKind::String, false});
    spec.attributes.insert("Status", AttributeDefinitionSpec{AttributeKind::Enum, true});
    spec.attributes.insert("Due", AttributeDefinitionSpec{AttributeKind::Date, false});
    spec.attributes.insert("Priority", AttributeDefinitionSpec{AttributeKind::Integer, false});
    spec.attributes.insert("Weight", AttributeDefinitionSpec{AttributeKind::Float, false});
    spec.attributes.insert("Safety", AttributeDefinitionSpec{AttributeKind::Boolean, false});
    spec.attributes.insert("Phase", AttributeDefinitionSpec{AttributeKind::Enum, false});
    snapshot.requirement_types.insert("all", spec);
    return snapshot;
}

} // namespace

// ============================================================================
// Accepted values
// ============================================================================

TEST(ValueValidatorTests, Accept_EachKindWithItsShape)
{
    TrackerSnapshot snapshot = all_kinds_snapshot();
    ValueValidator validator(snapshot);
    const auto& spec = snapshot.requirement_types.at("all");

    EXPECT_EQ(validator.validate("Title", text("Hello"), spec).kind, AttributeKind::String);
    EXPECT_EQ(validator.validate("Due", Primitive{Timestamp{}}, spec).kind, AttributeKind::Date);
    EXPECT_EQ(validator.validate("Priority", integer(3), spec).kind, AttributeKind::Integer);
    EXPECT_EQ(validator.validate("Weight", Primitive{0.5}, spec).kind, AttributeKind::Float);
    EXPECT_EQ(validator.validate("Safety", Primitive{true}, spec).kind, AttributeKind::Boolean);
}

TEST(ValueValidatorTests, Accept_StorageKeyDependsOnKind)
{
    TrackerSnapshot snapshot = all_kinds_snapshot();
    ValueValidator validator(snapshot);
    const auto& spec = snapshot.requirement_types.at("all");

    auto scalar = validator.validate("Priority", integer(3), spec);
    EXPECT_EQ(scalar.key, "value");
    EXPECT_EQ(scalar.value, integer(3));

    auto enumeration = validator.validate("Status", literals({"Open", "Closed"}), spec);
    EXPECT_EQ(enumeration.kind, AttributeKind::Enum);
    EXPECT_EQ(enumeration.key, "values");
    EXPECT_EQ(enumeration.value, literals({"Open", "Closed"}));
}

TEST(ValueValidatorTests, Accept_EnumWithAtLeastOneDeclaredLiteral)
{
    TrackerSnapshot snapshot = all_kinds_snapshot();
    ValueValidator validator(snapshot);

    EXPECT_NO_THROW(validator.validate("Status", literals({"Open", "Unknown"}),
                                       snapshot.requirement_types.at("all")));
}

// ============================================================================
// Rejected values
// ============================================================================

TEST(ValueValidatorTests, Reject_EnumLiteralNotDeclared)
{
    TrackerSnapshot snapshot = all_kinds_snapshot();
    ValueValidator validator(snapshot);

    try
    {
        validator.validate("Status", literals({"Reopened"}), snapshot.requirement_types.at("all"));
        FAIL() << "Expected InvalidFieldValueError";
    }
    catch (const InvalidFieldValueError& e)
    {
        EXPECT_EQ(e.code(), ReqSyncErrorCode::InvalidFieldValue);
        EXPECT_EQ(e.attribute_name(), "Status");
        EXPECT_EQ(e.value(), literals({"Reopened"}));
        EXPECT_EQ(std::string(e.what()).rfind("Broken snapshot: Invalid field value", 0), 0u);
    }
}

TEST(ValueValidatorTests, Reject_WrongScalarShape)
{
    TrackerSnapshot snapshot = all_kinds_snapshot();
    ValueValidator validator(snapshot);
    const auto& spec = snapshot.requirement_types.at("all");

    EXPECT_THROW(validator.validate("Title", integer(1), spec), InvalidFieldValueError);
    EXPECT_THROW(validator.validate("Status", text("Open"), spec), InvalidFieldValueError);
    EXPECT_THROW(validator.validate("Due", text("2024-01-01"), spec), InvalidFieldValueError);
}

TEST(ValueValidatorTests, Reject_NoNumericConversions)
{
    TrackerSnapshot snapshot = all_kinds_snapshot();
    ValueValidator validator(snapshot);
    const auto& spec = snapshot.requirement_types.at("all");

    // An integer is not a Float and a boolean is not an Integer.
    EXPECT_THROW(validator.validate("Weight", integer(1), spec), InvalidFieldValueError);
    EXPECT_THROW(validator.validate("Priority", Primitive{true}, spec), InvalidFieldValueError);
    EXPECT_THROW(validator.validate("Safety", integer(1), spec), InvalidFieldValueError);
}

TEST(ValueValidatorTests, Reject_NullNeverValidates)
{
    TrackerSnapshot snapshot = all_kinds_snapshot();
    ValueValidator validator(snapshot);
    EXPECT_THROW(validator.validate("Title", Primitive{}, snapshot.requirement_types.at("all")),
                 InvalidFieldValueError);
}

TEST(ValueValidatorTests, Reject_UndeclaredAttribute)
{
    TrackerSnapshot snapshot = all_kinds_snapshot();
    ValueValidator validator(snapshot);
    EXPECT_THROW(validator.validate("Owner", text("me"), snapshot.requirement_types.at("all")),
                 InvalidFieldValueError);
}

TEST(ValueValidatorTests, Reject_EnumWithoutDataTypeDefinition)
{
    TrackerSnapshot snapshot = all_kinds_snapshot();
    ValueValidator validator(snapshot);

    // "Phase" is an Enum attribute but no data type named "Phase" exists.
    EXPECT_EQ(validator.enum_options("Phase"), nullptr);
    EXPECT_THROW(validator.validate("Phase", literals({"Design"}), snapshot.requirement_types.at("all")),
                 InvalidFieldValueError);
}

TEST(ValueValidatorTests, MatchesKind_TableCoversEveryKind)
{
    EXPECT_TRUE(matches_kind(AttributeKind::String, text("x")));
    EXPECT_TRUE(matches_kind(AttributeKind::Enum, literals({})));
    EXPECT_TRUE(matches_kind(AttributeKind::Date, Primitive{Timestamp{}}));
    EXPECT_TRUE(matches_kind(AttributeKind::Integer, integer(0)));
    EXPECT_TRUE(matches_kind(AttributeKind::Float, Primitive{1.0}));
    EXPECT_TRUE(matches_kind(AttributeKind::Boolean, Primitive{false}));
    EXPECT_FALSE(matches_kind(AttributeKind::String, Primitive{}));
}
