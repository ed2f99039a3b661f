/**
 * @file action_format_tests.cpp
 * @brief Unit tests for the YAML rendering of change actions
 */
#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>
#include "reqsync/changeset/action_format.hpp"
#include "support/reqsync_fixtures.hpp"

using namespace reqsync;
using namespace reqsync_test;

// ============================================================================
// Scalars and references
// ============================================================================

TEST(ActionFormatTests, Primitive_EachAlternative)
{
    EXPECT_EQ(format_primitive(Primitive{}), "null");
    EXPECT_EQ(format_primitive(Primitive{true}), "true");
    EXPECT_EQ(format_primitive(integer(-3)), "-3");
    EXPECT_EQ(format_primitive(Primitive{0.5}), "0.5");
    EXPECT_EQ(format_primitive(text("Boot")), "\"Boot\"");
}

TEST(ActionFormatTests, Primitive_TimestampIsIsoUtc)
{
    YAML::Node node = YAML::Load(format_primitive(Primitive{Timestamp{std::chrono::seconds{86400 + 60}}}));
    EXPECT_EQ(node.as<std::string>(), "1970-01-02T00:01:00Z");
}

TEST(ActionFormatTests, Primitive_NumericLookingTextStaysText)
{
    EXPECT_EQ(format_primitive(text("101")), "\"101\"");
    EXPECT_EQ(format_primitive(text("true")), "\"true\"");
}

TEST(ActionFormatTests, Primitive_LiteralListIsQuotedSequence)
{
    YAML::Node node = YAML::Load(format_primitive(literals({"Open", "In: review", "- x"})));
    ASSERT_TRUE(node.IsSequence());
    ASSERT_EQ(node.size(), 3u);
    EXPECT_EQ(node[1].as<std::string>(), "In: review");
    EXPECT_EQ(node[2].as<std::string>(), "- x");
}

TEST(ActionFormatTests, Reference_ConcreteAndPromise)
{
    EXPECT_EQ(format_reference(Reference::concrete("u-1")), "!uuid u-1");
    EXPECT_EQ(format_reference(Reference::promise("RequirementType sysreq")), "!promise RequirementType sysreq");
}

// ============================================================================
// Actions
// ============================================================================

TEST(ActionFormatTests, Action_ModifyAndDelete)
{
    ChangeAction action(Reference::concrete("f"));
    action.modify["long_name"] = text("New");
    action.deletions["requirements"] = {Reference::concrete("r1")};

    YAML::Node node = YAML::Load(format_action(action));
    EXPECT_EQ(node["parent"].Tag(), "!uuid");
    EXPECT_EQ(node["parent"].as<std::string>(), "f");
    EXPECT_EQ(node["modify"]["long_name"].as<std::string>(), "New");
    ASSERT_EQ(node["delete"]["requirements"].size(), 1u);
    EXPECT_EQ(node["delete"]["requirements"][0].Tag(), "!uuid");
    EXPECT_EQ(node["delete"]["requirements"][0].as<std::string>(), "r1");
    EXPECT_FALSE(node["extend"].IsDefined());
}

TEST(ActionFormatTests, Action_NestedCreation)
{
    auto payload = std::make_shared<CreatePayload>();
    payload->type_name = "Requirement";
    payload->fields["identifier"] = text("101");
    payload->fields["type"] = Reference::promise("RequirementType sysreq");

    ChangeAction action(Reference::concrete("m"));
    action.extend["requirements"] = {payload, Reference::concrete("r2")};

    YAML::Node node = YAML::Load(format_action(action));
    YAML::Node entries = node["extend"]["requirements"];
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0]["_type"].as<std::string>(), "Requirement");
    EXPECT_EQ(entries[0]["identifier"].as<std::string>(), "101");
    EXPECT_EQ(entries[0]["type"].Tag(), "!promise");
    EXPECT_EQ(entries[0]["type"].as<std::string>(), "RequirementType sysreq");
    EXPECT_EQ(entries[1].Tag(), "!uuid");
    EXPECT_EQ(entries[1].as<std::string>(), "r2");
}

TEST(ActionFormatTests, Action_PromiseIdAndEnumValues)
{
    auto payload = std::make_shared<CreatePayload>();
    payload->type_name = "EnumerationValueAttribute";
    payload->promise_id = "EnumValue Status Open";
    payload->fields["values"] = std::vector<Reference>{Reference::concrete("open-uuid"),
                                                       Reference::promise("EnumValue Status Blocked")};

    ChangeAction action(Reference::concrete("r"));
    action.extend["attributes"] = {payload};

    YAML::Node created = YAML::Load(format_action(action))["extend"]["attributes"][0];
    EXPECT_EQ(created["promise_id"].as<std::string>(), "EnumValue Status Open");
    ASSERT_EQ(created["values"].size(), 2u);
    EXPECT_EQ(created["values"][0].Tag(), "!uuid");
    EXPECT_EQ(created["values"][1].Tag(), "!promise");
    EXPECT_EQ(created["values"][1].as<std::string>(), "EnumValue Status Blocked");
}

TEST(ActionFormatTests, Actions_RenderedAsSequence)
{
    auto first = std::make_shared<ChangeAction>(Reference::concrete("a"));
    first->modify["attributes"] = AttributeChanges{{"Priority", integer(2)}};
    auto second = std::make_shared<ChangeAction>(Reference::concrete("b"));
    second->modify["text"] = text("t");

    YAML::Node node = YAML::Load(format_actions({first, second}));
    ASSERT_TRUE(node.IsSequence());
    ASSERT_EQ(node.size(), 2u);
    EXPECT_EQ(node[0]["modify"]["attributes"]["Priority"].as<std::int64_t>(), 2);
    EXPECT_EQ(node[1]["parent"].as<std::string>(), "b");
    EXPECT_EQ(node[1]["modify"]["text"].as<std::string>(), "t");
}

TEST(ActionFormatTests, Actions_MultiLineQuotedTextStaysOneScalar)
{
    const std::string awkward = "line one\n\"quoted\": x\n- y";
    AlignedFixture fx;
    TrackerSnapshot snapshot = AlignedFixture::snapshot();
    snapshot.items[2] =
        WorkItemSpec("300", "Requirement 300", std::string("sysreq"), AttributeMap{}, {}, awkward);

    auto actions = calculate(snapshot, fx.model, fx.config);
    ASSERT_EQ(actions.size(), 1u);

    YAML::Node node = YAML::Load(format_actions(actions));
    ASSERT_TRUE(node.IsSequence());
    ASSERT_EQ(node.size(), 1u);
    ASSERT_TRUE(node[0].IsMap());
    EXPECT_EQ(node[0].size(), 2u);
    EXPECT_EQ(node[0]["parent"].as<std::string>(), "req-300-uuid");
    EXPECT_EQ(node[0]["modify"].size(), 1u);
    EXPECT_EQ(node[0]["modify"]["text"].as<std::string>(), awkward);
}
