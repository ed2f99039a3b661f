/**
 * @file action_format.cpp
 */
#include "reqsync/changeset/action_format.hpp"

#include <ctime>

#include <yaml-cpp/yaml.h>

namespace reqsync
{

namespace
{

std::string format_timestamp(const Timestamp& t)
{
    std::time_t seconds = std::chrono::system_clock::to_time_t(t);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

void emit_primitive(YAML::Emitter& out, const Primitive& value)
{
    struct Visitor
    {
        YAML::Emitter& out;

        void operator()(std::monostate) const
        {
            out << YAML::Null;
        }
        void operator()(bool b) const
        {
            out << b;
        }
        void operator()(std::int64_t i) const
        {
            out << i;
        }
        void operator()(double d) const
        {
            out << d;
        }
        // Always quoted, so that "101" or "true" stay text when read back.
        void operator()(const std::string& s) const
        {
            out << YAML::DoubleQuoted << s;
        }
        void operator()(const Timestamp& t) const
        {
            out << format_timestamp(t);
        }
        void operator()(const std::vector<std::string>& list) const
        {
            out << YAML::Flow << YAML::BeginSeq;
            for (const auto& literal : list)
            {
                out << YAML::DoubleQuoted << literal;
            }
            out << YAML::EndSeq;
        }
    };
    std::visit(Visitor{out}, value);
}

void emit_reference(YAML::Emitter& out, const Reference& ref)
{
    out << YAML::LocalTag(ref.is_promise() ? "promise" : "uuid") << ref.key();
}

void emit_references(YAML::Emitter& out, const std::vector<Reference>& refs)
{
    out << YAML::Flow << YAML::BeginSeq;
    for (const auto& ref : refs)
    {
        emit_reference(out, ref);
    }
    out << YAML::EndSeq;
}

void emit_field_value(YAML::Emitter& out, const FieldValue& value)
{
    if (const auto* primitive = std::get_if<Primitive>(&value))
    {
        emit_primitive(out, *primitive);
        return;
    }
    if (const auto* ref = std::get_if<Reference>(&value))
    {
        emit_reference(out, *ref);
        return;
    }
    if (const auto* refs = std::get_if<std::vector<Reference>>(&value))
    {
        emit_references(out, *refs);
        return;
    }

    out << YAML::BeginMap;
    for (const auto& [name, change] : std::get<AttributeChanges>(value))
    {
        out << YAML::Key << name << YAML::Value;
        if (const auto* primitive = std::get_if<Primitive>(&change))
        {
            emit_primitive(out, *primitive);
        }
        else
        {
            emit_references(out, std::get<std::vector<Reference>>(change));
        }
    }
    out << YAML::EndMap;
}

void emit_fields(YAML::Emitter& out, const ModifyMap& fields)
{
    for (const auto& [name, value] : fields)
    {
        out << YAML::Key << name << YAML::Value;
        emit_field_value(out, value);
    }
}

void emit_payload(YAML::Emitter& out, const CreatePayload& payload);

void emit_slots(YAML::Emitter& out, const ExtendMap& slots)
{
    for (const auto& [slot, entries] : slots)
    {
        out << YAML::Key << slot << YAML::Value << YAML::BeginSeq;
        for (const auto& entry : entries)
        {
            if (const auto* ref = std::get_if<Reference>(&entry))
            {
                emit_reference(out, *ref);
            }
            else
            {
                emit_payload(out, *std::get<CreatePayloadPtr>(entry));
            }
        }
        out << YAML::EndSeq;
    }
}

void emit_payload(YAML::Emitter& out, const CreatePayload& payload)
{
    out << YAML::BeginMap;
    out << YAML::Key << "_type" << YAML::Value << payload.type_name;
    if (!payload.promise_id.empty())
    {
        out << YAML::Key << "promise_id" << YAML::Value << payload.promise_id;
    }
    emit_fields(out, payload.fields);
    emit_slots(out, payload.children);
    out << YAML::EndMap;
}

void emit_action(YAML::Emitter& out, const ChangeAction& action)
{
    out << YAML::BeginMap;
    out << YAML::Key << "parent" << YAML::Value;
    emit_reference(out, action.parent);
    if (!action.extend.empty())
    {
        out << YAML::Key << "extend" << YAML::Value << YAML::BeginMap;
        emit_slots(out, action.extend);
        out << YAML::EndMap;
    }
    if (!action.modify.empty())
    {
        out << YAML::Key << "modify" << YAML::Value << YAML::BeginMap;
        emit_fields(out, action.modify);
        out << YAML::EndMap;
    }
    if (!action.deletions.empty())
    {
        out << YAML::Key << "delete" << YAML::Value << YAML::BeginMap;
        for (const auto& [slot, refs] : action.deletions)
        {
            out << YAML::Key << slot << YAML::Value << YAML::BeginSeq;
            for (const auto& ref : refs)
            {
                emit_reference(out, ref);
            }
            out << YAML::EndSeq;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
}

YAML::Emitter& configure(YAML::Emitter& out)
{
    out.SetNullFormat(YAML::LowerNull);
    out.SetBoolFormat(YAML::TrueFalseBool);
    return out;
}

std::string finish(const YAML::Emitter& out)
{
    if (!out.good())
    {
        throw std::logic_error("action_format: YAML emitter error: " + out.GetLastError());
    }
    return out.c_str();
}

} // namespace

std::string format_primitive(const Primitive& value)
{
    YAML::Emitter out;
    emit_primitive(configure(out), value);
    return finish(out);
}

std::string format_reference(const Reference& ref)
{
    YAML::Emitter out;
    emit_reference(configure(out), ref);
    return finish(out);
}

std::string format_action(const ChangeAction& action)
{
    YAML::Emitter out;
    emit_action(configure(out), action);
    return finish(out);
}

std::string format_actions(const std::vector<ChangeActionPtr>& actions)
{
    YAML::Emitter out;
    configure(out) << YAML::BeginSeq;
    for (const auto& action : actions)
    {
        emit_action(out, *action);
    }
    out << YAML::EndSeq;
    return finish(out) + "\n";
}

} // namespace reqsync
