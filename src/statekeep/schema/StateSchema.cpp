#include "schema/StateSchema.hpp"

#include "core/Clock.hpp"
#include "log/TaggedLogger.hpp"

#include <utility>

namespace SK {

namespace {

constexpr std::size_t kMaxObservedLength = 120;

auto observedValue(nlohmann::json const& value) -> std::string {
    auto text = value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    if (text.size() > kMaxObservedLength) {
        text.resize(kMaxObservedLength);
        text.append("...");
    }
    return text;
}

auto matches(FieldType type, nlohmann::json const& value) -> bool {
    switch (type) {
    case FieldType::Boolean:
        return value.is_boolean();
    case FieldType::String:
        return value.is_string();
    case FieldType::Number:
        return value.is_number();
    }
    return false;
}

auto violation(StateSchema const& schema, std::string field, std::string_view expected, std::string observed)
    -> SchemaViolation {
    return SchemaViolation{schema.kind, std::move(field), std::string{expected}, std::move(observed)};
}

} // namespace

auto fieldTypeName(FieldType type) -> std::string_view {
    switch (type) {
    case FieldType::Boolean:
        return "boolean";
    case FieldType::String:
        return "string";
    case FieldType::Number:
        return "number";
    }
    return "unknown";
}

auto SchemaViolation::describe() const -> std::string {
    return "Invalid '" + this->kind + "' state: field '" + this->field + "' expected " + this->expected + ", observed "
           + this->observed;
}

auto checkRecord(StateSchema const& schema, nlohmann::json const& candidate) -> std::optional<SchemaViolation> {
    if (!candidate.is_object())
        return violation(schema, "<root>", "object", observedValue(candidate));

    for (auto const& spec : schema.fields) {
        auto it = candidate.find(spec.name);
        if (it == candidate.end()) {
            if (spec.required)
                return violation(schema, spec.name, fieldTypeName(spec.type), "<missing>");
            continue;
        }
        if (!spec.required && it->is_null())
            continue;
        if (!matches(spec.type, *it))
            return violation(schema, spec.name, fieldTypeName(spec.type), observedValue(*it));
    }
    return std::nullopt;
}

auto isExpired(StateSchema const& schema, nlohmann::json const& record, std::chrono::system_clock::time_point now)
    -> bool {
    if (!schema.expiry || !record.is_object())
        return false;
    auto it = record.find(schema.expiry->field);
    if (it == record.end() || !it->is_number())
        return false;
    auto const stampMs = it->get<double>();
    auto const ageMs   = static_cast<double>(toMillis(now)) - stampMs;
    return ageMs > static_cast<double>(schema.expiry->ttl.count());
}

auto SchemaRegistry::withBuiltinKinds() -> SchemaRegistry {
    SchemaRegistry registry;
    registry.registerSchema(ralphSchema());
    registry.registerSchema(maestroSchema());
    return registry;
}

void SchemaRegistry::registerSchema(StateSchema schema) {
    auto kind = schema.kind;
    this->schemas.insert_or_assign(std::move(kind), std::move(schema));
}

auto SchemaRegistry::find(std::string_view kind) const -> StateSchema const* {
    auto it = this->schemas.find(std::string{kind});
    if (it == this->schemas.end())
        return nullptr;
    return &it->second;
}

auto SchemaRegistry::validate(std::string_view kind, nlohmann::json const& candidate) const -> Validated {
    auto const* schema = this->find(kind);
    if (!schema) {
        SchemaViolation unknown{std::string{kind}, "<kind>", "registered kind", std::string{kind}};
        sk_warn("Unknown state kind '" + std::string{kind} + "'", "SchemaRegistry");
        return std::unexpected(std::move(unknown));
    }

    if (auto failure = checkRecord(*schema, candidate)) {
        sk_warn(failure->describe(), "SchemaRegistry");
        return std::unexpected(std::move(*failure));
    }
    return candidate;
}

auto ralphSchema() -> StateSchema {
    return StateSchema{
        .kind   = "ralph",
        .fields = {
            {"active", FieldType::Boolean},
            {"storyId", FieldType::String},
            {"activatedAt", FieldType::Number},
            {"prdPath", FieldType::String, false},
            {"iteration", FieldType::Number, false},
        },
        .expiry = std::nullopt,
    };
}

auto maestroSchema() -> StateSchema {
    return StateSchema{
        .kind   = "maestro",
        .fields = {
            {"active", FieldType::Boolean},
            {"taskType", FieldType::String},
            {"reconComplete", FieldType::Boolean},
            {"interviewComplete", FieldType::Boolean},
            {"planApproved", FieldType::Boolean},
            {"activatedAt", FieldType::Number},
        },
        .expiry = ExpiryRule{"activatedAt", std::chrono::hours{1}},
    };
}

} // namespace SK
