#pragma once

#include <chrono>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <parallel_hashmap/phmap.h>

namespace SK {

enum class FieldType {
    Boolean,
    String,
    Number
};

[[nodiscard]] auto fieldTypeName(FieldType type) -> std::string_view;

struct FieldSpec {
    std::string name;
    FieldType   type;
    bool        required = true;
};

// A record whose `field` (epoch milliseconds) is older than `ttl` is treated
// as absent by readers.
struct ExpiryRule {
    std::string               field;
    std::chrono::milliseconds ttl;
};

struct StateSchema {
    std::string               kind;
    std::vector<FieldSpec>    fields;
    std::optional<ExpiryRule> expiry;
};

struct SchemaViolation {
    std::string kind;
    std::string field;
    std::string expected;
    std::string observed;

    [[nodiscard]] auto describe() const -> std::string;
};

using Validated = std::expected<nlohmann::json, SchemaViolation>;

/**
 * Structural contract checker for deserialized state records.
 *
 * validate() never throws. It checks that the candidate is a JSON object, that
 * every required field is present with its declared primitive type and that
 * every optional field, when set, has its declared type. The first violation
 * ends the check. A valid candidate is returned unchanged; every violation is
 * logged once at warn level with kind, field, expected type and observed value.
 */
class SchemaRegistry {
public:
    SchemaRegistry() = default;

    [[nodiscard]] static auto withBuiltinKinds() -> SchemaRegistry;

    // Adds or replaces the schema for schema.kind.
    void registerSchema(StateSchema schema);

    [[nodiscard]] auto find(std::string_view kind) const -> StateSchema const*;
    [[nodiscard]] auto contains(std::string_view kind) const -> bool { return this->find(kind) != nullptr; }

    [[nodiscard]] auto validate(std::string_view kind, nlohmann::json const& candidate) const -> Validated;

private:
    phmap::flat_hash_map<std::string, StateSchema> schemas;
};

[[nodiscard]] auto checkRecord(StateSchema const& schema, nlohmann::json const& candidate)
    -> std::optional<SchemaViolation>;

[[nodiscard]] auto isExpired(StateSchema const& schema,
                             nlohmann::json const& record,
                             std::chrono::system_clock::time_point now) -> bool;

[[nodiscard]] auto ralphSchema() -> StateSchema;
[[nodiscard]] auto maestroSchema() -> StateSchema;

} // namespace SK
