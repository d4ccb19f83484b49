#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "raidlink/core/protocol/game/parser/result.hpp"

#include "simdjson.h"

/*
================================================================================
JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Low-level helpers used by the event parsers to extract primitive values from
simdjson DOM elements.

  - Enforce structure (object presence, type correctness)
  - Parse primitive field types (string, number)
  - Strict optional-field handling: an absent or null optional is fine, a
    present optional of the wrong type is InvalidSchema

Helpers never log, never throw and never interpret values semantically.
Every helper returns Result::Parsed on success.
================================================================================
*/


namespace raidlink::core::protocol::game::parser::helper {

// ============================================================================
// ROOT TYPE
// ============================================================================

[[nodiscard]]
inline Result require_object(const simdjson::dom::element& root) noexcept {
    return (root.type() == simdjson::dom::element_type::OBJECT) ? Result::Parsed : Result::InvalidSchema;
}

// ============================================================================
// REQUIRED FIELD PARSERS
// ============================================================================

[[nodiscard]]
inline Result parse_string_required(const simdjson::dom::element& obj, const char* key, std::string_view& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    if (field.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_double_required(const simdjson::dom::element& obj, const char* key, double& out) noexcept {
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    // get_double() also accepts integer encodings
    if (field.get_double().get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

// ============================================================================
// OPTIONAL FIELD PARSERS
// ============================================================================

[[nodiscard]]
inline Result parse_string_optional(const simdjson::dom::element& obj, const char* key, std::optional<std::string>& out) noexcept {
    out.reset();
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error() || field.is_null()) {
        return Result::Parsed; // optional, not present
    }
    std::string_view sv;
    if (field.get(sv)) {
        return Result::InvalidSchema;
    }
    out = std::string(sv);
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_double_optional(const simdjson::dom::element& obj, const char* key, std::optional<double>& out) noexcept {
    out.reset();
    if (require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error() || field.is_null()) {
        return Result::Parsed; // optional, not present
    }
    double value = 0.0;
    if (field.get_double().get(value)) {
        return Result::InvalidSchema;
    }
    out = value;
    return Result::Parsed;
}

} // namespace raidlink::core::protocol::game::parser::helper
