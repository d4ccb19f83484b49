#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "raidlink/core/protocol/game/parser/helpers.hpp"
#include "raidlink/core/protocol/game/parser/result.hpp"

#include "simdjson.h"

/*
================================================================================
Parsing Adapters (Domain-Level Converters)
================================================================================

Adapters sit between the low-level helpers and the event parsers. They
convert validated JSON primitives into domain values and enforce domain
constraints (non-empty identifiers, positive intervals).

  - helper::*   JSON mechanics and type extraction
  - adapter::*  domain semantics and validation
  - parser::*   per-event orchestration and logging

Adapters do not log.
================================================================================
*/


namespace raidlink::core::protocol::game::parser::adapter {

// ------------------------------------------------------------
// Identifier: non-empty string, or an integer rendered as text
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_id_required(const simdjson::dom::element& obj, const char* key, std::string& out) {
    if (helper::require_object(obj) != Result::Parsed) {
        return Result::InvalidSchema;
    }
    auto field = obj[key];
    if (field.error()) {
        return Result::InvalidSchema;
    }
    std::string_view sv;
    if (!field.get(sv)) {
        if (sv.empty()) {
            return Result::InvalidValue;
        }
        out = std::string(sv);
        return Result::Parsed;
    }
    std::int64_t i = 0;
    if (!field.get(i)) {
        out = std::to_string(i);
        return Result::Parsed;
    }
    std::uint64_t u = 0;
    if (!field.get(u)) {
        out = std::to_string(u);
        return Result::Parsed;
    }
    return Result::InvalidSchema;
}

// ------------------------------------------------------------
// Non-empty text
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_text_required(const simdjson::dom::element& obj, const char* key, std::string& out) {
    std::string_view sv;
    auto r = helper::parse_string_required(obj, key, sv);
    if (r != Result::Parsed) {
        return r;
    }
    if (sv.empty()) {
        return Result::InvalidValue;
    }
    out = std::string(sv);
    return Result::Parsed;
}

// ------------------------------------------------------------
// Interval in seconds: strictly positive
// ------------------------------------------------------------
[[nodiscard]]
inline Result parse_interval_seconds_required(const simdjson::dom::element& obj, const char* key, double& out) noexcept {
    auto r = helper::parse_double_required(obj, key, out);
    if (r != Result::Parsed) {
        return r;
    }
    if (!(out > 0.0)) {
        return Result::InvalidValue;
    }
    return Result::Parsed;
}

} // namespace raidlink::core::protocol::game::parser::adapter
