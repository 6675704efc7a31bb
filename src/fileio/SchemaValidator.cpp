//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaValidator.cpp
// Purpose: Recursive JSON Schema subset validator
//==========================================================================================================

#include "fileio/validation/SchemaValidator.h"

#include <format>
#include <vector>

namespace fileio {
namespace validation {

namespace {

std::string describeLocation(const std::string& location) {
    return location.empty() ? std::string("arguments") : std::format("'{}'", location);
}

std::string childLocation(const std::string& parent, const std::string& key) {
    return parent.empty() ? key : parent + "." + key;
}

const char* jsonTypeName(const JSONValue& v) {
    switch (v.value.index()) {
        case 0: return "null";
        case 1: return "boolean";
        case 2: return "integer";
        case 3: return "number";
        case 4: return "string";
        case 5: return "array";
        default: return "object";
    }
}

bool matchesType(const JSONValue& v, const std::string& type) {
    if (type == "object") return v.isObject();
    if (type == "array") return v.isArray();
    if (type == "string") return v.isString();
    if (type == "boolean") return std::holds_alternative<bool>(v.value);
    if (type == "null") return v.isNull();
    if (type == "integer") return std::holds_alternative<int64_t>(v.value);
    if (type == "number") return std::holds_alternative<int64_t>(v.value) || std::holds_alternative<double>(v.value);
    return false;
}

std::optional<double> asNumber(const JSONValue& v) {
    if (const auto* i = std::get_if<int64_t>(&v.value)) return static_cast<double>(*i);
    if (const auto* d = std::get_if<double>(&v.value)) return *d;
    return std::nullopt;
}

std::vector<std::string> typeList(const JSONValue& typeVal) {
    std::vector<std::string> out;
    if (const auto* s = std::get_if<std::string>(&typeVal.value)) {
        out.push_back(*s);
    } else if (const auto* arr = std::get_if<JSONValue::Array>(&typeVal.value)) {
        for (const auto& t : *arr) {
            if (t && t->isString()) out.push_back(std::get<std::string>(t->value));
        }
    }
    return out;
}

std::optional<SchemaViolation> validateAt(const JSONValue& value, const JSONValue& schema, const std::string& location);

std::optional<SchemaViolation> checkType(const JSONValue& value, const JSONValue& schema, const std::string& location) {
    const JSONValue* typeVal = schema.find("type");
    if (!typeVal) {
        return std::nullopt;
    }
    const std::vector<std::string> types = typeList(*typeVal);
    for (const auto& t : types) {
        if (matchesType(value, t)) {
            return std::nullopt;
        }
    }
    std::string expected;
    for (std::size_t i = 0; i < types.size(); ++i) {
        if (i > 0) expected += (i + 1 == types.size()) ? " or " : ", ";
        expected += types[i];
    }
    // Integers with a zero floor get the wording clients key on
    const JSONValue* minimum = schema.find("minimum");
    if (types.size() == 1 && types[0] == "integer" && minimum && asNumber(*minimum) == 0.0) {
        return SchemaViolation{location, std::format("{} must be a non-negative integer", describeLocation(location))};
    }
    return SchemaViolation{location, std::format("{} must be of type {} (got {})",
                                                 describeLocation(location), expected, jsonTypeName(value))};
}

std::optional<SchemaViolation> checkObject(const JSONValue& value, const JSONValue& schema, const std::string& location) {
    const auto* obj = std::get_if<JSONValue::Object>(&value.value);
    if (!obj) {
        return std::nullopt;
    }
    if (const JSONValue* required = schema.find("required")) {
        if (const auto* req = std::get_if<JSONValue::Array>(&required->value)) {
            for (const auto& r : *req) {
                if (!r || !r->isString()) continue;
                const std::string& key = std::get<std::string>(r->value);
                auto it = obj->find(key);
                if (it == obj->end() || !it->second) {
                    return SchemaViolation{childLocation(location, key),
                                           std::format("Missing required parameter: {}", childLocation(location, key))};
                }
            }
        }
    }
    const JSONValue* properties = schema.find("properties");
    const JSONValue* additional = schema.find("additionalProperties");
    const bool closed = additional && std::holds_alternative<bool>(additional->value) && !std::get<bool>(additional->value);
    for (const auto& [key, member] : *obj) {
        const JSONValue* propSchema = properties ? properties->find(key) : nullptr;
        if (!propSchema) {
            if (closed) {
                return SchemaViolation{childLocation(location, key),
                                       std::format("Unknown parameter: {}", childLocation(location, key))};
            }
            continue;
        }
        const JSONValue nullValue;
        if (auto v = validateAt(member ? *member : nullValue, *propSchema, childLocation(location, key))) {
            return v;
        }
    }
    return std::nullopt;
}

std::optional<SchemaViolation> checkArray(const JSONValue& value, const JSONValue& schema, const std::string& location) {
    const auto* arr = std::get_if<JSONValue::Array>(&value.value);
    if (!arr) {
        return std::nullopt;
    }
    if (const JSONValue* minItems = schema.find("minItems")) {
        if (auto n = asNumber(*minItems); n && static_cast<double>(arr->size()) < *n) {
            return SchemaViolation{location, std::format("{} must contain at least {} item(s)",
                                                         describeLocation(location), static_cast<int64_t>(*n))};
        }
    }
    const JSONValue* items = schema.find("items");
    if (!items) {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < arr->size(); ++i) {
        const JSONValue nullValue;
        const JSONValue& item = (*arr)[i] ? *(*arr)[i] : nullValue;
        if (auto v = validateAt(item, *items, std::format("{}[{}]", location.empty() ? "arguments" : location, i))) {
            return v;
        }
    }
    return std::nullopt;
}

std::optional<SchemaViolation> checkScalars(const JSONValue& value, const JSONValue& schema, const std::string& location) {
    if (const JSONValue* enumVal = schema.find("enum")) {
        if (const auto* options = std::get_if<JSONValue::Array>(&enumVal->value)) {
            bool found = false;
            std::string allowed;
            for (const auto& opt : *options) {
                if (!opt) continue;
                if (!allowed.empty()) allowed += ", ";
                allowed += serializeJSONValue(*opt);
                if (*opt == value) found = true;
            }
            if (!found) {
                return SchemaViolation{location, std::format("{} must be one of: {}", describeLocation(location), allowed)};
            }
        }
    }
    const auto number = asNumber(value);
    if (!number) {
        return std::nullopt;
    }
    if (const JSONValue* minimum = schema.find("minimum")) {
        if (auto m = asNumber(*minimum); m && *number < *m) {
            if (*m == 0.0) {
                return SchemaViolation{location, std::format("{} must be a non-negative integer", describeLocation(location))};
            }
            return SchemaViolation{location, std::format("{} must be >= {}", describeLocation(location), *m)};
        }
    }
    if (const JSONValue* maximum = schema.find("maximum")) {
        if (auto m = asNumber(*maximum); m && *number > *m) {
            return SchemaViolation{location, std::format("{} must be <= {}", describeLocation(location), *m)};
        }
    }
    return std::nullopt;
}

std::optional<SchemaViolation> validateAt(const JSONValue& value, const JSONValue& schema, const std::string& location) {
    if (!schema.isObject()) {
        return std::nullopt;
    }
    if (const JSONValue* oneOf = schema.find("oneOf")) {
        if (const auto* alternatives = std::get_if<JSONValue::Array>(&oneOf->value)) {
            std::size_t matches = 0;
            std::optional<SchemaViolation> firstFailure;
            for (const auto& alt : *alternatives) {
                if (!alt) continue;
                auto v = validateAt(value, *alt, location);
                if (!v) {
                    ++matches;
                } else if (!firstFailure) {
                    firstFailure = v;
                }
            }
            if (matches != 1) {
                if (matches == 0 && firstFailure) {
                    return SchemaViolation{location, std::format("{} does not match any allowed form ({})",
                                                                 describeLocation(location), firstFailure->message)};
                }
                return SchemaViolation{location, std::format("{} matches more than one allowed form", describeLocation(location))};
            }
        }
    }
    if (const JSONValue* anyOf = schema.find("anyOf")) {
        if (const auto* alternatives = std::get_if<JSONValue::Array>(&anyOf->value)) {
            std::optional<SchemaViolation> firstFailure;
            bool matched = alternatives->empty();
            for (const auto& alt : *alternatives) {
                if (!alt) continue;
                auto v = validateAt(value, *alt, location);
                if (!v) {
                    matched = true;
                    break;
                }
                if (!firstFailure) firstFailure = v;
            }
            // Report the first alternative's complaint; it names what the preferred form is missing
            if (!matched && firstFailure) return firstFailure;
        }
    }
    if (auto v = checkType(value, schema, location)) return v;
    if (auto v = checkScalars(value, schema, location)) return v;
    if (auto v = checkObject(value, schema, location)) return v;
    if (auto v = checkArray(value, schema, location)) return v;
    return std::nullopt;
}

} // namespace

std::optional<SchemaViolation> validateAgainstSchema(const JSONValue& value, const JSONValue& schema) {
    return validateAt(value, schema, std::string());
}

} // namespace validation
} // namespace fileio
