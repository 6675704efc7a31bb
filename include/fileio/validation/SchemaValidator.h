//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaValidator.h
// Purpose: Validation of tool arguments against the JSON Schema subset used by tool input schemas
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "fileio/JSONRPCTypes.h"

namespace fileio {
namespace validation {

//==========================================================================================================
// SchemaViolation
// Purpose: First violation found while validating a value.
// Fields:
//   location: Dotted path of the offending member ("start_line", "edits[1].op"); empty for the root.
//   message: Human readable description naming the location.
//==========================================================================================================
struct SchemaViolation {
    std::string location;
    std::string message;
};

//==========================================================================================================
// validateAgainstSchema
// Purpose: Checks value against schema. Supported keywords: type (single or list), properties, required,
//          additionalProperties (boolean), items, enum, minimum, maximum, minItems, oneOf, anyOf.
//          Values are never coerced: "3" is not an integer and 3.5 is not an integer.
// Returns:
//   std::nullopt when the value conforms, otherwise the first violation.
//==========================================================================================================
std::optional<SchemaViolation> validateAgainstSchema(const JSONValue& value, const JSONValue& schema);

} // namespace validation
} // namespace fileio
