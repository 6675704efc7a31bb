//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: Tool lookup, argument validation, and fault containment around handler invocation
//==========================================================================================================

#include "fileio/ToolRegistry.h"
#include "fileio/errors/FileIoError.h"
#include "fileio/validation/SchemaValidator.h"
#include "logging/Logger.h"

#include <format>
#include <stdexcept>

namespace fileio {

ToolRegistry::ToolRegistry(std::vector<ToolDefinition> defs)
    : definitions(std::move(defs)) {
    byName.reserve(definitions.size());
    for (std::size_t i = 0; i < definitions.size(); ++i) {
        auto [it, inserted] = byName.emplace(definitions[i].name(), i);
        if (!inserted) {
            throw std::invalid_argument("Duplicate tool name: " + definitions[i].name());
        }
    }
}

const ToolRegistry& ToolRegistry::Default() {
    static const ToolRegistry registry(BuildToolCatalog());
    return registry;
}

const ToolDefinition* ToolRegistry::Find(const std::string& name) const {
    auto it = byName.find(name);
    if (it == byName.end()) {
        return nullptr;
    }
    return &definitions[it->second];
}

Resolution ToolRegistry::Resolve(const std::string& name, const std::optional<JSONValue>& arguments,
                                 const JSONRPCId& requestId) const {
    Resolution out;
    const ToolDefinition* def = Find(name);
    if (!def) {
        LOG_WARN("tools/call for unknown tool '{}' (id={})", name, idToString(requestId));
        out.error = errors::makeError(JSONRPCErrorCodes::MethodNotFound, "Tool not found: " + name);
        return out;
    }

    JSONValue args = (arguments.has_value() && !arguments->isNull()) ? *arguments : JSONValue{JSONValue::Object{}};
    if (!args.isObject()) {
        out.error = errors::makeError(JSONRPCErrorCodes::InvalidParams, "Tool arguments must be an object");
        return out;
    }
    if (auto violation = validation::validateAgainstSchema(args, def->metadata.inputSchema)) {
        LOG_DEBUG("Arguments for {} rejected: {}", name, violation->message);
        JSONValue::Object data;
        data["tool"] = std::make_shared<JSONValue>(name);
        if (!violation->location.empty()) {
            data["field"] = std::make_shared<JSONValue>(violation->location);
        }
        out.error = errors::makeError(JSONRPCErrorCodes::InvalidParams, violation->message,
                                      JSONValue{std::move(data)});
        return out;
    }
    out.invocation = Invocation{def, std::move(args), requestId};
    return out;
}

DispatchResult ToolRegistry::Invoke(const Invocation& invocation) const {
    DispatchResult out;
    const ToolDefinition& def = *invocation.definition;
    const std::string id = idToString(invocation.requestId);
    LOG_DEBUG("Invoking {} (id={})", def.name(), id);
    try {
        out.result = InvokeTool(def.kind, invocation.arguments);
    } catch (const errors::FileIoError& e) {
        LOG_INFO("{} failed (id={}): {}", def.name(), id, e.describe());
        out.result = TextResult(e.describe(), true);
    } catch (const errors::ToolParamError& e) {
        LOG_INFO("{} rejected arguments (id={}): {}", def.name(), id, e.what());
        out.error = errors::makeError(JSONRPCErrorCodes::InvalidParams, e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("{} raised an internal fault (id={}): {}", def.name(), id, e.what());
        out.error = errors::makeError(JSONRPCErrorCodes::InternalError, std::string("Internal error: ") + e.what());
    }
    return out;
}

DispatchResult ToolRegistry::Dispatch(const std::string& name, const std::optional<JSONValue>& arguments) const {
    Resolution resolution = Resolve(name, arguments);
    if (resolution.error.has_value()) {
        DispatchResult out;
        out.error = std::move(resolution.error);
        return out;
    }
    return Invoke(*resolution.invocation);
}

} // namespace fileio
