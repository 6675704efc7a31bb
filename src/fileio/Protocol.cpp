//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: JSON shapes of protocol structures
//==========================================================================================================

#include "fileio/Protocol.h"

namespace fileio {

bool IsSupportedProtocolVersion(const std::string& version) {
    for (const char* v : SUPPORTED_PROTOCOL_VERSIONS) {
        if (version == v) {
            return true;
        }
    }
    return false;
}

JSONValue ToJSON(const ServerCapabilities& caps) {
    JSONValue::Object obj;
    if (caps.tools.has_value()) {
        JSONValue::Object tools;
        tools["listChanged"] = std::make_shared<JSONValue>(caps.tools->listChanged);
        obj["tools"] = std::make_shared<JSONValue>(JSONValue{std::move(tools)});
    }
    return JSONValue{std::move(obj)};
}

JSONValue ToJSON(const Tool& tool) {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(tool.name);
    obj["description"] = std::make_shared<JSONValue>(tool.description);
    obj["inputSchema"] = std::make_shared<JSONValue>(tool.inputSchema);
    JSONValue::Object annotations;
    annotations["destructiveHint"] = std::make_shared<JSONValue>(tool.dangerous);
    obj["annotations"] = std::make_shared<JSONValue>(JSONValue{std::move(annotations)});
    return JSONValue{std::move(obj)};
}

JSONValue ToJSON(const CallToolResult& result) {
    JSONValue::Array content;
    for (const auto& item : result.content) {
        content.push_back(std::make_shared<JSONValue>(item));
    }
    JSONValue::Object obj;
    obj["content"] = std::make_shared<JSONValue>(JSONValue{std::move(content)});
    if (result.isError) {
        obj["isError"] = std::make_shared<JSONValue>(true);
    }
    return JSONValue{std::move(obj)};
}

JSONValue MakeTextContent(const std::string& text) {
    JSONValue::Object obj;
    obj["type"] = std::make_shared<JSONValue>(std::string("text"));
    obj["text"] = std::make_shared<JSONValue>(text);
    return JSONValue{std::move(obj)};
}

JSONValue MakeJsonContent(const JSONValue& value) {
    JSONValue::Object obj;
    obj["type"] = std::make_shared<JSONValue>(std::string("json"));
    obj["value"] = std::make_shared<JSONValue>(value);
    return JSONValue{std::move(obj)};
}

CallToolResult TextResult(const std::string& text, bool isError) {
    CallToolResult r;
    r.content.push_back(MakeTextContent(text));
    r.isError = isError;
    return r;
}

CallToolResult JsonResult(const JSONValue& value) {
    CallToolResult r;
    r.content.push_back(MakeJsonContent(value));
    return r;
}

} // namespace fileio
