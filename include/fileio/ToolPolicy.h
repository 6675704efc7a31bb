//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolPolicy.h
// Purpose: Deployment policy deciding whether a resolved tool may run
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

namespace fileio {

struct ToolDefinition;

//==========================================================================================================
// IToolPolicy
// Purpose: Consulted by the session after a tool resolves and before it is invoked. The registry only
//          tags tools as dangerous; whether such tools run is decided here.
//==========================================================================================================
class IToolPolicy {
public:
    virtual ~IToolPolicy() = default;

    // True when the tool may be invoked.
    virtual bool Allows(const ToolDefinition& tool) const = 0;

    // Short name for logs ("allow-all", "deny-dangerous").
    virtual std::string Name() const = 0;
};

// Permits every tool.
std::shared_ptr<IToolPolicy> MakeAllowAllPolicy();

// Rejects tools tagged dangerous.
std::shared_ptr<IToolPolicy> MakeDenyDangerousPolicy();

// Text of the isError result returned for a rejected call.
constexpr const char* POLICY_DENIED_MESSAGE = "PermissionDenied: tool disabled by policy";

} // namespace fileio
