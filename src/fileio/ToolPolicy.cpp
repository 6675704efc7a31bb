//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolPolicy.cpp
// Purpose: Built-in tool policies
//==========================================================================================================

#include "fileio/ToolPolicy.h"
#include "fileio/ToolRegistry.h"

namespace fileio {

namespace {

class AllowAllPolicy : public IToolPolicy {
public:
    bool Allows(const ToolDefinition&) const override { return true; }
    std::string Name() const override { return "allow-all"; }
};

class DenyDangerousPolicy : public IToolPolicy {
public:
    bool Allows(const ToolDefinition& tool) const override { return !tool.dangerous(); }
    std::string Name() const override { return "deny-dangerous"; }
};

} // namespace

std::shared_ptr<IToolPolicy> MakeAllowAllPolicy() {
    return std::make_shared<AllowAllPolicy>();
}

std::shared_ptr<IToolPolicy> MakeDenyDangerousPolicy() {
    return std::make_shared<DenyDangerousPolicy>();
}

} // namespace fileio
