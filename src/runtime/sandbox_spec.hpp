#pragma once

#include <string>

#include "config/language_profiles.hpp"
#include "runtime/container_runtime.hpp"

namespace codejoin::runtime {

constexpr const char* kScratchDir = "/tmp";
constexpr const char* kLabelRole = "codejoin.role";
constexpr const char* kLabelSandbox = "codejoin.sandbox";

// Hardened single-use container running the profile's batch command once.
SandboxSpec BuildBatchSpec(const config::LanguageProfile& profile, const std::string& sandbox_id);

// Hardened TTY container running the profile's interactive command.
SandboxSpec BuildInteractiveSpec(const config::LanguageProfile& profile, const std::string& sandbox_id);

}  // namespace codejoin::runtime
