#pragma once

#include <string>

namespace codejoin::runtime {

constexpr const char* kBatchPrefix = "code-exec-";
constexpr const char* kTerminalPrefix = "code-terminal-";

// 128 random bits as lowercase hex. Throws std::runtime_error if the CSPRNG fails.
std::string NewSandboxId();

}  // namespace codejoin::runtime
