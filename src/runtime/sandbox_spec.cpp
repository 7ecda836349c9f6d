#include "runtime/sandbox_spec.hpp"

#include "runtime/sandbox_id.hpp"

namespace codejoin::runtime {
namespace {

SandboxSpec HardenedBase(const config::LanguageProfile& profile) {
    SandboxSpec spec{};
    spec.image = profile.image;
    spec.working_dir = kScratchDir;
    spec.user = "nobody";
    spec.memory_bytes = profile.memory_bytes;
    spec.cpu_limit = profile.cpu_limit;
    spec.pids_limit = profile.process_limit;
    spec.network_disabled = true;
    spec.read_only_rootfs = true;
    spec.cap_drop = {"ALL"};
    spec.security_opt = {"no-new-privileges:true"};
    spec.tmpfs = {
        {"/tmp", "rw,exec,nosuid,size=100m"},
        {"/var/tmp", "rw,noexec,nosuid,size=10m"}
    };
    spec.ulimits = {
        {"nofile", 64, 64},
        {"nproc", profile.process_limit, profile.process_limit}
    };
    spec.env = {"HOME=/tmp", "LANG=C.UTF-8"};
    return spec;
}

}  // namespace

SandboxSpec BuildBatchSpec(const config::LanguageProfile& profile, const std::string& sandbox_id) {
    auto spec = HardenedBase(profile);
    spec.name = kBatchPrefix + sandbox_id;
    spec.command = {"/bin/sh", "-c", profile.BatchCommand()};
    spec.tty = false;
    spec.stdin_once = true;
    // The read-only root cannot receive the source archive; a volume can.
    spec.volumes = {config::kSourceDir};
    spec.labels = {{kLabelRole, "batch"}, {kLabelSandbox, sandbox_id}};
    return spec;
}

SandboxSpec BuildInteractiveSpec(const config::LanguageProfile& profile, const std::string& sandbox_id) {
    auto spec = HardenedBase(profile);
    spec.name = kTerminalPrefix + sandbox_id;
    spec.command = {"/bin/sh", "-c", "exec " + profile.interactive_command};
    spec.tty = true;
    spec.stdin_once = false;
    spec.env.push_back("TERM=xterm");
    spec.env.push_back("PS1=user@codejoin:~$ ");
    spec.labels = {{kLabelRole, "terminal"}, {kLabelSandbox, sandbox_id}};
    return spec;
}

}  // namespace codejoin::runtime
