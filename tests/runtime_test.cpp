#include <gtest/gtest.h>

#include <algorithm>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/language_profiles.hpp"
#include "fake_runtime.hpp"
#include "runtime/docker_runtime.hpp"
#include "runtime/sandbox_id.hpp"
#include "runtime/sandbox_lease.hpp"
#include "runtime/sandbox_spec.hpp"
#include "runtime/tar_archive.hpp"

using codejoin::config::LanguageTable;
using codejoin::runtime::BuildBatchSpec;
using codejoin::runtime::BuildCreateBody;
using codejoin::runtime::BuildInteractiveSpec;
using codejoin::runtime::DockerEndpoint;
using codejoin::runtime::ParseDockerHost;
using codejoin::runtime::TarArchive;

TEST(TarArchive, entries_are_block_aligned_with_valid_header) {
    TarArchive tar;
    const std::string content = "print('hi')\n";
    tar.AddFile("code.py", content);
    const auto archive = tar.Finish();

    ASSERT_EQ(archive.size(), 512u + 512u + 1024u);
    EXPECT_EQ(archive.substr(0, 7), "code.py");
    EXPECT_EQ(archive.substr(257, 5), "ustar");
    EXPECT_EQ(archive[156], '0');
    EXPECT_EQ(archive.substr(124, 11), "00000000014");
    EXPECT_EQ(archive.substr(512, content.size()), content);

    // The stored checksum matches the header summed with a blank checksum field.
    std::string header = archive.substr(0, 512);
    const auto stored = std::stoul(header.substr(148, 6), nullptr, 8);
    header.replace(148, 8, 8, ' ');
    unsigned long sum = 0;
    for (const char ch : header) {
        sum += static_cast<unsigned char>(ch);
    }
    EXPECT_EQ(stored, sum);
    EXPECT_EQ(tar.Entries(), 1u);
}

TEST(TarArchive, long_or_empty_names_are_rejected) {
    TarArchive tar;
    EXPECT_THROW(tar.AddFile(std::string(100, 'a'), "x"), std::invalid_argument);
    EXPECT_THROW(tar.AddFile("", "x"), std::invalid_argument);
    EXPECT_NO_THROW(tar.AddFile(std::string(99, 'a'), ""));
    EXPECT_EQ(tar.Finish().size(), 512u + 1024u);
}

TEST(SandboxSpec, batch_spec_is_isolated_and_runs_the_profile_command) {
    const auto table = LanguageTable::Builtin();
    const auto spec = BuildBatchSpec(*table.Find("python"), "abc123");
    EXPECT_EQ(spec.name, "code-exec-abc123");
    EXPECT_EQ(spec.image, "python:3.11-alpine");
    ASSERT_EQ(spec.command.size(), 3u);
    EXPECT_EQ(spec.command[2], "python /sandbox/code.py");
    EXPECT_FALSE(spec.tty);
    EXPECT_TRUE(spec.stdin_once);
    EXPECT_TRUE(spec.network_disabled);
    EXPECT_TRUE(spec.read_only_rootfs);
    EXPECT_EQ(spec.user, "nobody");
    EXPECT_EQ(spec.memory_bytes, 128LL * 1024 * 1024);
    EXPECT_EQ(spec.pids_limit, 64);
    EXPECT_EQ(spec.volumes, std::vector<std::string>{"/sandbox"});
    EXPECT_EQ(spec.labels.at("codejoin.role"), "batch");
}

TEST(SandboxSpec, interactive_spec_allocates_a_terminal) {
    const auto table = LanguageTable::Builtin();
    const auto spec = BuildInteractiveSpec(*table.Find("python"), "ff00");
    EXPECT_EQ(spec.name, "code-terminal-ff00");
    EXPECT_TRUE(spec.tty);
    EXPECT_FALSE(spec.stdin_once);
    EXPECT_EQ(spec.command.back(), "exec python");
    EXPECT_NE(std::find(spec.env.begin(), spec.env.end(), "TERM=xterm"), spec.env.end());
    EXPECT_TRUE(spec.volumes.empty());
}

TEST(DockerRuntime, create_body_enforces_isolation) {
    const auto table = LanguageTable::Builtin();
    const auto body = BuildCreateBody(BuildBatchSpec(*table.Find("shell"), "id"));
    const auto& host = body["HostConfig"];
    EXPECT_EQ(host["NetworkMode"], "none");
    EXPECT_EQ(body["NetworkDisabled"], true);
    EXPECT_EQ(host["CapDrop"], nlohmann::json::array({"ALL"}));
    EXPECT_EQ(host["ReadonlyRootfs"], true);
    EXPECT_EQ(host["Privileged"], false);
    EXPECT_EQ(host["Memory"], 64LL * 1024 * 1024);
    EXPECT_EQ(host["MemorySwap"], host["Memory"]);
    EXPECT_EQ(host["CpuQuota"], 25000);
    EXPECT_EQ(host["CpuPeriod"], 100000);
    EXPECT_EQ(host["PidsLimit"], 64);
    EXPECT_TRUE(host["Tmpfs"].contains("/tmp"));
    EXPECT_EQ(body["User"], "nobody");
    EXPECT_EQ(body["Tty"], false);
    EXPECT_TRUE(body["Volumes"].contains("/sandbox"));
}

TEST(DockerRuntime, host_strings_are_parsed) {
    const auto unix_default = ParseDockerHost("unix:///var/run/docker.sock");
    EXPECT_EQ(unix_default.kind, DockerEndpoint::Kind::kUnix);
    EXPECT_EQ(unix_default.path, "/var/run/docker.sock");

    EXPECT_EQ(ParseDockerHost("/run/user/1000/docker.sock").path, "/run/user/1000/docker.sock");

    const auto tcp = ParseDockerHost("tcp://10.0.0.5:2376");
    EXPECT_EQ(tcp.kind, DockerEndpoint::Kind::kTcp);
    EXPECT_EQ(tcp.host, "10.0.0.5");
    EXPECT_EQ(tcp.port, "2376");
    EXPECT_EQ(ParseDockerHost("http://docker").port, "2375");
    EXPECT_EQ(tcp.ToString(), "tcp://10.0.0.5:2376");

    EXPECT_THROW(ParseDockerHost("ssh://host"), std::invalid_argument);
    EXPECT_THROW(ParseDockerHost("unix://"), std::invalid_argument);
    EXPECT_THROW(ParseDockerHost("tcp://:1"), std::invalid_argument);
}

TEST(SandboxId, ids_are_unique_lowercase_hex) {
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        const auto id = codejoin::runtime::NewSandboxId();
        ASSERT_EQ(id.size(), 32u);
        EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 200u);
}

TEST(SandboxLease, removes_container_exactly_once) {
    codejoin::testing::FakeRuntime runtime;
    const auto table = LanguageTable::Builtin();
    const auto id = runtime.Create(BuildBatchSpec(*table.Find("python"), "lease"));
    {
        codejoin::runtime::SandboxLease lease(runtime, id, "code-exec-lease", std::chrono::milliseconds(0));
        EXPECT_TRUE(lease.Release());
        EXPECT_TRUE(lease.Released());
        EXPECT_TRUE(lease.Release());
    }
    EXPECT_EQ(runtime.Removed(), 1);
    EXPECT_EQ(runtime.Live(), 0u);
}

TEST(SandboxLease, destructor_removes_and_failures_are_reported) {
    codejoin::testing::FakeRuntime runtime;
    {
        codejoin::runtime::SandboxLease lease(runtime, "fake-missing", "ghost", std::chrono::milliseconds(0));
        EXPECT_FALSE(lease.Release());
    }
    const auto table = LanguageTable::Builtin();
    const auto id = runtime.Create(BuildBatchSpec(*table.Find("python"), "scoped"));
    {
        codejoin::runtime::SandboxLease lease(runtime, id, "scoped", std::chrono::milliseconds(0));
    }
    EXPECT_EQ(runtime.Removed(), 1);
}
