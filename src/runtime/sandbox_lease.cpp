#include "runtime/sandbox_lease.hpp"

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace codejoin::runtime {

SandboxLease::SandboxLease(ContainerRuntime& runtime,
                           std::string container_id,
                           std::string name,
                           std::chrono::milliseconds grace)
    : runtime_(runtime)
    , container_id_(std::move(container_id))
    , name_(std::move(name))
    , grace_(grace) {}

SandboxLease::~SandboxLease() {
    Release();
}

bool SandboxLease::Release() {
    if (released_.exchange(true)) {
        return true;
    }
    const auto started = utils::Now();
    try {
        runtime_.Remove(container_id_, grace_);
    } catch (const RuntimeError& ex) {
        utils::Log(utils::LogLevel::kError, "runtime", "sandbox removal failed",
                   {{"name", name_}, {"kind", ToString(ex.Kind())}, {"error", ex.what()}});
        return false;
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kError, "runtime", "sandbox removal failed",
                   {{"name", name_}, {"error", ex.what()}});
        return false;
    }
    utils::Log(utils::LogLevel::kDebug, "runtime", "sandbox removed",
               {{"name", name_}, {"ms", std::to_string(utils::ElapsedMs(started))}});
    return true;
}

}  // namespace codejoin::runtime
