#include "runtime/sandbox_id.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <openssl/err.h>
#include <openssl/rand.h>

namespace codejoin::runtime {

std::string NewSandboxId() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed: " + std::to_string(ERR_get_error()));
    }
    std::ostringstream oss;
    for (const auto byte : bytes) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return oss.str();
}

}  // namespace codejoin::runtime
