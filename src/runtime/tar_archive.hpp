#pragma once

#include <string>
#include <string_view>

namespace codejoin::runtime {

// Minimal in-memory ustar writer for injecting source files.
class TarArchive {
public:
    static constexpr std::size_t kBlockSize = 512;

    // Throws std::invalid_argument for names that do not fit a ustar header.
    void AddFile(const std::string& name, std::string_view content, unsigned mode = 0644);

    // Archive bytes including the two terminating zero blocks.
    std::string Finish() const;

    std::size_t Entries() const { return entries_; }

private:
    std::string data_;
    std::size_t entries_ = 0;
};

}  // namespace codejoin::runtime
