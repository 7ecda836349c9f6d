#include "runtime/tar_archive.hpp"

#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace codejoin::runtime {
namespace {

void WriteField(std::string& header, std::size_t offset, std::string_view value) {
    header.replace(offset, value.size(), value.data(), value.size());
}

void WriteOctal(std::string& header, std::size_t offset, std::size_t width, unsigned long long value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%0*llo", static_cast<int>(width - 1), value);
    WriteField(header, offset, std::string_view(buffer, width - 1));
}

}  // namespace

void TarArchive::AddFile(const std::string& name, std::string_view content, unsigned mode) {
    if (name.empty() || name.size() >= 100) {
        throw std::invalid_argument("tar entry name must be 1-99 bytes: " + name);
    }
    // 11 octal digits.
    if (content.size() > 077777777777ULL) {
        throw std::invalid_argument("tar entry too large: " + name);
    }

    std::string header(kBlockSize, '\0');
    WriteField(header, 0, name);
    WriteOctal(header, 100, 8, mode);
    WriteOctal(header, 108, 8, 0);
    WriteOctal(header, 116, 8, 0);
    WriteOctal(header, 124, 12, content.size());
    WriteOctal(header, 136, 12, static_cast<unsigned long long>(std::time(nullptr)));
    header[156] = '0';
    WriteField(header, 257, std::string_view("ustar\0", 6));
    WriteField(header, 263, "00");
    WriteField(header, 265, "root");
    WriteField(header, 297, "root");

    // Checksum is computed with its own field filled with spaces.
    header.replace(148, 8, 8, ' ');
    unsigned long long checksum = 0;
    for (const char ch : header) {
        checksum += static_cast<unsigned char>(ch);
    }
    char digits[8];
    std::snprintf(digits, sizeof(digits), "%06llo", checksum);
    header.replace(148, 6, digits, 6);
    header[154] = '\0';
    header[155] = ' ';

    data_ += header;
    data_.append(content.data(), content.size());
    const auto remainder = content.size() % kBlockSize;
    if (remainder != 0) {
        data_.append(kBlockSize - remainder, '\0');
    }
    ++entries_;
}

std::string TarArchive::Finish() const {
    std::string archive = data_;
    archive.append(2 * kBlockSize, '\0');
    return archive;
}

}  // namespace codejoin::runtime
