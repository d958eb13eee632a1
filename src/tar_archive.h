#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include "constants.h"

namespace coderun {

// One regular file stored in an archive
struct TarEntry {
    std::string name;
    unsigned mode = 0;
    std::string contents;
};

// POSIX ustar packaging for injecting source text into a container
class TarArchive {
public:
    // Build an in-memory archive holding exactly one regular file.
    // Throws PackagingError if the entry cannot be represented.
    static std::vector<uint8_t> pack_single_file(
        const std::string& name,
        const std::string& contents,
        unsigned mode = SOURCE_FILE_MODE
    );

    // Parse an archive produced by pack_single_file and return its entry.
    // Throws PackagingError on a truncated archive or a bad checksum.
    static TarEntry read_single_entry(const std::vector<uint8_t>& archive);

private:
    static void write_octal(char* field, size_t width, uint64_t value);
    static uint64_t parse_octal(const char* field, size_t width);
    static unsigned compute_checksum(const uint8_t* header);
};

} // namespace coderun
