#include "tar_archive.h"
#include "errors.h"
#include <cstring>
#include <new>

namespace coderun {

namespace {

// ustar header field offsets and widths
constexpr size_t NAME_OFFSET = 0;
constexpr size_t NAME_WIDTH = 100;
constexpr size_t MODE_OFFSET = 100;
constexpr size_t UID_OFFSET = 108;
constexpr size_t GID_OFFSET = 116;
constexpr size_t ID_WIDTH = 8;
constexpr size_t SIZE_OFFSET = 124;
constexpr size_t SIZE_FIELD_WIDTH = 12;
constexpr size_t MTIME_OFFSET = 136;
constexpr size_t MTIME_WIDTH = 12;
constexpr size_t CHECKSUM_OFFSET = 148;
constexpr size_t CHECKSUM_WIDTH = 8;
constexpr size_t TYPEFLAG_OFFSET = 156;
constexpr size_t MAGIC_OFFSET = 257;
constexpr size_t VERSION_OFFSET = 263;

constexpr char REGULAR_FILE = '0';
constexpr uint64_t MAX_OCTAL_SIZE = 077777777777ULL;   // 11 octal digits

size_t padded_size(size_t size) {
    return ((size + TAR_BLOCK_SIZE - 1) / TAR_BLOCK_SIZE) * TAR_BLOCK_SIZE;
}

} // namespace

void TarArchive::write_octal(char* field, size_t width, uint64_t value) {
    // width - 1 digits, zero padded, NUL terminated
    field[width - 1] = '\0';
    for (size_t i = width - 1; i > 0; --i) {
        field[i - 1] = static_cast<char>('0' + (value & 7));
        value >>= 3;
    }
}

uint64_t TarArchive::parse_octal(const char* field, size_t width) {
    uint64_t value = 0;
    size_t i = 0;
    while (i < width && field[i] == ' ') i++;
    for (; i < width && field[i] >= '0' && field[i] <= '7'; ++i) {
        value = (value << 3) | static_cast<uint64_t>(field[i] - '0');
    }
    return value;
}

unsigned TarArchive::compute_checksum(const uint8_t* header) {
    // The checksum field itself counts as eight spaces
    unsigned sum = 0;
    for (size_t i = 0; i < TAR_BLOCK_SIZE; ++i) {
        if (i >= CHECKSUM_OFFSET && i < CHECKSUM_OFFSET + CHECKSUM_WIDTH) {
            sum += static_cast<unsigned>(' ');
        } else {
            sum += header[i];
        }
    }
    return sum;
}

std::vector<uint8_t> TarArchive::pack_single_file(
    const std::string& name,
    const std::string& contents,
    unsigned mode
) {
    if (name.empty()) {
        throw PackagingError("archive entry name is empty");
    }
    if (name.size() >= NAME_WIDTH) {
        throw PackagingError("archive entry name too long: " + name);
    }
    if (contents.size() > MAX_OCTAL_SIZE) {
        throw PackagingError("archive entry too large: " + std::to_string(contents.size()) + " bytes");
    }

    std::vector<uint8_t> archive;
    try {
        // header + padded contents + two end-of-archive blocks
        archive.assign(TAR_BLOCK_SIZE + padded_size(contents.size()) + 2 * TAR_BLOCK_SIZE, 0);
    } catch (const std::bad_alloc&) {
        throw PackagingError("failed to allocate archive buffer");
    } catch (const std::length_error&) {
        throw PackagingError("archive buffer too large");
    }

    char* header = reinterpret_cast<char*>(archive.data());
    std::memcpy(header + NAME_OFFSET, name.data(), name.size());
    write_octal(header + MODE_OFFSET, ID_WIDTH, mode & 07777);
    write_octal(header + UID_OFFSET, ID_WIDTH, 0);
    write_octal(header + GID_OFFSET, ID_WIDTH, 0);
    write_octal(header + SIZE_OFFSET, SIZE_FIELD_WIDTH, contents.size());
    write_octal(header + MTIME_OFFSET, MTIME_WIDTH, 0);
    header[TYPEFLAG_OFFSET] = REGULAR_FILE;
    std::memcpy(header + MAGIC_OFFSET, "ustar", 6);
    std::memcpy(header + VERSION_OFFSET, "00", 2);

    // Checksum: six octal digits, NUL, space
    unsigned checksum = compute_checksum(archive.data());
    write_octal(header + CHECKSUM_OFFSET, 7, checksum);
    header[CHECKSUM_OFFSET + 7] = ' ';

    if (!contents.empty()) {
        std::memcpy(archive.data() + TAR_BLOCK_SIZE, contents.data(), contents.size());
    }

    return archive;
}

TarEntry TarArchive::read_single_entry(const std::vector<uint8_t>& archive) {
    if (archive.size() < TAR_BLOCK_SIZE) {
        throw PackagingError("archive shorter than one header block");
    }

    const uint8_t* header = archive.data();
    const char* fields = reinterpret_cast<const char*>(header);

    unsigned stored = static_cast<unsigned>(parse_octal(fields + CHECKSUM_OFFSET, CHECKSUM_WIDTH));
    if (stored != compute_checksum(header)) {
        throw PackagingError("archive header checksum mismatch");
    }
    if (fields[TYPEFLAG_OFFSET] != REGULAR_FILE && fields[TYPEFLAG_OFFSET] != '\0') {
        throw PackagingError("archive entry is not a regular file");
    }

    TarEntry entry;
    entry.name = std::string(fields + NAME_OFFSET, strnlen(fields + NAME_OFFSET, NAME_WIDTH));
    entry.mode = static_cast<unsigned>(parse_octal(fields + MODE_OFFSET, ID_WIDTH));

    uint64_t size = parse_octal(fields + SIZE_OFFSET, SIZE_FIELD_WIDTH);
    if (size > archive.size() - TAR_BLOCK_SIZE) {
        throw PackagingError("archive truncated: entry declares " + std::to_string(size) + " bytes");
    }
    entry.contents.assign(fields + TAR_BLOCK_SIZE, static_cast<size_t>(size));

    return entry;
}

} // namespace coderun
