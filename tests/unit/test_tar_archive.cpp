#include <gtest/gtest.h>
#include "tar_archive.h"
#include "errors.h"
#include <cstring>
#include <string>

using namespace coderun;

// ============================================================================
// TarArchive Tests - Layout
// ============================================================================

class TarArchiveTest : public ::testing::Test {
protected:
    std::string header_field(const std::vector<uint8_t>& archive, size_t offset, size_t width) {
        const char* start = reinterpret_cast<const char*>(archive.data()) + offset;
        return std::string(start, strnlen(start, width));
    }
};

TEST_F(TarArchiveTest, DeclaredSizeEqualsSourceLength) {
    // Given: A short Go program
    std::string source = "package main\n\nfunc main() { println(1) }\n";

    // When: Packing it
    auto archive = TarArchive::pack_single_file("main.go", source);

    // Then: The octal size field holds the byte length
    std::string size_field = header_field(archive, 124, 12);
    EXPECT_EQ(std::stoul(size_field, nullptr, 8), source.size());
}

TEST_F(TarArchiveTest, ArchiveIsBlockAligned) {
    // Given: Content that does not fill a block
    std::string source(700, 'x');

    // When: Packing it
    auto archive = TarArchive::pack_single_file("main.go", source);

    // Then: Header + two content blocks + two end blocks
    EXPECT_EQ(archive.size() % 512, 0u);
    EXPECT_EQ(archive.size(), 512u * 5);

    // And: The end-of-archive blocks are zero
    for (size_t i = archive.size() - 1024; i < archive.size(); ++i) {
        ASSERT_EQ(archive[i], 0) << "Non-zero byte at offset " << i;
    }
}

TEST_F(TarArchiveTest, WritesUstarMagicAndRegularFileType) {
    // Given/When: Any packed file
    auto archive = TarArchive::pack_single_file("main.go", "x");

    // Then: ustar magic, version 00, typeflag '0'
    EXPECT_EQ(std::memcmp(archive.data() + 257, "ustar\0", 6), 0);
    EXPECT_EQ(archive[263], '0');
    EXPECT_EQ(archive[264], '0');
    EXPECT_EQ(archive[156], '0');
}

TEST_F(TarArchiveTest, UsesMode0644ByDefault) {
    // Given/When: A file packed with the default mode
    auto archive = TarArchive::pack_single_file("main.go", "x");

    // Then: Mode reads back as 0644
    EXPECT_EQ(TarArchive::read_single_entry(archive).mode, 0644u);
    EXPECT_EQ(header_field(archive, 100, 8), "0000644");
}

// ============================================================================
// TarArchive Tests - Round Trip
// ============================================================================

TEST_F(TarArchiveTest, RoundTripPreservesNameAndContents) {
    // Given: Source text containing bytes that need no escaping in tar
    std::string source = "fmt.Println(\"héllo\\n\")\n\t// tab\n";

    // When: Packing then reading back
    TarEntry entry = TarArchive::read_single_entry(
        TarArchive::pack_single_file("main.go", source));

    // Then: Everything survives
    EXPECT_EQ(entry.name, "main.go");
    EXPECT_EQ(entry.contents, source);
}

TEST_F(TarArchiveTest, EmptySourceGivesZeroLengthEntry) {
    // Given: Empty source text
    // When: Packing it
    auto archive = TarArchive::pack_single_file("main.go", "");

    // Then: Header plus end blocks only, and an empty entry
    EXPECT_EQ(archive.size(), 512u * 3);
    TarEntry entry = TarArchive::read_single_entry(archive);
    EXPECT_EQ(entry.name, "main.go");
    EXPECT_TRUE(entry.contents.empty());
}

TEST_F(TarArchiveTest, ContentExactlyOneBlockNeedsNoPadding) {
    // Given: 512 bytes of content
    std::string source(512, 'a');

    // When: Packing it
    auto archive = TarArchive::pack_single_file("main.go", source);

    // Then: Exactly one content block
    EXPECT_EQ(archive.size(), 512u * 4);
    EXPECT_EQ(TarArchive::read_single_entry(archive).contents, source);
}

// ============================================================================
// TarArchive Tests - Checksum and Errors
// ============================================================================

TEST_F(TarArchiveTest, ChecksumMatchesHeaderBytes) {
    // Given: A packed archive
    auto archive = TarArchive::pack_single_file("main.go", "package main\n");

    // When: Summing the header with the checksum field as spaces
    unsigned sum = 0;
    for (size_t i = 0; i < 512; ++i) {
        sum += (i >= 148 && i < 156) ? ' ' : archive[i];
    }

    // Then: The stored value matches
    std::string stored = header_field(archive, 148, 7);
    EXPECT_EQ(std::stoul(stored, nullptr, 8), sum);
    EXPECT_EQ(archive[155], ' ');
}

TEST_F(TarArchiveTest, CorruptedHeaderFailsChecksum) {
    // Given: An archive with one flipped header byte
    auto archive = TarArchive::pack_single_file("main.go", "x");
    archive[10] ^= 0x01;

    // When/Then: Reading it is rejected
    EXPECT_THROW(TarArchive::read_single_entry(archive), PackagingError);
}

TEST_F(TarArchiveTest, TruncatedArchiveIsRejected) {
    // Given: Only part of a header block
    std::vector<uint8_t> archive(100, 0);

    // When/Then: Reading fails with PackagingError
    EXPECT_THROW(TarArchive::read_single_entry(archive), PackagingError);
}

TEST_F(TarArchiveTest, RejectsNameTooLongForHeader) {
    // Given: A 100 character file name
    std::string name(100, 'n');

    // When/Then: The entry cannot be represented
    try {
        TarArchive::pack_single_file(name, "x");
        FAIL() << "Expected PackagingError";
    } catch (const PackagingError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::PACKAGING);
    }
}

TEST_F(TarArchiveTest, RejectsEmptyName) {
    EXPECT_THROW(TarArchive::pack_single_file("", "x"), PackagingError);
}

TEST_F(TarArchiveTest, AcceptsLongestRepresentableName) {
    // Given: 99 characters, leaving room for the terminator
    std::string name(99, 'n');

    // When: Packing and reading back
    TarEntry entry = TarArchive::read_single_entry(TarArchive::pack_single_file(name, "x"));

    // Then: Name is intact
    EXPECT_EQ(entry.name, name);
}
