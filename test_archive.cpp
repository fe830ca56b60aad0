#include "dirpack/archive.hpp"
#include "dirpack/codec.hpp"
#include "dirpack/paths.hpp"
#include "test_support.hpp"

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <string>

using dirpack::ArchiveFormat;
using dirpack::test::Fail;
using dirpack::test::TempDir;

namespace {

std::string Label(ArchiveFormat format) {
    return std::string(dirpack::FormatName(format));
}

bool HasHiddenLeftovers(const std::filesystem::path& dir) {
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.path().filename().string().rfind(".", 0) == 0) {
            return true;
        }
    }
    return false;
}

// One ustar header block followed by the data padded to 512 bytes.
std::string TarMember(const std::string& name, char type, const std::string& data,
                      const std::string& linkname = "") {
    char header[512];
    std::memset(header, 0, sizeof(header));
    std::memcpy(header, name.data(), name.size());
    std::snprintf(header + 100, 8, "%07o", 0644u);
    std::snprintf(header + 108, 8, "%07o", 0u);
    std::snprintf(header + 116, 8, "%07o", 0u);
    std::snprintf(header + 124, 12, "%011o", static_cast<unsigned>(data.size()));
    std::snprintf(header + 136, 12, "%011o", 0u);
    header[156] = type;
    std::memcpy(header + 157, linkname.data(), linkname.size());
    std::memcpy(header + 257, "ustar", 6);
    std::memcpy(header + 263, "00", 2);
    std::memset(header + 148, ' ', 8);
    unsigned sum = 0;
    for (unsigned char ch : header) {
        sum += ch;
    }
    std::snprintf(header + 148, 8, "%06o", sum);
    header[155] = ' ';

    std::string out(header, sizeof(header));
    out += data;
    out.append((512 - data.size() % 512) % 512, '\0');
    return out;
}

std::string TarEnd() {
    return std::string(1024, '\0');
}

int TestRoundTripAllFormats() {
    for (auto format : dirpack::AllFormats()) {
        TempDir tmp;
        auto source_root = tmp / "src";
        dirpack::test::BuildSampleTree(source_root / "project");
        auto before = dirpack::test::Snapshot(source_root / "project");

        auto out_dir = tmp / "out";
        std::filesystem::create_directories(out_dir);
        auto archive = out_dir / ("project" + std::string(dirpack::FormatSuffix(format)));
        dirpack::MakeArchive(source_root, "project", format, archive);

        if (!std::filesystem::is_regular_file(archive)) {
            return Fail(Label(format) + ": archive was not created");
        }
        if (std::filesystem::exists(dirpack::paths::PartialPath(archive)) || HasHiddenLeftovers(out_dir)) {
            return Fail(Label(format) + ": temporary files left next to the archive");
        }

        auto restore = tmp / "restore";
        auto placed = dirpack::ExtractArchive(archive, restore, false);
        if (placed.size() != 1 || placed.front() != restore / "project") {
            return Fail(Label(format) + ": archive should hold a single top-level directory");
        }
        if (dirpack::test::Snapshot(restore / "project") != before) {
            return Fail(Label(format) + ": extracted tree differs from the source");
        }
        if (HasHiddenLeftovers(restore)) {
            return Fail(Label(format) + ": staging directory left behind");
        }
    }
    return 0;
}

int TestCompressedStreamsUseRealCodecs() {
    const std::pair<ArchiveFormat, std::string> magics[] = {
        {ArchiveFormat::Zip, std::string("PK\x03\x04", 4)},
        {ArchiveFormat::GzTar, std::string("\x1f\x8b", 2)},
        {ArchiveFormat::BzTar, std::string("BZh", 3)},
        {ArchiveFormat::XzTar, std::string("\xFD" "7zXZ", 5)},
    };
    TempDir tmp;
    dirpack::test::BuildSampleTree(tmp / "src" / "data");
    for (const auto& [format, magic] : magics) {
        auto archive = tmp / ("data" + std::string(dirpack::FormatSuffix(format)));
        dirpack::MakeArchive(tmp / "src", "data", format, archive);
        auto head = dirpack::test::ReadFile(archive).substr(0, magic.size());
        if (head != magic) {
            return Fail(Label(format) + ": unexpected file signature");
        }
    }
    return 0;
}

int TestModesAndSymlinks() {
    TempDir tmp;
    auto root = tmp / "src" / "tree";
    dirpack::test::WriteFile(root / "run.sh", "#!/bin/sh\necho hi\n");
    dirpack::test::WriteFile(root / "target.txt", "payload");
    std::filesystem::permissions(root / "run.sh", static_cast<std::filesystem::perms>(0750));
    std::filesystem::create_symlink("target.txt", root / "link.txt");

    for (auto format : {ArchiveFormat::Tar, ArchiveFormat::Zip}) {
        auto archive = tmp / ("tree" + std::string(dirpack::FormatSuffix(format)));
        dirpack::MakeArchive(tmp / "src", "tree", format, archive);
        auto restore = tmp / ("restore-" + Label(format));
        dirpack::ExtractArchive(archive, restore, false);

        auto perms = std::filesystem::status(restore / "tree" / "run.sh").permissions();
        if ((static_cast<unsigned>(perms) & 0777u) != 0750u) {
            return Fail(Label(format) + ": file mode not preserved");
        }
        auto link = restore / "tree" / "link.txt";
        if (!std::filesystem::is_symlink(link) || std::filesystem::read_symlink(link) != "target.txt") {
            return Fail(Label(format) + ": symlink not restored");
        }
        if (dirpack::test::ReadFile(link) != "payload") {
            return Fail(Label(format) + ": restored symlink does not resolve to its target");
        }
    }
    return 0;
}

int TestLongNames() {
    const std::string long_file = std::string(146, 'n') + ".txt";
    const std::string long_dir(120, 'd');
    for (auto format : dirpack::AllFormats()) {
        TempDir tmp;
        auto root = tmp / "src" / "project";
        dirpack::test::WriteFile(root / "deep" / long_file, "long name payload");
        dirpack::test::WriteFile(root / long_dir / "f.txt", "inside a long directory");
        std::filesystem::create_symlink("deep/" + long_file, root / "ln");
        auto before = dirpack::test::Snapshot(root);

        auto archive = tmp / ("project" + std::string(dirpack::FormatSuffix(format)));
        dirpack::MakeArchive(tmp / "src", "project", format, archive);
        auto restore = tmp / "restore";
        dirpack::ExtractArchive(archive, restore, false);
        if (dirpack::test::Snapshot(restore / "project") != before) {
            return Fail(Label(format) + ": long names did not survive a round trip");
        }
    }
    return 0;
}

int TestForeignSymlinksRestoredAsStored() {
    for (auto format : {ArchiveFormat::Tar, ArchiveFormat::GzTar, ArchiveFormat::Zip}) {
        TempDir tmp;
        auto root = tmp / "src" / "links";
        dirpack::test::WriteFile(root / "f.txt", "kept");
        std::filesystem::create_symlink("/etc/hostname", root / "abs");
        std::filesystem::create_symlink("../../outside.txt", root / "up");

        auto archive = tmp / ("links" + std::string(dirpack::FormatSuffix(format)));
        dirpack::MakeArchive(tmp / "src", "links", format, archive);
        auto restore = tmp / "restore";
        dirpack::ExtractArchive(archive, restore, false);
        if (dirpack::test::ReadFile(restore / "links" / "f.txt") != "kept") {
            return Fail(Label(format) + ": regular file missing next to foreign links");
        }
        if (std::filesystem::read_symlink(restore / "links" / "abs") != "/etc/hostname"
            || std::filesystem::read_symlink(restore / "links" / "up") != "../../outside.txt") {
            return Fail(Label(format) + ": foreign link targets changed");
        }
    }
    return 0;
}

int TestExtractConflicts() {
    TempDir tmp;
    dirpack::test::BuildSampleTree(tmp / "src" / "docs");
    auto archive = tmp / "docs.tar.gz";
    dirpack::MakeArchive(tmp / "src", "docs", ArchiveFormat::GzTar, archive);

    auto restore = tmp / "restore";
    dirpack::test::WriteFile(restore / "docs" / "stale.txt", "old");
    dirpack::test::WriteFile(restore / "docs" / "a.txt", "local edit");
    dirpack::test::WriteFile(restore / "docs" / "sub" / "mine.txt", "mine");
    dirpack::ExtractArchive(archive, restore, false);
    if (dirpack::test::ReadFile(restore / "docs" / "stale.txt") != "old"
        || dirpack::test::ReadFile(restore / "docs" / "sub" / "mine.txt") != "mine") {
        return Fail("merge dropped files that were not in the archive");
    }
    if (dirpack::test::ReadFile(restore / "docs" / "a.txt") != "alpha\n"
        || dirpack::test::ReadFile(restore / "docs" / "sub" / "deeper" / "c.txt") != std::string(50000, 'c')) {
        return Fail("merge did not place the archived files");
    }
    if (HasHiddenLeftovers(restore)) {
        return Fail("merge left the staging directory behind");
    }

    dirpack::ExtractArchive(archive, restore, true);
    if (std::filesystem::exists(restore / "docs" / "stale.txt")) {
        return Fail("overwrite kept files from the replaced directory");
    }
    if (dirpack::test::Snapshot(restore / "docs") != dirpack::test::Snapshot(tmp / "src" / "docs")) {
        return Fail("overwrite produced a different tree");
    }
    return 0;
}

int TestRejectsUnsafeEntries() {
    TempDir tmp;
    const std::pair<std::string, std::string> archives[] = {
        {"escape.tar", TarMember("../evil.txt", '0', "owned") + TarEnd()},
        {"absolute.tar", TarMember("/tmp/dirpack-evil.txt", '0', "owned") + TarEnd()},
        {"through-link.tar",
         TarMember("box/", '5', "") + TarMember("box/up", '2', "", "../..")
             + TarMember("box/up/evil.txt", '0', "owned") + TarEnd()},
        {"hardlink-via-link.tar",
         TarMember("box/", '5', "") + TarMember("box/etc", '2', "", "/etc")
             + TarMember("box/copy", '1', "", "box/etc/hostname") + TarEnd()},
    };
    for (const auto& [name, bytes] : archives) {
        auto archive = tmp / name;
        dirpack::test::WriteFile(archive, bytes);
        auto out = tmp / ("out-" + name);
        try {
            dirpack::ExtractArchive(archive, out, false);
            return Fail(name + ": unsafe entry was extracted");
        } catch (const std::runtime_error&) {
        }
        if (std::filesystem::exists(tmp / "evil.txt") || std::filesystem::exists(out / "evil.txt")
            || HasHiddenLeftovers(out)) {
            return Fail(name + ": extraction left files behind");
        }
    }
    return 0;
}

int TestCorruptInputLeavesNothing() {
    TempDir tmp;
    auto out = tmp / "out";
    for (const char* name : {"broken.tar.bz2", "broken.tar.xz", "broken.zip", "broken.tar"}) {
        auto archive = tmp / name;
        dirpack::test::WriteFile(archive, dirpack::test::NoiseBytes(700, 3));
        try {
            dirpack::ExtractArchive(archive, out, false);
            return Fail(std::string(name) + ": corrupt archive was accepted");
        } catch (const std::exception&) {
        }
        if (!std::filesystem::is_empty(out)) {
            return Fail(std::string(name) + ": failed extraction left files in the output directory");
        }
    }
    try {
        dirpack::ExtractArchive(tmp / "missing.zip", out, false);
        return Fail("missing archive was accepted");
    } catch (const std::runtime_error&) {
    }
    return 0;
}

int TestMissingSourceLeavesNoPartial() {
    TempDir tmp;
    auto archive = tmp / "ghost.tar.xz";
    dirpack::test::WriteFile(dirpack::paths::PartialPath(archive), "stale");
    try {
        dirpack::MakeArchive(tmp.path(), "ghost", ArchiveFormat::XzTar, archive);
        return Fail("archiving a missing directory succeeded");
    } catch (const std::exception&) {
    }
    if (std::filesystem::exists(archive) || HasHiddenLeftovers(tmp.path())) {
        return Fail("failed archiving left files behind");
    }
    return 0;
}

int TestCodecLevels() {
    TempDir tmp;
    auto input = tmp / "input.bin";
    std::string text;
    for (int i = 0; i < 4000; ++i) {
        text += "line " + std::to_string(i % 97) + "\n";
    }
    dirpack::test::WriteFile(input, text);
    for (auto compression : {dirpack::Compression::Gzip, dirpack::Compression::Bzip2, dirpack::Compression::Xz}) {
        auto packed = tmp / "packed";
        auto unpacked = tmp / "unpacked";
        dirpack::codec::CompressFile(input, packed, compression, 1);
        if (std::filesystem::file_size(packed) >= text.size()) {
            return Fail("compressed output is not smaller than its input");
        }
        dirpack::codec::DecompressFile(packed, unpacked, compression);
        if (dirpack::test::ReadFile(unpacked) != text) {
            return Fail("decompressed output differs from the input");
        }
    }
    return 0;
}

}  // namespace

int main() {
    try {
        if (int rc = TestRoundTripAllFormats()) return rc;
        if (int rc = TestCompressedStreamsUseRealCodecs()) return rc;
        if (int rc = TestModesAndSymlinks()) return rc;
        if (int rc = TestLongNames()) return rc;
        if (int rc = TestForeignSymlinksRestoredAsStored()) return rc;
        if (int rc = TestExtractConflicts()) return rc;
        if (int rc = TestRejectsUnsafeEntries()) return rc;
        if (int rc = TestCorruptInputLeavesNothing()) return rc;
        if (int rc = TestMissingSourceLeavesNoPartial()) return rc;
        if (int rc = TestCodecLevels()) return rc;
    } catch (const std::exception& exc) {
        return Fail(std::string("unexpected exception: ") + exc.what());
    }
    std::cout << "archive tests passed" << std::endl;
    return 0;
}
