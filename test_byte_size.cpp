#include "dirpack/byte_size.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using dirpack::ByteSize;
using dirpack::test::Fail;

namespace {

int TestFormatByteSize() {
    const std::uint64_t kib = 1024;
    const std::vector<std::pair<std::uint64_t, std::string>> cases = {
        {0, "0.00 B"},
        {512, "512.00 B"},
        {1023, "1023.00 B"},
        {kib, "1.00 KB"},
        {kib + kib / 2, "1.50 KB"},
        {5 * kib * kib, "5.00 MB"},
        {3 * kib * kib * kib, "3.00 GB"},
        {kib * kib * kib * kib, "1.00 TB"},
        {kib * kib * kib * kib * kib, "1.00 PB"},
        {kib * kib * kib * kib * kib * kib, "1024.00 PB"},
    };
    for (const auto& [bytes, expected] : cases) {
        auto text = dirpack::FormatByteSize(ByteSize{bytes});
        if (text != expected) {
            return Fail("FormatByteSize(" + std::to_string(bytes) + ") = " + text + ", expected " + expected);
        }
    }
    auto display = dirpack::ToDisplaySize(ByteSize{2 * kib * kib});
    if (display.unit != "MB" || display.value != 2.0) {
        return Fail("ToDisplaySize(2 MiB) mismatch");
    }
    if (dirpack::FormatByteSize(ByteSize{1331}, 1) != "1.3 KB") {
        return Fail("FormatByteSize precision ignored");
    }
    return 0;
}

int TestFormatRatio() {
    if (dirpack::FormatRatio(ByteSize{300}, ByteSize{100}) != "3.00") {
        return Fail("FormatRatio(300, 100) mismatch");
    }
    if (dirpack::FormatRatio(ByteSize{1}, ByteSize{3}) != "0.33") {
        return Fail("FormatRatio(1, 3) mismatch");
    }
    try {
        dirpack::FormatRatio(ByteSize{1}, ByteSize{0});
        return Fail("FormatRatio accepted a zero denominator");
    } catch (const std::invalid_argument&) {
    }
    return 0;
}

int TestFormatElapsed() {
    const std::vector<std::pair<double, std::string>> cases = {
        {0.0, "0 Hours, 00 Minutes, 00.00 Seconds"},
        {62.5, "0 Hours, 01 Minutes, 02.50 Seconds"},
        {3725.0, "1 Hours, 02 Minutes, 05.00 Seconds"},
        {-4.0, "0 Hours, 00 Minutes, 00.00 Seconds"},
    };
    for (const auto& [seconds, expected] : cases) {
        auto text = dirpack::FormatElapsed(seconds);
        if (text != expected) {
            return Fail("FormatElapsed(" + std::to_string(seconds) + ") = " + text);
        }
    }
    return 0;
}

int TestPathTypeErrors() {
    dirpack::test::TempDir tmp;
    auto missing = tmp / "missing";
    auto file = tmp / "file.txt";
    dirpack::test::WriteFile(file, "12345");

    try {
        dirpack::FileSize(missing);
        return Fail("FileSize accepted a missing path");
    } catch (const dirpack::NotAFileError& exc) {
        if (std::string(exc.what()) != missing.string() + " is not a file") {
            return Fail(std::string("unexpected NotAFileError message: ") + exc.what());
        }
    }
    try {
        dirpack::FileSize(tmp.path());
        return Fail("FileSize accepted a directory");
    } catch (const dirpack::PathTypeError&) {
    }
    try {
        dirpack::FolderSize(missing);
        return Fail("FolderSize accepted a missing path");
    } catch (const dirpack::NotADirectoryError& exc) {
        if (std::string(exc.what()) != missing.string() + " is not a directory") {
            return Fail(std::string("unexpected NotADirectoryError message: ") + exc.what());
        }
    }
    try {
        dirpack::FolderSize(file);
        return Fail("FolderSize accepted a regular file");
    } catch (const dirpack::PathTypeError&) {
    }
    return 0;
}

int TestFolderSizeSumsRegularFiles() {
    dirpack::test::TempDir tmp;
    auto root = tmp / "tree";
    dirpack::test::WriteFile(root / "a.txt", std::string(100, 'a'));
    dirpack::test::WriteFile(root / "b" / "c.txt", std::string(2500, 'c'));
    dirpack::test::WriteFile(root / "b" / "d" / "e.bin", std::string(4096, 'e'));
    dirpack::test::WriteFile(root / "empty.txt", "");
    std::filesystem::create_directories(root / "nothing");
    std::filesystem::create_symlink(root / "b" / "d" / "e.bin", root / "link.bin");

    auto total = dirpack::FolderSize(root);
    if (total.bytes != 100 + 2500 + 4096) {
        return Fail("FolderSize = " + std::to_string(total.bytes) + ", expected 6696");
    }
    auto a = dirpack::FileSize(root / "a.txt");
    auto b = dirpack::FolderSize(root / "b");
    if (a.bytes + b.bytes != total.bytes) {
        return Fail("FolderSize is not the sum of its parts");
    }
    if (dirpack::FolderSize(root / "nothing").bytes != 0) {
        return Fail("FolderSize of an empty directory is not zero");
    }
    return 0;
}

}  // namespace

int main() {
    if (int rc = TestFormatByteSize()) return rc;
    if (int rc = TestFormatRatio()) return rc;
    if (int rc = TestFormatElapsed()) return rc;
    if (int rc = TestPathTypeErrors()) return rc;
    if (int rc = TestFolderSizeSumsRegularFiles()) return rc;
    std::cout << "byte size tests passed" << std::endl;
    return 0;
}
