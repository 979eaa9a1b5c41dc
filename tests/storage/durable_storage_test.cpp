#include "upl/storage/durable_storage.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using upl::storage::LocalDurableStorage;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("upl_durable_test_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

/// Leaves half the bytes on the staging path, then reports a device error.
class FailingCopyStorage : public LocalDurableStorage {
public:
    using LocalDurableStorage::LocalDurableStorage;

protected:
    std::error_code copy_bytes(const fs::path& source, const fs::path& staging) override {
        std::ofstream out(staging, std::ios::binary);
        out << read_file(source).substr(0, 4);
        return std::make_error_code(std::errc::no_space_on_device);
    }
};

} // namespace

TEST(LocalDurableStorageTest, AttachCopiesBytesAndReturnsReference) {
    const auto dir = create_temp_dir();
    const auto source = dir / "assembled.wav";
    {
        std::ofstream out(source, std::ios::binary);
        out << "RIFF....WAVE";
    }

    LocalDurableStorage storage(dir / "assets");
    auto ref = storage.attach(source, "session_ses_1", "track.wav", "audio/wav");
    ASSERT_TRUE(ref.is_ok());
    EXPECT_EQ(ref.value().backend, "local");
    EXPECT_EQ(ref.value().key, "session_ses_1/track.wav");
    EXPECT_EQ(ref.value().content_type, "audio/wav");
    EXPECT_EQ(ref.value().size, 12u);
    EXPECT_TRUE(storage.exists(ref.value()));

    auto located = storage.locate(ref.value());
    ASSERT_TRUE(located.is_ok());
    EXPECT_EQ(read_file(located.value()), "RIFF....WAVE");
    EXPECT_TRUE(fs::exists(source));

    ASSERT_TRUE(storage.remove(ref.value()).is_ok());
    EXPECT_FALSE(storage.exists(ref.value()));

    fs::remove_all(dir);
}

TEST(LocalDurableStorageTest, ReattachReplacesInsteadOfDuplicating) {
    const auto dir = create_temp_dir();
    const auto source = dir / "file.bin";
    {
        std::ofstream out(source, std::ios::binary);
        out << "v1";
    }
    LocalDurableStorage storage(dir / "assets");
    ASSERT_TRUE(storage.attach(source, "session_x", "file.bin", "application/octet-stream").is_ok());
    {
        std::ofstream out(source, std::ios::binary | std::ios::trunc);
        out << "version2";
    }
    auto ref = storage.attach(source, "session_x", "file.bin", "application/octet-stream");
    ASSERT_TRUE(ref.is_ok());
    EXPECT_EQ(ref.value().size, 8u);

    std::size_t files = 0;
    for (const auto& entry : fs::directory_iterator(dir / "assets" / "session_x")) {
        (void)entry;
        ++files;
    }
    EXPECT_EQ(files, 1u);

    fs::remove_all(dir);
}

TEST(LocalDurableStorageTest, MissingSourceAndBadNames) {
    const auto dir = create_temp_dir();
    LocalDurableStorage storage(dir / "assets");

    auto missing = storage.attach(dir / "absent.bin", "session_y", "absent.bin", "text/plain");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, upl::ErrorKind::FileNotFound);

    auto bad = storage.attach(dir / "absent.bin", "..", "x", "text/plain");
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error().kind, upl::ErrorKind::InvalidArgument);

    fs::remove_all(dir);
}

TEST(LocalDurableStorageTest, FailedCopyLeavesNoPartialFile) {
    const auto dir = create_temp_dir();
    const auto source = dir / "assembled.wav";
    {
        std::ofstream out(source, std::ios::binary);
        out << "RIFF....WAVE";
    }

    FailingCopyStorage storage(dir / "assets");
    auto ref = storage.attach(source, "session_z", "track.wav", "audio/wav");
    ASSERT_TRUE(ref.is_error());
    EXPECT_EQ(ref.error().kind, upl::ErrorKind::Storage);

    std::size_t leftovers = 0;
    for (const auto& entry : fs::directory_iterator(dir / "assets" / "session_z")) {
        (void)entry;
        ++leftovers;
    }
    EXPECT_EQ(leftovers, 0u);
    EXPECT_TRUE(fs::exists(source));

    fs::remove_all(dir);
}
