#include <gtest/gtest.h>
#include "file_utils.h"
#include "constants.h"
#include <sys/stat.h>
#include <filesystem>
#include <fstream>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>

namespace coderun {
namespace {

class FileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = FileUtils::create_private_directory(std::filesystem::temp_directory_path(),
                                                       "coderun_file_utils_test_");
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    static std::string read_file(const std::filesystem::path& path) {
        std::ifstream file(path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    std::filesystem::path test_dir;
};

// ============================================================================
// Hashing
// ============================================================================

TEST_F(FileUtilsTest, SHA256String_KnownInput) {
    EXPECT_EQ(FileUtils::sha256_string(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(FileUtils::sha256_string("hello world"),
              "b94d27b9934d3e08a52e52d7da7dabfac484efe37a5380ee9088f7ace2efcde9");
}

TEST_F(FileUtilsTest, BytesToHex) {
    const unsigned char bytes[] = {0x00, 0x0f, 0xa5, 0xff};
    EXPECT_EQ(FileUtils::bytes_to_hex(bytes, sizeof(bytes)), "000fa5ff");
}

// ============================================================================
// Script identifiers
// ============================================================================

TEST_F(FileUtilsTest, RandomHexLengthAndUniqueness) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        std::string id = FileUtils::random_hex(SCRIPT_ID_BYTES);
        EXPECT_EQ(id.size(), SCRIPT_ID_BYTES * 2);
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 100u) << "Random identifiers should not repeat";
}

TEST_F(FileUtilsTest, UniqueScriptNameFormat) {
    std::string name = FileUtils::unique_script_name(".sh");
    EXPECT_TRUE(std::regex_match(name, std::regex(R"(run_\d+_[0-9a-f]{16}\.sh)"))) << name;
    EXPECT_NE(name, FileUtils::unique_script_name(".sh"));
}

// ============================================================================
// Working directory
// ============================================================================

TEST_F(FileUtilsTest, PrivateDirectoryIsOwnerOnly) {
    auto dir = FileUtils::create_private_directory(test_dir, "work_");
    ASSERT_TRUE(std::filesystem::is_directory(dir));
    EXPECT_EQ(dir.parent_path(), test_dir);
    EXPECT_EQ(dir.filename().string().rfind("work_", 0), 0u);

    struct stat st;
    ASSERT_EQ(stat(dir.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0700);
}

TEST_F(FileUtilsTest, PrivateDirectoryFailsUnderMissingRoot) {
    EXPECT_THROW(FileUtils::create_private_directory(test_dir / "missing" / "deeper", "x_"),
                 std::runtime_error);
}

// ============================================================================
// TempScript
// ============================================================================

TEST_F(FileUtilsTest, TempScriptRemovedWhenScopeEnds) {
    std::filesystem::path path;
    {
        TempScript script(test_dir, ".py", "print('hi')\n");
        path = script.path();
        ASSERT_TRUE(std::filesystem::exists(path));
        EXPECT_EQ(path.parent_path(), test_dir);
        EXPECT_EQ(path.extension(), ".py");
        EXPECT_EQ(read_file(path), "print('hi')\n");
    }
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(FileUtilsTest, TempScriptRemovedOnException) {
    std::filesystem::path path;
    try {
        TempScript script(test_dir, ".js", "console.log(1)");
        path = script.path();
        throw std::runtime_error("request failed");
    } catch (const std::runtime_error&) {
    }
    ASSERT_FALSE(path.empty());
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(FileUtilsTest, TempScriptThrowsForMissingDirectory) {
    EXPECT_THROW(TempScript(test_dir / "missing", ".sh", "echo hi"), std::runtime_error);
}

TEST_F(FileUtilsTest, ConcurrentScriptsDoNotCollide) {
    TempScript first(test_dir, ".sh", "echo one");
    TempScript second(test_dir, ".sh", "echo two");
    EXPECT_NE(first.path(), second.path());
    EXPECT_EQ(read_file(first.path()), "echo one");
    EXPECT_EQ(read_file(second.path()), "echo two");
}

} // namespace
} // namespace coderun
