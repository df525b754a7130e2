#include <sleek/server/static_files.h>

#include <gtest/gtest.h>

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <string>

using namespace sleek::server;
namespace fs = std::filesystem;

namespace {

void write_file(const fs::path& path, const std::string& contents) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << contents;
}

} // namespace

class StaticFilesTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        sandbox = fs::temp_directory_path() /
                  ("sleek_static_" + std::to_string(::getpid()) + "_" + info->name());
        fs::remove_all(sandbox);
        root = sandbox / "public";
        write_file(root / "index.html", "<h1>home</h1>");
        write_file(root / "css" / "site.css", "body{}");
        write_file(root / "logo.PNG", "\x89PNG");
        write_file(root / "docs" / "index.html", "<h1>docs</h1>");
        fs::create_directories(root / "empty");
        write_file(sandbox / "secret.txt", "do not serve");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(sandbox, ec);
    }

    fs::path sandbox;
    fs::path root;
};

// ============================================================================
// Resolution
// ============================================================================

TEST_F(StaticFilesTest, RootServesIndex) {
    StaticFiles files(root);
    auto file = files.resolve("/");
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(file->path.filename().string(), "index.html");
    EXPECT_EQ(file->content_type, "text/html; charset=utf-8");
    EXPECT_EQ(StaticFiles::load(*file).value_or(""), "<h1>home</h1>");
}

TEST_F(StaticFilesTest, NestedFiles) {
    StaticFiles files(root);
    auto css = files.resolve("/css/site.css");
    ASSERT_TRUE(css.has_value());
    EXPECT_EQ(css->content_type, "text/css; charset=utf-8");

    auto logo = files.resolve("/logo.PNG");
    ASSERT_TRUE(logo.has_value());
    EXPECT_EQ(logo->content_type, "image/png");
}

TEST_F(StaticFilesTest, DirectoryMapsToItsIndex) {
    StaticFiles files(root);
    auto docs = files.resolve("/docs/");
    ASSERT_TRUE(docs.has_value());
    EXPECT_EQ(StaticFiles::load(*docs).value_or(""), "<h1>docs</h1>");
    EXPECT_TRUE(files.resolve("/docs").has_value());
    EXPECT_FALSE(files.resolve("/empty/").has_value());
}

TEST_F(StaticFilesTest, MissingAndRelativePaths) {
    StaticFiles files(root);
    EXPECT_FALSE(files.resolve("/missing.txt").has_value());
    EXPECT_FALSE(files.resolve("index.html").has_value());
    EXPECT_FALSE(files.resolve("").has_value());
}

TEST_F(StaticFilesTest, TraversalRefused) {
    StaticFiles files(root);
    EXPECT_FALSE(files.resolve("/../secret.txt").has_value());
    EXPECT_FALSE(files.resolve("/css/../../secret.txt").has_value());
    EXPECT_FALSE(files.resolve("/css/../index.html").has_value());
    EXPECT_FALSE(files.resolve("/..\\secret.txt").has_value());
    EXPECT_FALSE(files.resolve(std::string_view("/index.html\0x", 13)).has_value());
}

TEST_F(StaticFilesTest, SymlinkOutOfRootRefused) {
    std::error_code ec;
    fs::create_symlink(sandbox / "secret.txt", root / "leak.txt", ec);
    if (ec) GTEST_SKIP() << "symlinks unavailable: " << ec.message();

    StaticFiles files(root);
    EXPECT_FALSE(files.resolve("/leak.txt").has_value());
}

TEST_F(StaticFilesTest, TrailingSlashOnRoot) {
    StaticFiles files(root.string() + "/");
    EXPECT_TRUE(files.resolve("/css/site.css").has_value());
}

TEST_F(StaticFilesTest, LoadMissingFile) {
    StaticFile gone{sandbox / "gone.txt", "text/plain; charset=utf-8"};
    EXPECT_FALSE(StaticFiles::load(gone).has_value());
}

TEST(StaticFilesShipped, LandingPageExists) {
    StaticFiles files("public");
    auto file = files.resolve("/");
    ASSERT_TRUE(file.has_value());
    auto contents = StaticFiles::load(*file);
    ASSERT_TRUE(contents.has_value());
    EXPECT_NE(contents->find("/proxy?url="), std::string::npos);
}

// ============================================================================
// mime_type_for
// ============================================================================

TEST(MimeTypeTest, KnownExtensions) {
    EXPECT_EQ(mime_type_for("a.htm"), "text/html; charset=utf-8");
    EXPECT_EQ(mime_type_for("app.mjs"), "text/javascript; charset=utf-8");
    EXPECT_EQ(mime_type_for("data.json"), "application/json");
    EXPECT_EQ(mime_type_for("icon.svg"), "image/svg+xml");
    EXPECT_EQ(mime_type_for("photo.JPEG"), "image/jpeg");
    EXPECT_EQ(mime_type_for("font.woff2"), "font/woff2");
    EXPECT_EQ(mime_type_for("site.webmanifest"), "application/manifest+json");
}

TEST(MimeTypeTest, UnknownIsOctetStream) {
    EXPECT_EQ(mime_type_for("archive.tar.zst"), "application/octet-stream");
    EXPECT_EQ(mime_type_for("README"), "application/octet-stream");
}
