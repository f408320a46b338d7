#include <roomtrace/app/image_source.hpp>
#include <gtest/gtest.h>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace ra = roomtrace::app;
namespace fs = std::filesystem;

namespace {

class FileImageSourceTest : public ::testing::Test {
 protected:
  FileImageSourceTest() : base_(fs::temp_directory_path() / "roomtrace_image_source") {
    fs::remove_all(base_);
    fs::create_directories(base_ / "root" / "blueprints");
    write(base_ / "root" / "blueprints" / "plan.png", "PNGDATA");
    write(base_ / "secret.png", "SECRET");
  }

  ~FileImageSourceTest() override {
    std::error_code ec;
    fs::remove_all(base_, ec);
  }

  static void write(const fs::path& path, const std::string& text) {
    std::ofstream f(path, std::ios::binary);
    f << text;
  }

  fs::path base_;
};

}  // namespace

TEST_F(FileImageSourceTest, ReadsReferenceUnderRoot) {
  const ra::FileImageSource source(base_ / "root");
  auto bytes = source.fetch("blueprints/plan.png");
  ASSERT_TRUE(bytes.has_value());
  ASSERT_EQ(bytes->size(), 7u);
  EXPECT_EQ((*bytes)[0], std::byte{'P'});
}

TEST_F(FileImageSourceTest, MissingFileIsNotFound) {
  const ra::FileImageSource source(base_ / "root");
  auto bytes = source.fetch("blueprints/none.png");
  ASSERT_FALSE(bytes.has_value());
  EXPECT_EQ(bytes.error(), ra::FetchError::NotFound);
}

TEST_F(FileImageSourceTest, ParentTraversalIsRejected) {
  const ra::FileImageSource source(base_ / "root");
  ASSERT_TRUE(fs::is_regular_file(base_ / "root" / "blueprints" / ".." / ".." / "secret.png"));
  auto bytes = source.fetch("blueprints/../../secret.png");
  ASSERT_FALSE(bytes.has_value());
  EXPECT_EQ(bytes.error(), ra::FetchError::NotFound);
}

TEST_F(FileImageSourceTest, AbsoluteReferenceIsRejected) {
  const ra::FileImageSource source(base_ / "root");
  const std::string absolute = (base_ / "secret.png").string();
  ASSERT_TRUE(fs::path(absolute).is_absolute());
  auto bytes = source.fetch(absolute);
  ASSERT_FALSE(bytes.has_value());
  EXPECT_EQ(bytes.error(), ra::FetchError::NotFound);
}

TEST(InMemoryImageSource, ServesPutBytes) {
  ra::InMemoryImageSource source;
  source.put("blueprints/a.png", std::vector<std::byte>(3, std::byte{1}));
  EXPECT_EQ(source.fetch("blueprints/a.png").value().size(), 3u);
  EXPECT_EQ(source.fetch("blueprints/b.png").error(), ra::FetchError::NotFound);
}
