#include "rspd/rotating-log-sink.hpp"

#include <gtest/gtest.h>
#include <spdlog/logger.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "rspd/log-config.hpp"
#include "rspd/temp-file.hpp"
#include "rspd/test-util.hpp"

namespace rspd {

namespace {

std::vector<std::filesystem::path> RotatedFiles(const std::filesystem::path& dir) {
  std::vector<std::filesystem::path> rotated;
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    if (entry.path().filename().string().find(".r_") != std::string::npos) {
      rotated.push_back(entry.path());
    }
  }
  return rotated;
}

}  // namespace

class RotatingLogSinkTest : public ::testing::Test {
 protected:
  std::shared_ptr<RotatingLogSink> makeSink(const LogConfig& config, std::string header = {}) {
    return std::make_shared<RotatingLogSink>(path.string(), config, "%v", std::move(header));
  }

  test::ScopedTempDir tmpDir;
  std::filesystem::path path{tmpDir.dirPath() / "logs" / "test.log"};
};

TEST_F(RotatingLogSinkTest, WritesHeaderOnFreshFile) {
  auto sink = makeSink(LogConfig{}.withLocation("unused"), "|header|");
  spdlog::logger logger("t", sink);
  logger.info("first");
  logger.info("second");
  logger.flush();
  EXPECT_EQ(test::ReadFile(path), "|header|\nfirst\nsecond\n");
  EXPECT_EQ(sink->nbRotations(), 0U);
}

TEST_F(RotatingLogSinkTest, HeaderNotRepeatedWhenAppendingToExistingFile) {
  {
    auto sink = makeSink(LogConfig{}.withLocation("unused"), "|header|");
    spdlog::logger logger("t", sink);
    logger.info("first");
  }
  auto sink = makeSink(LogConfig{}.withLocation("unused"), "|header|");
  spdlog::logger logger("t", sink);
  logger.info("second");
  logger.flush();
  EXPECT_EQ(test::ReadFile(path), "|header|\nfirst\nsecond\n");
}

TEST_F(RotatingLogSinkTest, RotatesBySize) {
  auto sink = makeSink(LogConfig{}.withLocation("unused").withMaxSize(10), "H");
  spdlog::logger logger("t", sink);
  logger.info("0123456789");  // header + line exceed 10 bytes
  logger.info("next");
  logger.flush();

  EXPECT_EQ(sink->nbRotations(), 1U);
  EXPECT_EQ(test::ReadFile(path), "H\nnext\n");
  const auto rotated = RotatedFiles(path.parent_path());
  ASSERT_EQ(rotated.size(), 1U);
  EXPECT_TRUE(rotated[0].filename().string().starts_with("test.log.r_"));
  EXPECT_EQ(test::ReadFile(rotated[0]), "H\n0123456789\n");
}

TEST_F(RotatingLogSinkTest, RotatesByAge) {
  auto sink = makeSink(LogConfig{}.withLocation("unused").withMaxAge(std::chrono::milliseconds{20}));
  spdlog::logger logger("t", sink);
  logger.info("old");
  std::this_thread::sleep_for(std::chrono::milliseconds{40});
  logger.info("new");
  logger.flush();

  EXPECT_EQ(sink->nbRotations(), 1U);
  EXPECT_EQ(test::ReadFile(path), "new\n");
  EXPECT_EQ(RotatedFiles(path.parent_path()).size(), 1U);
}

TEST_F(RotatingLogSinkTest, ReopenedFileKeepsItsAge) {
  {
    auto sink = makeSink(LogConfig{}.withLocation("unused"));
    spdlog::logger logger("t", sink);
    logger.info("previous run");
    logger.flush();
  }
  std::filesystem::last_write_time(path, std::filesystem::file_time_type::clock::now() - std::chrono::hours{2});

  auto sink = makeSink(LogConfig{}.withLocation("unused").withMaxAge(std::chrono::hours{1}));
  spdlog::logger logger("t", sink);
  logger.info("current run");
  logger.flush();

  EXPECT_EQ(sink->nbRotations(), 1U);
  EXPECT_EQ(test::ReadFile(path), "current run\n");
  const auto rotated = RotatedFiles(path.parent_path());
  ASSERT_EQ(rotated.size(), 1U);
  EXPECT_EQ(test::ReadFile(rotated[0]), "previous run\n");
}

TEST_F(RotatingLogSinkTest, DeleteRotation) {
  auto sink = makeSink(LogConfig{}.withLocation("unused").withMaxSize(4).withDeleteRotation());
  spdlog::logger logger("t", sink);
  logger.info("aaaa");
  logger.info("bbbb");
  logger.info("cccc");
  logger.flush();

  EXPECT_EQ(sink->nbRotations(), 2U);
  EXPECT_EQ(test::ReadFile(path), "cccc\n");
  EXPECT_TRUE(RotatedFiles(path.parent_path()).empty());
}

TEST_F(RotatingLogSinkTest, SeveralRotationsInSameSecondKeepDistinctNames) {
  auto sink = makeSink(LogConfig{}.withLocation("unused").withMaxSize(1));
  spdlog::logger logger("t", sink);
  for (int idx = 0; idx < 4; ++idx) {
    logger.info("line {}", idx);
  }
  logger.flush();
  EXPECT_EQ(sink->nbRotations(), 3U);
  EXPECT_EQ(RotatedFiles(path.parent_path()).size(), 3U);
}

TEST_F(RotatingLogSinkTest, ConsoleMirrorSwitch) {
  auto sink = makeSink(LogConfig{}.withLocation("unused"));
  EXPECT_FALSE(sink->mirrorToConsole());
  sink->setMirrorToConsole(true);
  spdlog::logger logger("t", sink);
  testing::internal::CaptureStdout();
  logger.info("mirrored");
  sink->setMirrorToConsole(false);
  logger.info("file only");
  const std::string console = testing::internal::GetCapturedStdout();
  EXPECT_EQ(console, "mirrored\n");
  logger.flush();
  EXPECT_EQ(test::ReadFile(path), "mirrored\nfile only\n");
}

}  // namespace rspd
