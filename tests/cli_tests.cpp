#include "gtest/gtest.h"
#include "randstream/cli.hpp"
#include "randstream/errors.hpp"
#include "randstream/stream_header.hpp"

#include <filesystem>
#include <fstream>

using namespace randstream;

namespace {

CliArgs parse(std::vector<std::string> args) { return parse_cli(args); }

std::vector<uint8_t> readAll(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)),
                              std::istreambuf_iterator<char>());
}

class CliRunTest : public ::testing::Test {
protected:
  void SetUp() override {
    path_ = (std::filesystem::temp_directory_path() / "randstream_cli.bin")
                .string();
    std::filesystem::remove(path_);
    options_.progress = false;
    options_.jobs = 2;
  }
  void TearDown() override { std::filesystem::remove(path_); }

  std::string path_;
  RuntimeOptions options_;
};

} // namespace

TEST(CliParseTest, GenerateWithAllOptions) {
  CliArgs args = parse({"-v", "generate", "--size", "1M", "--seed=0xabcd",
                        "-j", "3", "--chunk-size=4k", "--no-truncate",
                        "--no-progress", "/dev/sdx"});
  EXPECT_EQ(args.command, Command::Generate);
  EXPECT_EQ(args.verbosity, 1);
  EXPECT_EQ(*args.size, 1024u * 1024u);
  EXPECT_EQ(*args.seedHex, "0xabcd");
  EXPECT_EQ(*args.jobs, 3u);
  EXPECT_EQ(*args.chunkSize, 4096u);
  EXPECT_TRUE(args.noTruncate);
  EXPECT_TRUE(args.noProgress);
  EXPECT_EQ(*args.path, "/dev/sdx");
}

TEST(CliParseTest, Aliases) {
  EXPECT_EQ(parse({"write"}).command, Command::Generate);
  EXPECT_EQ(parse({"read", "f"}).command, Command::Validate);
}

TEST(CliParseTest, StdioDash) {
  CliArgs args = parse({"validate", "-"});
  EXPECT_EQ(args.command, Command::Validate);
  EXPECT_FALSE(args.path.has_value());
}

TEST(CliParseTest, Verbosity) {
  EXPECT_EQ(parse({"-vv", "read"}).verbosity, 2);
  EXPECT_EQ(parse({"-q", "read"}).verbosity, -1);
  EXPECT_EQ(parse({"read", "--verbose", "-v"}).verbosity, 2);
}

TEST(CliParseTest, HelpAndVersion) {
  EXPECT_EQ(parse({"--help"}).command, Command::Help);
  EXPECT_EQ(parse({"-V"}).command, Command::Version);
  EXPECT_EQ(parse({"generate", "-h"}).command, Command::Help);
}

TEST(CliParseTest, UsageErrors) {
  EXPECT_THROW(parse({}), UsageError);
  EXPECT_THROW(parse({"frobnicate"}), UsageError);
  EXPECT_THROW(parse({"--bogus", "generate"}), UsageError);
  EXPECT_THROW(parse({"generate", "--size"}), UsageError);
  EXPECT_THROW(parse({"generate", "a", "b"}), UsageError);
  EXPECT_THROW(parse({"generate", "--no-truncate=yes"}), UsageError);
  // Generation-only options are rejected for validate.
  EXPECT_THROW(parse({"validate", "--seed", "ab"}), UsageError);
}

TEST(CliParseTest, MalformedValues) {
  EXPECT_THROW(parse({"generate", "--size", "ten"}), ConfigurationError);
  EXPECT_THROW(parse({"generate", "-j", "0"}), ConfigurationError);
  EXPECT_THROW(parse({"generate", "-j", "2x"}), ConfigurationError);
}

TEST(CliParseTest, EffectiveLogLevel) {
  EXPECT_EQ(effective_log_level(LogLevel::INFO, 0), LogLevel::INFO);
  EXPECT_EQ(effective_log_level(LogLevel::INFO, 1), LogLevel::DEBUG);
  EXPECT_EQ(effective_log_level(LogLevel::INFO, 5), LogLevel::TRACE);
  EXPECT_EQ(effective_log_level(LogLevel::INFO, -1), LogLevel::WARN);
  EXPECT_EQ(effective_log_level(LogLevel::INFO, -9), LogLevel::FATAL);
}

TEST(CliParseTest, UsageMentionsCommands) {
  std::string usage = usage_text();
  EXPECT_NE(usage.find("generate"), std::string::npos);
  EXPECT_NE(usage.find("validate"), std::string::npos);
  EXPECT_NE(usage.find("--chunk-size"), std::string::npos);
}

TEST_F(CliRunTest, GenerateThenValidateFile) {
  CliArgs gen = parse({"generate", "--size", "100k", "--seed", "1a234e5678",
                       "--chunk-size", "4k", path_});
  ASSERT_EQ(run_cli(gen, options_), static_cast<int>(ExitCode::Success));

  std::vector<uint8_t> stream = readAll(path_);
  StreamParameters params = StreamHeader::decode(stream);
  EXPECT_EQ(params.total_size, 100u * 1024u);
  EXPECT_EQ(params.chunk_size, 4096u);
  EXPECT_EQ(stream.size(), StreamHeader::encodedSize(5) + 100u * 1024u +
                               25u * 4u);

  CliArgs val = parse({"validate", "-j", "4", path_});
  EXPECT_EQ(run_cli(val, options_), static_cast<int>(ExitCode::Success));
}

TEST_F(CliRunTest, FillsExistingFileWithoutSize) {
  std::ofstream(path_) << std::string(10000, '\0');
  CliArgs gen = parse({"generate", "--no-truncate", "--seed", "00ff",
                       "--chunk-size", "1k", path_});
  ASSERT_EQ(run_cli(gen, options_), static_cast<int>(ExitCode::Success));
  EXPECT_LE(std::filesystem::file_size(path_), 10000u);

  CliArgs val = parse({"validate", path_});
  EXPECT_EQ(run_cli(val, options_), static_cast<int>(ExitCode::Success));
}

TEST_F(CliRunTest, ChunkSizeLargerThanStream) {
  CliArgs gen = parse({"generate", "--size", "100", "--seed", "ab",
                       "--chunk-size", "1T", path_});
  ASSERT_EQ(run_cli(gen, options_), static_cast<int>(ExitCode::Success));
  EXPECT_EQ(std::filesystem::file_size(path_),
            StreamHeader::encodedSize(1) + 100u + 4u);

  CliArgs val = parse({"validate", path_});
  EXPECT_EQ(run_cli(val, options_), static_cast<int>(ExitCode::Success));
}

TEST_F(CliRunTest, MissingSizeIsConfigurationError) {
  CliArgs gen = parse({"generate", "--seed", "00", path_});
  EXPECT_EQ(run_cli(gen, options_), static_cast<int>(ExitCode::Configuration));
}

TEST_F(CliRunTest, CorruptionExitCode) {
  CliArgs gen = parse({"generate", "-s", "10k", "-S", "abcd", "-c", "1k",
                       path_});
  ASSERT_EQ(run_cli(gen, options_), static_cast<int>(ExitCode::Success));

  {
    std::fstream f(path_, std::ios::in | std::ios::out | std::ios::binary);
    const std::streamoff pos = 3 * 1028 + 40;
    f.seekg(pos);
    char c = static_cast<char>(f.get());
    f.seekp(pos);
    f.put(static_cast<char>(c ^ 0x20));
  }
  CliArgs val = parse({"validate", path_});
  EXPECT_EQ(run_cli(val, options_), static_cast<int>(ExitCode::Corruption));
}

TEST_F(CliRunTest, FormatAndIoExitCodes) {
  std::ofstream(path_) << "not a stream at all";
  EXPECT_EQ(run_cli(parse({"validate", path_}), options_),
            static_cast<int>(ExitCode::Format));

  std::filesystem::remove(path_);
  EXPECT_EQ(run_cli(parse({"validate", path_}), options_),
            static_cast<int>(ExitCode::IO));
}

namespace {

void restoreTestLogger() {
  Logger::init((std::filesystem::temp_directory_path() / "randstream_tests" /
                "randstream_tests.log")
                   .string(),
               LogLevel::DEBUG);
}

size_t countOccurrences(const std::string &text, const std::string &sub) {
  size_t count = 0;
  for (size_t pos = text.find(sub); pos != std::string::npos;
       pos = text.find(sub, pos + sub.size())) {
    ++count;
  }
  return count;
}

} // namespace

TEST_F(CliRunTest, ConsoleLoggerReportsFailureOnce) {
  Logger::init(Logger::CONSOLE_ONLY_OUTPUT, LogLevel::INFO);
  testing::internal::CaptureStderr();
  int code = run_cli(parse({"validate", path_}), options_);
  std::string err = testing::internal::GetCapturedStderr();
  restoreTestLogger();

  EXPECT_EQ(code, static_cast<int>(ExitCode::IO));
  EXPECT_EQ(countOccurrences(err, "cannot open " + path_), 1u) << err;
  EXPECT_EQ(err.find("\"level\": \"ERROR\""), std::string::npos);
}

TEST_F(CliRunTest, FileLoggerRecordsFailure) {
  const std::string log_path = path_ + ".log";
  std::filesystem::remove(log_path);
  Logger::init(log_path, LogLevel::INFO);
  testing::internal::CaptureStderr();
  int code = run_cli(parse({"validate", path_}), options_);
  std::string err = testing::internal::GetCapturedStderr();
  restoreTestLogger();

  std::ifstream in(log_path);
  std::string logged((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
  std::filesystem::remove(log_path);

  EXPECT_EQ(code, static_cast<int>(ExitCode::IO));
  EXPECT_EQ(countOccurrences(err, "cannot open " + path_), 1u);
  EXPECT_NE(logged.find("\"level\": \"ERROR\""), std::string::npos);
  EXPECT_NE(logged.find("cannot open " + path_), std::string::npos);
}
