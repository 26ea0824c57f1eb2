#include "manifest/manifest_generator.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <limits>
#include <sstream>
#include <vector>
#include <sys/stat.h>

#include "manifest/manifest_store.hpp"
#include "test_util.hpp"

using testutil::TempDir;
namespace fs = std::filesystem;

namespace {

std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) out.push_back(line + "\n");
    return out;
}

// records every reporter callback; the generator reports from its own thread only
class RecordingReporter : public Reporter {
public:
    void info(const std::string&) override {}
    void warn(const std::string&) override {}
    void error(const std::string& msg) override { errors.push_back(msg); }
    void fileHashed(const std::string& path, const std::string&) override { hashed.push_back(path); }
    void fileFailed(const std::string& path, const std::string& cause) override {
        failed.push_back(path);
        causes.push_back(cause);
    }
    void progress(size_t done, size_t total) override {
        lastDone = done;
        lastTotal = total;
    }

    std::vector<std::string> errors, hashed, failed, causes;
    size_t lastDone = 0, lastTotal = 0;
};

// sink whose writes start failing after a number of lines
class FailingSink : public ManifestSink {
public:
    explicit FailingSink(size_t okWrites) : okWrites_(okWrites) {}
    Result<void> open() override { return Result<void>::Ok(); }
    Result<void> write(const ManifestEntry&) override {
        if (writes_++ >= okWrites_) return Result<void>::Error(ErrorType::IOError, "disk full");
        return Result<void>::Ok();
    }
    Result<void> flush() override { return Result<void>::Ok(); }
    size_t writes() const { return writes_; }

private:
    size_t okWrites_;
    size_t writes_ = 0;
};

} // namespace

TEST(ManifestGeneratorTest, TwoFileScenario) {
    TempDir dir;
    dir.write("test1.txt", "Hello, World!");
    dir.write("test2.txt", "Another file content");

    // the manifest lives inside the scanned tree and must not list itself
    fs::path output = dir.path() / "manifest.txt";
    FileManifestSink sink(output.string());
    ManifestGenerator generator(4);

    auto summary = generator.generate(dir.str(), sink);
    ASSERT_TRUE(summary.success) << summary.message;
    EXPECT_EQ(summary.data.fileCount, 2u);
    EXPECT_EQ(summary.data.errorCount, 0u);

    auto written = lines(testutil::readFile(output));
    ASSERT_EQ(written.size(), 2u);
    EXPECT_NE(std::find(written.begin(), written.end(), "test1.txt 65a8e27d8879283831b664bd8b7f0ad4\n"), written.end());
    EXPECT_NE(std::find(written.begin(), written.end(), "test2.txt f41f69f6f6eb0d631ea0d9a45e2ed04d\n"), written.end());
}

TEST(ManifestGeneratorTest, UnhashableFileStillGetsOneLine) {
    TempDir dir;
    const size_t good = 25;
    for (size_t i = 0; i < good; ++i)
        dir.write("f" + std::to_string(i) + ".txt", "content " + std::to_string(i));
    fs::create_symlink(dir.path() / "missing_target", dir.path() / "dangling");

    std::ostringstream out;
    StreamManifestSink sink(out);
    RecordingReporter reporter;
    ManifestGenerator generator(3, &reporter);

    auto summary = generator.generate(dir.str(), sink);
    ASSERT_TRUE(summary.success) << summary.message;
    EXPECT_EQ(summary.data.fileCount, good + 1);
    EXPECT_EQ(summary.data.errorCount, 1u);

    auto written = lines(out.str());
    EXPECT_EQ(written.size(), good + 1);
    EXPECT_NE(std::find(written.begin(), written.end(), "dangling FAILED\n"), written.end());

    EXPECT_EQ(reporter.hashed.size(), good);
    ASSERT_EQ(reporter.failed.size(), 1u);
    EXPECT_EQ(reporter.failed[0], "dangling");
    EXPECT_NE(reporter.causes[0].find("dangling"), std::string::npos);
    EXPECT_EQ(reporter.lastDone, good + 1);
    EXPECT_EQ(reporter.lastTotal, good + 1);
}

TEST(ManifestGeneratorTest, NestedTreeUsesRelativePaths) {
    TempDir dir;
    dir.write("a/b/c.txt", "abc");
    dir.write(".config/settings", "");

    std::ostringstream out;
    StreamManifestSink sink(out);
    auto summary = ManifestGenerator(2).generate(dir.str(), sink);
    ASSERT_TRUE(summary.success);

    auto written = lines(out.str());
    std::sort(written.begin(), written.end());
    ASSERT_EQ(written.size(), 2u);
    EXPECT_EQ(written[0], ".config/settings d41d8cd98f00b204e9800998ecf8427e\n");
    EXPECT_EQ(written[1], "a/b/c.txt 900150983cd24fb0d6963f7d28e17f72\n");
}

TEST(ManifestGeneratorTest, EmptyTreeWritesEmptyManifest) {
    TempDir dir;
    fs::create_directories(dir.path() / "only/dirs");
    fs::path output = dir.path() / "out.txt";

    FileManifestSink sink(output.string());
    auto summary = ManifestGenerator(1).generate((dir.path() / "only").string(), sink);
    ASSERT_TRUE(summary.success);
    EXPECT_EQ(summary.data.fileCount, 0u);
    EXPECT_TRUE(fs::exists(output));
    EXPECT_EQ(testutil::readFile(output), "");
}

TEST(ManifestGeneratorTest, MissingRootAbortsBeforeOpeningSink) {
    TempDir dir;
    fs::path output = dir.path() / "out.txt";
    FileManifestSink sink(output.string());
    RecordingReporter reporter;

    auto summary = ManifestGenerator(2, &reporter).generate((dir.path() / "nope").string(), sink);
    EXPECT_FALSE(summary.success);
    EXPECT_EQ(summary.error, ErrorType::DirectoryError);
    EXPECT_FALSE(fs::exists(output));
    EXPECT_EQ(reporter.errors.size(), 1u);
}

TEST(ManifestGeneratorTest, SinkFailureIsFatalAfterDraining) {
    TempDir dir;
    for (int i = 0; i < 10; ++i) dir.write(std::to_string(i), "x");

    FailingSink sink(3);
    auto summary = ManifestGenerator(4).generate(dir.str(), sink);
    EXPECT_FALSE(summary.success);
    EXPECT_EQ(summary.error, ErrorType::IOError);
    EXPECT_EQ(sink.writes(), 4u);
}

TEST(ManifestGeneratorTest, GeneratedManifestLoadsBack) {
    TempDir src;
    src.write("one", "1");
    src.write("two words.txt", "2");
    src.write("deep/three", "3");

    TempDir out;
    std::string manifestPath = (out.path() / "m.txt").string();
    FileManifestSink sink(manifestPath);
    ASSERT_TRUE(ManifestGenerator().generate(src.str(), sink).success);

    auto loaded = ManifestStore::load(manifestPath);
    ASSERT_TRUE(loaded.success) << loaded.message;
    EXPECT_EQ(loaded.data.size(), 3u);
    EXPECT_TRUE(loaded.data.count("two words.txt"));
    EXPECT_TRUE(loaded.data.count("deep/three"));
}

TEST(ManifestGeneratorTest, DefaultThreadCountIsPositive) {
    EXPECT_GT(ManifestGenerator().threadCount(), 0u);
    EXPECT_EQ(ManifestGenerator(5).threadCount(), 5u);
}

TEST(ManifestGeneratorTest, LinksToPipesAndDevicesDoNotStallTheRun) {
    TempDir dir;
    dir.write("a.txt", "Hello, World!");
    ASSERT_EQ(::mkfifo((dir.path() / "pipe").c_str(), 0600), 0);
    fs::create_symlink(dir.path() / "pipe", dir.path() / "pipe_link");
    fs::create_symlink("/dev/null", dir.path() / "devnull_link");
    fs::create_symlink("/dev/zero", dir.path() / "devzero_link");

    std::ostringstream out;
    StreamManifestSink sink(out);
    auto summary = ManifestGenerator(2).generate(dir.str(), sink);
    ASSERT_TRUE(summary.success) << summary.message;
    EXPECT_EQ(summary.data.fileCount, 1u);
    EXPECT_EQ(summary.data.errorCount, 0u);
    EXPECT_EQ(out.str(), "a.txt 65a8e27d8879283831b664bd8b7f0ad4\n");
}

TEST(ManifestGeneratorTest, WorkerStartupFailureIsAnErrorResult) {
    TempDir dir;
    dir.write("a.txt", "a");
    fs::path output = dir.path() / "out.txt";
    FileManifestSink sink(output.string());
    RecordingReporter reporter;

    ManifestGenerator generator(std::numeric_limits<size_t>::max() / 2, &reporter);
    auto summary = generator.generate(dir.str(), sink);
    EXPECT_FALSE(summary.success);
    EXPECT_EQ(summary.error, ErrorType::ResourceError);
    EXPECT_FALSE(fs::exists(output));
    EXPECT_EQ(reporter.errors.size(), 1u);
}

TEST(ManifestGeneratorTest, EveryFileReportedOnceUnderManyWorkers) {
    TempDir dir;
    const size_t count = 200;
    for (size_t i = 0; i < count; ++i)
        dir.write("d" + std::to_string(i % 7) + "/f" + std::to_string(i), std::to_string(i));

    std::ostringstream out;
    StreamManifestSink sink(out);
    RecordingReporter reporter;
    auto summary = ManifestGenerator(16, &reporter).generate(dir.str(), sink);
    ASSERT_TRUE(summary.success);
    EXPECT_EQ(summary.data.fileCount, count);

    auto written = lines(out.str());
    std::sort(written.begin(), written.end());
    EXPECT_EQ(std::unique(written.begin(), written.end()), written.end());
    EXPECT_EQ(written.size(), count);
    EXPECT_EQ(reporter.hashed.size(), count);
}
