#include "recorder/MediaEncoder.hpp"
#include "supervisor/AtomicFile.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

class EncoderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / ("tdv_encoder_" + std::to_string(getpid()));
        fs::remove_all(dir);
        fs::create_directories(dir);
    }
    void TearDown() override { fs::remove_all(dir); }

    std::string path(const std::string& name) const { return (dir / name).string(); }

    std::string read(const std::string& p) const {
        std::ifstream f(p);
        std::stringstream ss;
        ss << f.rdbuf();
        return ss.str();
    }

    // Files other than the named ones: leftover temporaries.
    int strayFiles(const std::string& keep) const {
        int n = 0;
        for (const auto& e : fs::directory_iterator(dir)) n += e.path().filename().string() != keep;
        return n;
    }

    // /bin/sh stands in for the encoder: `sh -c <script> {out}` sees the
    // output path as $0.
    static std::vector<std::string> script(const std::string& body) { return {"-c", body, "{out}"}; }

    fs::path dir;
};

}

TEST_F(EncoderTest, GoodOutputReplacesFinalFile) {
    std::string out = path("clip.mp4");
    std::ofstream(out) << "old";

    MediaEncoder enc("/bin/sh", 1024, std::chrono::seconds(10));
    EncodeResult r = enc.run(script("head -c 4096 /dev/zero > \"$0\""), out);
    EXPECT_TRUE(r.ok) << r.error;
    EXPECT_EQ(r.exitCode, 0);
    EXPECT_EQ(r.bytes, 4096u);
    EXPECT_EQ(fs::file_size(out), 4096u);
    EXPECT_EQ(strayFiles("clip.mp4"), 0);
}

TEST_F(EncoderTest, UndersizedOutputNeverOverwritesValidFile) {
    std::string out = path("clip.mp4");
    std::ofstream(out) << std::string(5000, 'v');

    MediaEncoder enc("/bin/sh", 1024, std::chrono::seconds(10));
    EncodeResult r = enc.run(script("printf tiny > \"$0\""), out);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.exitCode, 0);
    EXPECT_NE(r.error.find("too small"), std::string::npos);
    EXPECT_EQ(read(out), std::string(5000, 'v'));
    EXPECT_EQ(strayFiles("clip.mp4"), 0);
}

TEST_F(EncoderTest, FailedEncoderKeepsExistingFile) {
    std::string out = path("clip.mp4");
    std::ofstream(out) << "valid";

    MediaEncoder enc("/bin/sh", 0, std::chrono::seconds(10));
    EncodeResult r = enc.run(script("head -c 4096 /dev/zero > \"$0\"; exit 2"), out);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.exitCode, 2);
    EXPECT_EQ(read(out), "valid");
    EXPECT_EQ(strayFiles("clip.mp4"), 0);
}

TEST_F(EncoderTest, MissingOutputIsAFailure) {
    MediaEncoder enc("/bin/sh", 0, std::chrono::seconds(10));
    EncodeResult r = enc.run(script("true"), path("clip.mp4"));
    EXPECT_FALSE(r.ok);
    EXPECT_FALSE(fs::exists(path("clip.mp4")));
}

TEST_F(EncoderTest, HungEncoderIsKilled) {
    MediaEncoder enc("/bin/sh", 0, std::chrono::seconds(1));
    auto started = std::chrono::steady_clock::now();
    EncodeResult r = enc.run(script("sleep 30"), path("clip.mp4"));
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error, "encoder timed out");
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
}

TEST_F(EncoderTest, FramesAreStreamedToStdin) {
    std::vector<cv::Mat> frames(10, cv::Mat(48, 64, CV_8UC3, cv::Scalar(1, 2, 3)));
    MediaEncoder enc("/bin/sh", 1024, std::chrono::seconds(10));
    EncodeResult r = enc.runWithFrames(script("cat > \"$0\""), frames, path("clip.mp4"));
    EXPECT_TRUE(r.ok) << r.error;
    EXPECT_EQ(r.bytes, 10u * 64 * 48 * 3);
}

TEST_F(EncoderTest, MissingBinaryFails) {
    MediaEncoder enc(path("no-such-encoder"), 0, std::chrono::seconds(5));
    EncodeResult r = enc.run({"{out}"}, path("clip.mp4"));
    EXPECT_FALSE(r.ok);
    EXPECT_FALSE(fs::exists(path("clip.mp4")));
}

TEST_F(EncoderTest, AtomicWriteAndTempNames) {
    std::string out = path("status.json");
    std::string tmp = tempPathFor(out);
    EXPECT_EQ(fs::path(tmp).parent_path(), dir);
    EXPECT_EQ(fs::path(tmp).extension().string(), ".json");
    EXPECT_EQ(fs::path(tmp).filename().string()[0], '.');
    EXPECT_NE(tempPathFor(out), tmp);

    EXPECT_TRUE(writeFileAtomic(out, "{\"a\":1}"));
    EXPECT_EQ(read(out), "{\"a\":1}");

    std::string error;
    EXPECT_FALSE(writeFileAtomic(out, "x", 1, 100, error));
    EXPECT_EQ(read(out), "{\"a\":1}");
    EXPECT_EQ(strayFiles("status.json"), 0);
}
