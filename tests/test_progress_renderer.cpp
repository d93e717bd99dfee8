#include "streamdl/progress_renderer.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <streambuf>

using namespace streamdl;
using std::chrono::seconds;

namespace {

// A stream buffer that refuses every character.
class BrokenBuffer : public std::streambuf {
protected:
    int_type overflow(int_type) override { return traits_type::eof(); }
};

} // namespace

TEST(ProgressRendererTest, KnownLengthLine) {
    TransferSnapshot snapshot;
    snapshot.downloaded = 250;
    snapshot.content_length = 1000;
    snapshot.speed = 50;
    snapshot.elapsed = seconds{5};

    EXPECT_EQ(formatStatusLine(snapshot), "250 B / 1000 B ( 25%)  50 B/s in  5s ETA: 15s");
}

TEST(ProgressRendererTest, EtaFromRemainingBytesAndSpeed) {
    EXPECT_EQ(estimateRemaining(250, 1000, 50), seconds{15});
    EXPECT_EQ(estimateRemaining(250, 1000, 0), seconds{0});
    EXPECT_EQ(estimateRemaining(0, 3 * 3600, 1), seconds{3 * 3600});
}

TEST(ProgressRendererTest, OvershootIsNotClampedButEtaIsZero) {
    TransferSnapshot snapshot;
    snapshot.downloaded = 1500;
    snapshot.content_length = 1000;
    snapshot.speed = 100;

    EXPECT_EQ(estimateRemaining(1500, 1000, 100), seconds{0});
    const std::string line = formatStatusLine(snapshot);
    EXPECT_NE(line.find("(150%)"), std::string::npos) << line;
    EXPECT_NE(line.find("ETA:  0s"), std::string::npos) << line;
}

TEST(ProgressRendererTest, UnknownLengthLine) {
    TransferSnapshot snapshot;
    snapshot.downloaded = 2048;
    snapshot.speed = 1024;
    snapshot.elapsed = seconds{61};

    EXPECT_EQ(formatStatusLine(snapshot), "Total:   2.0 KiB Speed:   1.0 KiB/s Elapsed:  1m  1s");
}

TEST(ProgressRendererTest, RedrawBlanksThePreviousLine) {
    std::ostringstream out;
    ProgressRenderer renderer(out);

    renderer.erase();
    EXPECT_EQ(out.str(), "");

    renderer.draw("abcdef");
    renderer.carriageReturn();
    EXPECT_EQ(renderer.lastWidth(), 6u);

    renderer.erase();
    renderer.draw("xy");
    renderer.finish();

    EXPECT_EQ(out.str(), "abcdef\r      \rxy\n");
    EXPECT_EQ(renderer.lastWidth(), 2u);
}

TEST(ProgressRendererTest, WidthCountsCharactersNotBytes) {
    std::ostringstream out;
    ProgressRenderer renderer(out);
    renderer.draw("\xC3\xA9t\xC3\xA9");
    EXPECT_EQ(renderer.lastWidth(), 3u);
}

TEST(ProgressRendererTest, BrokenStreamIsIgnored) {
    BrokenBuffer buffer;
    std::ostream out(&buffer);
    out.exceptions(std::ios::badbit | std::ios::failbit);

    ProgressRenderer renderer(out);
    EXPECT_NO_THROW(renderer.draw("status"));
    EXPECT_NO_THROW(renderer.erase());
    EXPECT_NO_THROW(renderer.carriageReturn());
    EXPECT_NO_THROW(renderer.finish());
    EXPECT_TRUE(out.good());
}
