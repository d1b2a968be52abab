// Repository: DialogCast
// Component: PCM crossfade and clamping unit tests

#include <gtest/gtest.h>

#include <vector>

#include "dialogcast/audio/AudioDecoder.hpp"
#include "dialogcast/audio/PcmOps.hpp"

namespace dialogcast::audio {
namespace {

PcmBuffer Constant(int16_t value, size_t frames, int rate = 1000) {
  PcmBuffer pcm;
  pcm.sample_rate = rate;
  pcm.channels = 1;
  pcm.samples.assign(frames, value);
  return pcm;
}

TEST(PcmOpsTest, ClampSaturatesWithoutWraparound) {
  EXPECT_EQ(ClampToS16(40000.0f), 32767);
  EXPECT_EQ(ClampToS16(-40000.0f), -32768);
  EXPECT_EQ(ClampToS16(123.0f), 123);
}

TEST(PcmOpsTest, CrossfadeFramesUsesShorterNeighbour) {
  EXPECT_EQ(CrossfadeFrames(24000, 10, 10000, 10000), 240);
  EXPECT_EQ(CrossfadeFrames(24000, 10, 100, 10000), 100);
  EXPECT_EQ(CrossfadeFrames(24000, 10, 10000, 50), 50);
  EXPECT_EQ(CrossfadeFrames(24000, 0, 10000, 10000), 0);
}

TEST(PcmOpsTest, AppendIntoEmptyCopiesSource) {
  PcmBuffer dst;
  AppendWithCrossfade(dst, Constant(7, 5), 3);
  EXPECT_EQ(dst.samples.size(), 5u);
  EXPECT_EQ(dst.sample_rate, 1000);
  EXPECT_EQ(dst.channels, 1);
}

TEST(PcmOpsTest, CrossfadeOverlapsAndRampsLinearly) {
  PcmBuffer dst = Constant(0, 10);
  AppendWithCrossfade(dst, Constant(1000, 10), 4);

  // 10 + 10 - 4 overlapped frames.
  ASSERT_EQ(dst.samples.size(), 16u);
  // Ramp weights 1/5 .. 4/5 over the overlap, strictly increasing.
  EXPECT_EQ(dst.samples[6], 200);
  EXPECT_EQ(dst.samples[7], 400);
  EXPECT_EQ(dst.samples[8], 600);
  EXPECT_EQ(dst.samples[9], 800);
  EXPECT_EQ(dst.samples[5], 0);
  EXPECT_EQ(dst.samples[10], 1000);
}

TEST(PcmOpsTest, ZeroFadeIsConcatenation) {
  PcmBuffer dst = Constant(1, 3);
  AppendWithCrossfade(dst, Constant(2, 2), 0);
  EXPECT_EQ(dst.samples, (std::vector<int16_t>{1, 1, 1, 2, 2}));
}

TEST(PcmOpsTest, S16LEBytesDecodeLittleEndian) {
  const std::vector<uint8_t> bytes = {0x01, 0x00, 0xFF, 0xFF, 0x00, 0x80};
  const PcmBuffer pcm = PcmFromS16LE(bytes, 24000, 1);
  EXPECT_EQ(pcm.samples, (std::vector<int16_t>{1, -1, -32768}));
  EXPECT_EQ(pcm.frames(), 3);
  EXPECT_DOUBLE_EQ(pcm.DurationSeconds(), 3.0 / 24000.0);
}

}  // namespace
}  // namespace dialogcast::audio
