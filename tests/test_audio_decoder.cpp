// PCM conversion and ffmpeg subprocess decoding tests

#include <gtest/gtest.h>

#include <filesystem>

#include "fakes.hpp"
#include "soundscan/audio_decoder.hpp"
#include "soundscan/errors.hpp"

namespace soundscan {
namespace {

using fakes::TempDir;
using fakes::write_file;

/// Write an executable shell script standing in for ffmpeg
std::string fake_ffmpeg(const TempDir &dir, const std::string &body) {
  std::string path = dir.file("ffmpeg");
  write_file(path, "#!/bin/sh\n" + body + "\n");
  std::filesystem::permissions(path, std::filesystem::perms::owner_all,
                               std::filesystem::perm_options::add);
  return path;
}

// -----------------------------------------------------------------------------
// s16le conversion
// -----------------------------------------------------------------------------
TEST(AudioDecoderTest, ConvertsLittleEndianSamples) {
  const char bytes[] = {'\x00', '\x80', '\xff', '\x7f', '\x00', '\x00', '\x01'};
  std::vector<float> out;

  std::size_t used = append_pcm_s16le(bytes, sizeof(bytes), out);
  EXPECT_EQ(used, 6u);
  ASSERT_EQ(out.size(), 3u);
  EXPECT_FLOAT_EQ(out[0], -1.0f);
  EXPECT_FLOAT_EQ(out[1], 32767.0f / 32768.0f);
  EXPECT_FLOAT_EQ(out[2], 0.0f);
}

TEST(AudioDecoderTest, AppendsToExistingSignal) {
  const char bytes[] = {'\x00', '\x40'};
  std::vector<float> out{0.1f};

  append_pcm_s16le(bytes, sizeof(bytes), out);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_FLOAT_EQ(out[1], 0.5f);
}

TEST(AudioDecoderTest, CommandShape) {
  FfmpegDecoder decoder("ffmpeg", 32000, 1024);
  std::string cmd = decoder.command_for("/tmp/it's here.m4a");

  EXPECT_EQ(cmd.rfind("ffmpeg ", 0), 0u);
  EXPECT_NE(cmd.find("-i '/tmp/it'\\''s here.m4a'"), std::string::npos);
  EXPECT_NE(cmd.find("-f s16le -ac 1 -acodec pcm_s16le -ar 32000 -"),
            std::string::npos);
}

// -----------------------------------------------------------------------------
// Subprocess decoding, one sample per read to exercise the carry path
// -----------------------------------------------------------------------------
TEST(AudioDecoderTest, DecodesSubprocessOutput) {
  TempDir dir("decoder_ok");
  std::string bin =
      fake_ffmpeg(dir, "printf '\\000\\100\\000\\100\\000\\100'");
  FfmpegDecoder decoder(bin, 32000, 1);

  auto signal = decoder.decode(dir.file("missing.m4a"));
  ASSERT_EQ(signal.size(), 3u);
  for (float s : signal)
    EXPECT_FLOAT_EQ(s, 0.5f);
}

TEST(AudioDecoderTest, EmptyOutputIsDecodeError) {
  TempDir dir("decoder_fail");
  std::string bin = fake_ffmpeg(dir, "exit 1");
  FfmpegDecoder decoder(bin, 32000, 1024);

  EXPECT_THROW(decoder.decode(dir.file("broken.m4a")), DecodeError);
}

TEST(AudioDecoderTest, ProbeFailsForMissingFile) {
  TempDir dir("decoder_probe");

  AudioProbe probe;
  EXPECT_FALSE(probe_audio(dir.file("absent.m4a"), probe));
  EXPECT_EQ(probe.channels, 0);
}

} // namespace
} // namespace soundscan
