/**
 * @file audio_decoder.cpp
 * @brief libavformat probe and ffmpeg PCM streaming
 *
 * @attention The probe only opens the container and reads stream info. All
 *            decoding and resampling is left to the ffmpeg child process.
 */

#include "soundscan/audio_decoder.hpp"

#include <cstdint>
#include <cstring>

#include <sys/wait.h>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
}

#include <fmt/core.h>

#include "soundscan/errors.hpp"
#include "soundscan/logging.hpp"
#include "soundscan/system.hpp"

namespace soundscan {

// **---- Probe ----**

bool probe_audio(const std::string &path, AudioProbe &out) {
  AVFormatContext *fmt_ctx = nullptr;

  if (avformat_open_input(&fmt_ctx, path.c_str(), nullptr, nullptr) < 0) {
    LOG_WARN("avformat_open_input failed for {}", path);
    return false;
  }

  if (avformat_find_stream_info(fmt_ctx, nullptr) < 0) {
    LOG_WARN("avformat_find_stream_info failed for {}", path);
    avformat_close_input(&fmt_ctx);
    return false;
  }

  int stream_idx =
      av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
  if (stream_idx < 0) {
    LOG_WARN("No audio stream found in {}", path);
    avformat_close_input(&fmt_ctx);
    return false;
  }

  const AVStream *stream = fmt_ctx->streams[stream_idx];
  const AVCodecParameters *par = stream->codecpar;

  if (fmt_ctx->duration != AV_NOPTS_VALUE) {
    out.duration_seconds =
        static_cast<double>(fmt_ctx->duration) / AV_TIME_BASE;
  } else if (stream->duration != AV_NOPTS_VALUE) {
    out.duration_seconds = stream->duration * av_q2d(stream->time_base);
  }
  out.codec = avcodec_get_name(par->codec_id);
  out.sample_rate = par->sample_rate;
#if LIBAVUTIL_VERSION_INT >= AV_VERSION_INT(57, 28, 100)
  out.channels = par->ch_layout.nb_channels;
#else
  out.channels = par->channels;
#endif

  avformat_close_input(&fmt_ctx);
  return true;
}

// **---- PCM Conversion ----**

std::size_t append_pcm_s16le(const char *bytes, std::size_t size,
                             std::vector<float> &out) {
  std::size_t usable = size & ~static_cast<std::size_t>(1);
  const auto *p = reinterpret_cast<const unsigned char *>(bytes);
  for (std::size_t i = 0; i < usable; i += 2) {
    auto sample = static_cast<int16_t>(static_cast<uint16_t>(p[i]) |
                                       (static_cast<uint16_t>(p[i + 1]) << 8));
    out.push_back(static_cast<float>(sample) / 32768.0f);
  }
  return usable;
}

// **---- PcmStream ----**

PcmStream::PcmStream(const std::string &cmd) : pipe_(popen(cmd.c_str(), "r")) {}

PcmStream::~PcmStream() { close(); }

std::size_t PcmStream::read(char *dst, std::size_t size) {
  if (!pipe_)
    return 0;
  return std::fread(dst, 1, size, pipe_);
}

int PcmStream::close() {
  if (!pipe_)
    return -1;
  int status = pclose(pipe_);
  pipe_ = nullptr;
  if (status == -1 || !WIFEXITED(status))
    return -1;
  return WEXITSTATUS(status);
}

// **---- FfmpegDecoder ----**

FfmpegDecoder::FfmpegDecoder(std::string binary, int sample_rate,
                             std::size_t chunk_samples)
    : binary_(std::move(binary)), sample_rate_(sample_rate),
      chunk_samples_(chunk_samples > 0 ? chunk_samples : 1) {}

std::string FfmpegDecoder::command_for(const std::string &path) const {
  return fmt::format("{} -nostdin -hide_banner -loglevel error -i {} -f s16le "
                     "-ac 1 -acodec pcm_s16le -ar {} -",
                     binary_, shell_quote(path), sample_rate_);
}

std::vector<float> FfmpegDecoder::decode(const std::string &path) {
  std::vector<float> signal;

  TIMER_START(probe);
  AudioProbe probe;
  if (probe_audio(path, probe)) {
    LOG_INFO("Probed {}: {} {} Hz, {} ch, {}", path, probe.codec,
             probe.sample_rate, probe.channels,
             format_time(probe.duration_seconds));
    if (probe.duration_seconds > 0) {
      signal.reserve(
          static_cast<std::size_t>(probe.duration_seconds * sample_rate_) + 1);
    }
  }
  TIMER_END(probe);

  PcmStream stream(command_for(path));
  if (!stream.is_open())
    throw DecodeError(fmt::format("Failed to launch {} for {}", binary_, path));

  /// One extra byte for a sample split across two reads
  const std::size_t chunk_bytes = chunk_samples_ * 2;
  std::vector<char> buffer(chunk_bytes + 1);
  std::size_t carry = 0;

  while (true) {
    std::size_t n = stream.read(buffer.data() + carry, chunk_bytes);
    if (n == 0)
      break;
    std::size_t have = carry + n;
    std::size_t used = append_pcm_s16le(buffer.data(), have, signal);
    carry = have - used;
    if (carry > 0)
      buffer[0] = buffer[used];
  }

  int status = stream.close();
  if (status != 0)
    LOG_WARN("{} exited with status {} for {}", binary_, status, path);

  if (signal.empty())
    throw DecodeError(fmt::format("No audio decoded from {}", path));

  return signal;
}

} // namespace soundscan
