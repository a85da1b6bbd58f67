/**
 * @file audio_decoder.hpp
 * @brief Asset -> mono float PCM via an ffmpeg subprocess
 *
 * @details FfmpegDecoder runs
 *
 *              ffmpeg -i <asset> -f s16le -ac 1 -acodec pcm_s16le -ar <rate> -
 *
 *          and reads its stdout in fixed-size chunks, converting each chunk
 *          to floats in [-1, 1]. Memory while reading is one chunk buffer
 *          plus the growing output signal.
 *
 * @note Before decoding, the asset is probed with libavformat so the output
 *       can be reserved up front and the stream details logged.
 */

#ifndef SOUNDSCAN_AUDIO_DECODER_HPP
#define SOUNDSCAN_AUDIO_DECODER_HPP

#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

namespace soundscan {

// **---- PROBE ----**

/**
 * @struct AudioProbe
 * @brief Stream details reported by libavformat.
 */
struct AudioProbe {
  double duration_seconds = 0.0;
  std::string codec;
  int sample_rate = 0;
  int channels = 0;
};

/**
 * @brief Probe the best audio stream of a media file.
 * @return true on success, false if the file has no readable audio stream
 */
bool probe_audio(const std::string &path, AudioProbe &out);

// **---- PCM CONVERSION ----**

/**
 * @brief Convert little-endian s16 bytes to floats (sample / 32768).
 * @return Bytes consumed; always even, so an odd trailing byte is left over
 */
std::size_t append_pcm_s16le(const char *bytes, std::size_t size,
                             std::vector<float> &out);

// **---- DECODERS ----**

/**
 * @class AudioDecoder
 * @brief Turns an asset path into a mono signal at a fixed rate.
 */
class AudioDecoder {
public:
  virtual ~AudioDecoder() = default;

  /// @throws DecodeError when no samples can be produced
  virtual std::vector<float> decode(const std::string &path) = 0;
};

/**
 * @class PcmStream
 * @brief Owns a popen() pipe; pclose() runs on destruction.
 */
class PcmStream {
  FILE *pipe_ = nullptr;

public:
  explicit PcmStream(const std::string &cmd);
  ~PcmStream();

  PcmStream(const PcmStream &) = delete;
  PcmStream &operator=(const PcmStream &) = delete;

  bool is_open() const { return pipe_ != nullptr; }

  /// Read up to @p size bytes; returns 0 at end of stream
  std::size_t read(char *dst, std::size_t size);

  /**
   * @brief Close the pipe and reap the child.
   * @return Child exit code, or -1 if it could not be determined
   */
  int close();
};

/**
 * @class FfmpegDecoder
 * @brief AudioDecoder backed by the ffmpeg executable.
 */
class FfmpegDecoder : public AudioDecoder {
  std::string binary_;
  int sample_rate_;
  std::size_t chunk_samples_;

public:
  FfmpegDecoder(std::string binary, int sample_rate, std::size_t chunk_samples);

  /// Shell command used to decode @p path
  std::string command_for(const std::string &path) const;

  std::vector<float> decode(const std::string &path) override;
};

} // namespace soundscan

#endif // SOUNDSCAN_AUDIO_DECODER_HPP
