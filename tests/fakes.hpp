// Shared test doubles for the pipeline collaborators.

#ifndef SOUNDSCAN_TESTS_FAKES_HPP
#define SOUNDSCAN_TESTS_FAKES_HPP

#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <string>
#include <vector>

#include <unistd.h>

#include "soundscan/audio_decoder.hpp"
#include "soundscan/classifier.hpp"
#include "soundscan/errors.hpp"
#include "soundscan/fetcher.hpp"
#include "soundscan/reference.hpp"
#include "soundscan/types.hpp"

namespace soundscan::fakes {

// -----------------------------------------------------------------------------
// Scratch directory under the system temp path, removed on destruction
// -----------------------------------------------------------------------------
class TempDir {
  std::filesystem::path path_;

public:
  explicit TempDir(const std::string &name) {
    path_ = std::filesystem::temp_directory_path() /
            ("soundscan_" + name + "_" + std::to_string(getpid()));
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  const std::filesystem::path &path() const { return path_; }
  std::string str() const { return path_.string(); }
  std::string file(const std::string &name) const {
    return (path_ / name).string();
  }
};

inline void write_file(const std::string &path, const std::string &content) {
  std::ofstream out(path, std::ios::trunc);
  out << content;
}

inline std::vector<std::string> read_lines(const std::string &path) {
  std::vector<std::string> lines;
  std::ifstream in(path);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty())
      lines.push_back(line);
  }
  return lines;
}

// -----------------------------------------------------------------------------
// Fetcher: "downloads" by writing "<title> [<id>].m4a" into the directory
// -----------------------------------------------------------------------------
class FakeFetcher : public Fetcher {
public:
  std::set<Identifier> failing;                           //< ids that throw
  std::map<std::string, std::vector<std::string>> feeds;  //< feed -> refs
  int metadata_calls = 0;
  int download_calls = 0;
  int list_calls = 0;
  std::vector<Identifier> downloaded;

  MediaMetadata resolve_metadata(const std::string &reference) override {
    ++metadata_calls;
    Identifier id = extract_identifier(reference);
    if (failing.count(id))
      throw FetchError(reference, "metadata unavailable");
    return {id, "Title " + id};
  }

  std::string download(const std::string &reference,
                       const std::string &directory) override {
    ++download_calls;
    Identifier id = extract_identifier(reference);
    if (failing.count(id))
      throw FetchError(reference, "download refused");
    std::string path =
        (std::filesystem::path(directory) / ("Title " + id + " [" + id + "].m4a"))
            .string();
    write_file(path, "audio");
    downloaded.push_back(id);
    return path;
  }

  std::vector<std::string> list_entries(const std::string &feed) override {
    ++list_calls;
    auto it = feeds.find(feed);
    if (it == feeds.end())
      throw FetchError(feed, "unknown feed");
    return it->second;
  }
};

// -----------------------------------------------------------------------------
// Decoder: a constant signal of fixed length, failing for listed paths
// -----------------------------------------------------------------------------
class FakeDecoder : public AudioDecoder {
public:
  std::size_t samples = 2 * SAMPLE_RATE;
  std::set<std::string> failing_paths;
  std::vector<std::string> decoded;

  std::vector<float> decode(const std::string &path) override {
    if (failing_paths.count(path))
      throw DecodeError("No audio decoded from " + path);
    decoded.push_back(path);
    return std::vector<float>(samples, 0.25f);
  }
};

// -----------------------------------------------------------------------------
// Classifier: one output frame per 10 ms of input, fixed per-class scores
// -----------------------------------------------------------------------------
class FakeClassifier : public Classifier {
public:
  std::size_t classes = 64;
  std::map<std::size_t, float> scores; //< class -> score for every frame
  std::vector<std::size_t> frame_lengths;

  ScoreMatrix infer(const float *, std::size_t count) override {
    frame_lengths.push_back(count);
    std::size_t frames = count / (SAMPLE_RATE / MODEL_FRAMES_PER_SECOND);
    if (frames == 0)
      frames = 1;
    std::vector<float> data(frames * classes, 0.0f);
    for (std::size_t f = 0; f < frames; ++f) {
      for (const auto &[cls, score] : scores) {
        if (cls < classes)
          data[f * classes + cls] = score;
      }
    }
    return ScoreMatrix(frames, classes, std::move(data));
  }
};

} // namespace soundscan::fakes

#endif // SOUNDSCAN_TESTS_FAKES_HPP
