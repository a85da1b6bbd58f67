// End-to-end pipeline tests over fake collaborators

#include <gtest/gtest.h>

#include <filesystem>

#include "fakes.hpp"
#include "soundscan/ledger.hpp"
#include "soundscan/pipeline.hpp"

namespace soundscan {
namespace {

using fakes::FakeClassifier;
using fakes::FakeDecoder;
using fakes::FakeFetcher;
using fakes::read_lines;
using fakes::TempDir;
using fakes::write_file;

std::string ref(const Identifier &id) {
  return "https://www.youtube.com/watch?v=" + id;
}

/// Settings with every file under @p dir and small frames
PipelineSettings settings_in(const TempDir &dir) {
  PipelineSettings s;
  s.ledger_path = dir.file("inference_log.csv");
  s.asset_dir = dir.str();
  s.feed_cache_dir = dir.str();
  s.retry_list_path = dir.file("failed_references.txt");
  s.batch_size = SAMPLE_RATE;
  s.precision_frames = 100;
  s.threshold = 50;
  return s;
}

/// Collaborators shared by most tests
struct Rig {
  TempDir dir;
  FakeFetcher fetcher;
  FakeDecoder decoder;
  FakeClassifier classifier;
  ScriptedDecisionProvider decisions{ScriptedDecisionProvider::Answers{}};
  PipelineSettings settings;

  explicit Rig(const std::string &name) : dir(name), settings(settings_in(dir)) {
    classifier.scores[FART_CLASS] = 0.9f;
  }

  RunSummary run(const std::vector<std::string> &sources) {
    Pipeline pipeline(settings, fetcher, decoder, classifier, decisions);
    return pipeline.run(sources);
  }

  std::vector<std::string> ledger_rows() const {
    return read_lines(settings.ledger_path);
  }
};

// -----------------------------------------------------------------------------
// Fresh batch: every item downloaded, every class logged, no questions
// -----------------------------------------------------------------------------
TEST(PipelineTest, FreshBatchLogsEveryClass) {
  Rig rig("pipe_fresh");

  auto summary = rig.run({ref("a"), "https://youtu.be/b"});
  EXPECT_EQ(summary.exit_code, 0);
  EXPECT_TRUE(summary.batch_mode);
  EXPECT_EQ(summary.counters.total, 2u);
  EXPECT_EQ(summary.counters.inferenced, 2u);
  EXPECT_EQ(summary.counters.new_downloads, 2u);
  EXPECT_EQ(rig.decisions.calls().total(), 0);

  auto rows = rig.ledger_rows();
  ASSERT_EQ(rows.size(), 4u);
  EXPECT_EQ(rows[0].rfind(ref("a") + ",60,", 0), 0u);
  EXPECT_EQ(rows[1].rfind(ref("a") + ",58,", 0), 0u);
  EXPECT_EQ(rows[2].rfind(ref("b") + ",60,", 0), 0u);
  EXPECT_EQ(rows[3].rfind(ref("b") + ",58,", 0), 0u);
  EXPECT_NE(rows[0].find("Title a"), std::string::npos);
}

TEST(PipelineTest, SecondRunOnlyProcessesNewItems) {
  Rig rig("pipe_idempotent");
  ASSERT_EQ(rig.run({ref("a"), ref("b")}).exit_code, 0);
  ASSERT_EQ(rig.ledger_rows().size(), 4u);

  rig.fetcher.downloaded.clear();
  rig.decoder.decoded.clear();
  auto summary = rig.run({ref("a"), ref("b"), ref("c")});

  EXPECT_EQ(summary.exit_code, 0);
  EXPECT_EQ(rig.decisions.calls().policy, 1);
  EXPECT_EQ(rig.fetcher.downloaded, std::vector<Identifier>{"c"});
  EXPECT_EQ(rig.decoder.decoded.size(), 1u);
  EXPECT_EQ(summary.counters.skipped, 2u);
  EXPECT_EQ(rig.ledger_rows().size(), 6u);

  auto ledger = LedgerSnapshot::load(rig.settings.ledger_path);
  EXPECT_TRUE(ledger.is_logged("c", FART_CLASS));
  EXPECT_TRUE(ledger.is_logged("c", BURP_CLASS));
}

TEST(PipelineTest, DecliningRerunOfDoneItemExitsCleanly) {
  Rig rig("pipe_decline");
  write_file(rig.settings.ledger_path,
             "https://youtu.be/abc,60,01/01/2024_00:00:00,Song\n");
  write_file(rig.dir.file("Song [abc].m4a"), "audio");

  auto summary = rig.run({"https://www.youtube.com/shorts/abc"});
  EXPECT_EQ(summary.exit_code, 0);
  EXPECT_TRUE(summary.terminated_early);
  EXPECT_FALSE(summary.batch_mode);
  EXPECT_EQ(rig.decisions.calls().rerun_all, 1);
  EXPECT_TRUE(rig.decoder.decoded.empty());
  EXPECT_EQ(rig.fetcher.download_calls, 0);
  EXPECT_EQ(rig.ledger_rows().size(), 1u);
}

TEST(PipelineTest, AcceptingRerunReusesCachedFile) {
  Rig rig("pipe_rerun");
  rig.decisions.answers().rerun_all = true;
  write_file(rig.settings.ledger_path,
             "https://youtu.be/abc,60,01/01/2024_00:00:00,Song\n");
  write_file(rig.dir.file("Song [abc].m4a"), "audio");

  auto summary = rig.run({"https://youtu.be/abc"});
  EXPECT_EQ(summary.exit_code, 0);
  EXPECT_EQ(rig.fetcher.download_calls, 0);
  EXPECT_EQ(rig.decisions.calls().reinfer, 0);
  EXPECT_EQ(rig.decoder.decoded,
            std::vector<std::string>{rig.dir.file("Song [abc].m4a")});
  EXPECT_EQ(rig.ledger_rows().size(), 3u);
}

// -----------------------------------------------------------------------------
// Failures
// -----------------------------------------------------------------------------
TEST(PipelineTest, BatchFetchFailureWritesRetryList) {
  Rig rig("pipe_retry");
  rig.fetcher.failing.insert("bad");

  auto summary = rig.run({ref("good"), ref("bad")});
  EXPECT_EQ(summary.exit_code, 0);
  EXPECT_EQ(summary.counters.fetch_failures, 1u);
  EXPECT_EQ(summary.counters.inferenced, 1u);
  EXPECT_EQ(summary.retry_list, std::vector<std::string>{ref("bad")});
  EXPECT_EQ(read_lines(rig.settings.retry_list_path),
            std::vector<std::string>{ref("bad")});
}

TEST(PipelineTest, RetryListIsAValidSource) {
  Rig rig("pipe_retry_source");
  write_file(rig.settings.retry_list_path, ref("again") + "\n");

  auto summary = rig.run({rig.settings.retry_list_path});
  EXPECT_EQ(summary.exit_code, 0);
  EXPECT_TRUE(summary.batch_mode);
  EXPECT_EQ(rig.fetcher.downloaded, std::vector<Identifier>{"again"});
}

TEST(PipelineTest, RetryRunsFailedReferencesInBatchMode) {
  Rig rig("pipe_retry_again");
  rig.settings.retry_list_path = rig.dir.file("failed_refs");
  rig.fetcher.failing.insert("bad");

  auto first = rig.run({ref("good"), ref("bad")});
  ASSERT_EQ(first.retry_list, std::vector<std::string>{ref("bad")});
  ASSERT_TRUE(std::filesystem::exists(rig.settings.retry_list_path));

  // Still failing: a single reference stays in batch mode and is listed again
  Pipeline pipeline(rig.settings, rig.fetcher, rig.decoder, rig.classifier,
                    rig.decisions);
  auto again = pipeline.retry(first.retry_list);
  EXPECT_EQ(again.exit_code, 0);
  EXPECT_TRUE(again.batch_mode);
  EXPECT_EQ(again.retry_list, std::vector<std::string>{ref("bad")});

  rig.fetcher.failing.clear();
  auto fixed = pipeline.retry(again.retry_list);
  EXPECT_EQ(fixed.exit_code, 0);
  EXPECT_TRUE(fixed.retry_list.empty());
  EXPECT_EQ(rig.fetcher.downloaded, (std::vector<Identifier>{"good", "bad"}));
  EXPECT_FALSE(std::filesystem::exists(rig.settings.retry_list_path));
}

TEST(PipelineTest, CleanRunRemovesStaleRetryList) {
  Rig rig("pipe_stale_retry");
  write_file(rig.settings.retry_list_path, ref("old") + "\n");

  auto summary = rig.run({ref("a")});
  EXPECT_EQ(summary.exit_code, 0);
  EXPECT_FALSE(std::filesystem::exists(rig.settings.retry_list_path));
}

TEST(PipelineTest, SingleFetchFailureExitsWithError) {
  Rig rig("pipe_single_fail");
  rig.fetcher.failing.insert("bad");

  auto summary = rig.run({ref("bad")});
  EXPECT_EQ(summary.exit_code, 1);
  EXPECT_FALSE(std::filesystem::exists(rig.settings.ledger_path));
  EXPECT_FALSE(std::filesystem::exists(rig.settings.retry_list_path));
}

TEST(PipelineTest, BatchDecodeFailureContinues) {
  Rig rig("pipe_decode_fail");
  rig.decoder.failing_paths.insert(rig.dir.file("Title a [a].m4a"));

  auto summary = rig.run({ref("a"), ref("b")});
  EXPECT_EQ(summary.exit_code, 0);
  EXPECT_EQ(summary.counters.decode_failures, 1u);
  EXPECT_EQ(summary.counters.inferenced, 1u);

  auto rows = rig.ledger_rows();
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].rfind(ref("b"), 0), 0u);
}

TEST(PipelineTest, LedgerWriteFailureStopsRun) {
  Rig rig("pipe_ledger_fail");
  rig.settings.ledger_path = rig.dir.file("no_such_dir/inference_log.csv");

  auto summary = rig.run({ref("a"), ref("b")});
  EXPECT_EQ(summary.exit_code, 1);
  EXPECT_EQ(rig.fetcher.downloaded, std::vector<Identifier>{"a"});
  EXPECT_EQ(rig.decoder.decoded,
            std::vector<std::string>{rig.dir.file("Title a [a].m4a")});
  EXPECT_EQ(summary.counters.inferenced, 0u);
  EXPECT_FALSE(std::filesystem::exists(rig.settings.ledger_path));
}

TEST(PipelineTest, SingleDecodeFailureExitsWithError) {
  Rig rig("pipe_single_decode");
  rig.decoder.failing_paths.insert(rig.dir.file("Title a [a].m4a"));

  auto summary = rig.run({ref("a")});
  EXPECT_FALSE(summary.batch_mode);
  EXPECT_EQ(summary.exit_code, 1);
  EXPECT_EQ(summary.counters.decode_failures, 1u);
  EXPECT_TRUE(rig.ledger_rows().empty());
}

TEST(PipelineTest, ClassMissingFromModelFailsItem) {
  Rig rig("pipe_small_model");
  rig.classifier.classes = 59;

  auto summary = rig.run({ref("a")});
  EXPECT_EQ(summary.exit_code, 1);
  EXPECT_EQ(summary.counters.decode_failures, 1u);
  EXPECT_TRUE(rig.ledger_rows().empty());
}

TEST(PipelineTest, ListWithoutReferencesIsError) {
  Rig rig("pipe_empty_list");
  std::string list = rig.dir.file("urls.txt");
  write_file(list, "# nothing\n\n");

  EXPECT_EQ(rig.run({list}).exit_code, 1);
  EXPECT_EQ(rig.decisions.calls().total(), 0);
}

// -----------------------------------------------------------------------------
// Variants
// -----------------------------------------------------------------------------
TEST(PipelineTest, LocalFilesAreNeverLedgered) {
  Rig rig("pipe_local");
  std::string clip = rig.dir.file("clip.wav");
  write_file(clip, "RIFF");

  auto summary = rig.run({clip});
  EXPECT_EQ(summary.exit_code, 0);
  EXPECT_EQ(summary.counters.inferenced, 1u);
  EXPECT_EQ(rig.decoder.decoded, std::vector<std::string>{clip});
  EXPECT_FALSE(std::filesystem::exists(rig.settings.ledger_path));
}

TEST(PipelineTest, FocusClassLogsOnlyThatClass) {
  Rig rig("pipe_focus");
  rig.settings.classes = {{BURP_CLASS, "Burp"}};

  ASSERT_EQ(rig.run({ref("a")}).exit_code, 0);
  auto rows = rig.ledger_rows();
  ASSERT_EQ(rows.size(), 1u);
  EXPECT_EQ(rows[0].rfind(ref("a") + ",58,", 0), 0u);
}

} // namespace
} // namespace soundscan
