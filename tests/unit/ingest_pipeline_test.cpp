#include "internal/ingest/ingest_pipeline.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/sha256.hpp"
#include "support/fake_extractor.hpp"

namespace fs = std::filesystem;

using zget::ingest::CancellationToken;
using zget::ingest::IngestPipeline;
using zget::ingest::PipelineOptions;
using zget::model::IngestOptions;
using zget::util::DuplicateError;
using zget::util::DuplicateKind;

namespace {

class CountingSink final : public zget::ingest::ProgressSink {
 public:
  void OnProgress(const zget::model::Progress&) override {
    ++events;
  }

  std::atomic<int> events{0};
};

class ThrowingSidecar final : public zget::ingest::SidecarWriter {
 public:
  fs::path Write(const zget::model::MediaRecord&) override {
    throw std::runtime_error("disk full");
  }
};

std::size_t CountFiles(const fs::path& dir) {
  std::error_code ec;
  if (!fs::exists(dir, ec)) return 0;
  std::size_t count = 0;
  for (const auto& entry : fs::recursive_directory_iterator(dir)) {
    if (entry.is_regular_file()) ++count;
  }
  return count;
}

std::size_t CountEntries(const fs::path& dir) {
  std::error_code ec;
  if (!fs::exists(dir, ec)) return 0;
  return static_cast<std::size_t>(std::distance(fs::directory_iterator(dir), fs::directory_iterator()));
}

std::string Sha256Of(const std::string& bytes) {
  zget::util::Sha256 hasher;
  hasher.Update(bytes.data(), bytes.size());
  return hasher.HexDigest();
}

struct Fixture {
  explicit Fixture(const std::string& name) : dir(name) {
    config.mutable_library()->set_home(dir.Path().string());
    config.mutable_library()->set_temp_dir((dir.Path() / "tmp").string());
    zget::config::ConfigLoader::ApplyDefaults(config);

    store     = zget::factory::BuildLibraryStore(config);
    extractor = std::make_shared<zget::testing::FakeExtractor>();
  }

  PipelineOptions Options() const {
    PipelineOptions options;
    options.temp_dir = config.library().temp_dir();
    return options;
  }

  std::unique_ptr<IngestPipeline> Pipeline(PipelineOptions options, std::shared_ptr<zget::ingest::ThumbnailCache> thumbnails = nullptr,
                                           std::vector<std::shared_ptr<zget::ingest::SidecarWriter>> sidecars = {}) {
    return std::make_unique<IngestPipeline>(store, extractor, zget::ingest::DestinationResolver(Videos(), false), std::move(options),
                                            std::move(thumbnails), std::move(sidecars));
  }

  std::unique_ptr<IngestPipeline> Pipeline() {
    return Pipeline(Options());
  }

  fs::path Videos() const {
    return config.library().videos_dir();
  }

  fs::path Temp() const {
    return config.library().temp_dir();
  }

  zget::testing::TestDir                         dir;
  zget::runtime::config::RuntimeConfig           config;
  std::shared_ptr<zget::library::LibraryStore>   store;
  std::shared_ptr<zget::testing::FakeExtractor>  extractor;
};

void TestSuccessfulIngestCommitsRecordAndFile() {
  Fixture           f("pipeline_success");
  auto              pipeline = f.Pipeline();
  CountingSink      sink;
  CancellationToken token;

  const std::string url = "https://www.youtube.com/watch?v=a1";
  IngestOptions     options;
  options.tags       = {"music", "live"};
  options.collection = "favourites";

  auto record = pipeline->Ingest(url, options, sink, token);

  assert(record.id > 0);
  assert(record.source_url == url);
  assert(record.platform == "youtube");
  assert(record.title.rfind("Example clip ", 0) == 0);
  assert(record.uploader == "uploader");
  assert(record.duration_seconds && *record.duration_seconds == 12);
  assert(record.resolution == "1920x1080");
  assert(record.codec == "avc1");
  assert(record.upload_date.has_value());
  assert(record.content_hash == Sha256Of("content of " + url));
  assert(record.file_size_bytes == ("content of " + url).size());
  assert(!record.raw_json.empty());
  assert(record.tags.size() == 2);
  assert(record.collection == "favourites");
  assert(sink.events == 1);

  const fs::path placed(record.local_path);
  assert(placed.is_absolute());
  assert(fs::exists(placed));
  assert(placed.parent_path() == f.Videos() / "youtube");

  auto stored = f.store->Get(record.id);
  assert(stored.source_url == url);
  assert(stored.content_hash == record.content_hash);
  assert(stored.local_path == record.local_path);

  // the private work dir is gone
  assert(CountEntries(f.Temp()) == 0);
}

void TestUrlDuplicateIsRejectedBeforeDownload() {
  Fixture           f("pipeline_url_dup");
  auto              pipeline = f.Pipeline();
  CountingSink      sink;
  CancellationToken token;

  const std::string url   = "https://x.com/user/status/1";
  auto              first = pipeline->Ingest(url, {}, sink, token);

  bool threw = false;
  try {
    (void)pipeline->Ingest(url, {}, sink, token);
  } catch (const DuplicateError& e) {
    threw = e.Kind() == DuplicateKind::kUrl && e.ExistingId() == first.id;
  }
  assert(threw);
  assert(f.extractor->calls == 1);
  assert(CountFiles(f.Videos()) == 1);

  // skipping the url check still finds the identical content
  IngestOptions again;
  again.skip_duplicate_check = true;
  threw                      = false;
  try {
    (void)pipeline->Ingest(url, again, sink, token);
  } catch (const DuplicateError& e) {
    threw = e.Kind() == DuplicateKind::kContentHash && e.ExistingId() == first.id;
  }
  assert(threw);
  assert(f.extractor->calls == 2);
  assert(CountFiles(f.Videos()) == 1);
  assert(f.store->Count() == 1);
}

void TestContentDuplicateLeavesNoFile() {
  Fixture f("pipeline_hash_dup");
  f.extractor->content = [](const std::string&) { return std::string("same bytes everywhere"); };
  auto              pipeline = f.Pipeline();
  CountingSink      sink;
  CancellationToken token;

  auto first = pipeline->Ingest("https://www.tiktok.com/@a/video/1", {}, sink, token);

  bool threw = false;
  try {
    (void)pipeline->Ingest("https://www.tiktok.com/@b/video/2", {}, sink, token);
  } catch (const DuplicateError& e) {
    threw = e.Kind() == DuplicateKind::kContentHash && e.ExistingId() == first.id;
  }
  assert(threw);
  assert(CountFiles(f.Videos()) == 1);
  assert(fs::exists(first.local_path));
  assert(f.store->Count() == 1);
  assert(CountEntries(f.Temp()) == 0);
}

void TestHashCheckCanBeDisabled() {
  Fixture f("pipeline_hash_off");
  f.extractor->content = [](const std::string&) { return std::string("same bytes everywhere"); };
  auto options         = f.Options();
  options.check_hash   = false;
  auto              pipeline = f.Pipeline(options);
  CountingSink      sink;
  CancellationToken token;

  (void)pipeline->Ingest("https://www.reddit.com/r/a/1", {}, sink, token);

  // the catalog still refuses a second row with the same content
  bool threw = false;
  try {
    (void)pipeline->Ingest("https://www.reddit.com/r/a/2", {}, sink, token);
  } catch (const DuplicateError& e) {
    threw = e.Kind() == DuplicateKind::kContentHash;
  }
  assert(threw);
  assert(CountFiles(f.Videos()) == 1);
  assert(f.store->Count() == 1);
}

void TestSourceIdCollisionRemovesPlacedAndSideFiles() {
  Fixture f("pipeline_source_dup");
  f.extractor->metadata = [](const std::string&) {
    zget::ingest::ExtractorResult r;
    r.source_id = "fixed-id";
    r.title     = "Same source";
    return r;
  };
  const auto exports = fs::path(f.config.library().exports_dir());
  auto       pipeline =
      f.Pipeline(f.Options(), nullptr, {std::make_shared<zget::ingest::JsonExportWriter>(exports)});
  CountingSink      sink;
  CancellationToken token;

  (void)pipeline->Ingest("https://www.instagram.com/reel/one/", {}, sink, token);
  assert(CountFiles(exports) == 1);

  bool threw = false;
  try {
    (void)pipeline->Ingest("https://www.instagram.com/reel/two/", {}, sink, token);
  } catch (const DuplicateError& e) {
    threw = e.Kind() == DuplicateKind::kSourceId;
  }
  assert(threw);
  assert(CountFiles(f.Videos()) == 1);
  assert(CountFiles(exports) == 1);
  assert(f.store->Count() == 1);
}

std::string ReadAll(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void TestConcurrentSourceIdCollisionKeepsWinnerSideFiles() {
  Fixture f("pipeline_source_race");
  f.extractor->delay    = std::chrono::milliseconds(200);
  f.extractor->metadata = [](const std::string&) {
    zget::ingest::ExtractorResult r;
    r.source_id = "X";
    r.title     = "Same video";
    return r;
  };
  const auto exports = fs::path(f.config.library().exports_dir());
  auto       pipeline =
      f.Pipeline(f.Options(), nullptr, {std::make_shared<zget::ingest::JsonExportWriter>(exports)});

  const std::vector<std::string> urls = {"https://www.youtube.com/watch?v=X", "https://youtu.be/X"};
  std::atomic<int>               completed{0};
  std::atomic<int>               duplicates{0};
  std::vector<std::thread>       threads;
  for (const auto& url : urls) {
    threads.emplace_back([&, url] {
      CountingSink      sink;
      CancellationToken token;
      try {
        (void)pipeline->Ingest(url, {}, sink, token);
        ++completed;
      } catch (const DuplicateError& e) {
        if (e.Kind() == DuplicateKind::kSourceId) ++duplicates;
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(completed == 1);
  assert(duplicates == 1);
  const auto winner = f.store->ListRecent(1).at(0);
  assert(fs::exists(winner.local_path));
  assert(CountFiles(f.Videos()) == 1);

  assert(CountFiles(exports) == 1);
  for (const auto& entry : fs::directory_iterator(exports)) {
    assert(ReadAll(entry.path()).find(winner.source_url) != std::string::npos);
  }
}

void TestCancellationDuringDownloadLeavesNothing() {
  Fixture f("pipeline_cancel");
  f.extractor->delay           = std::chrono::seconds(5);
  auto              pipeline   = f.Pipeline();
  CountingSink      sink;
  CancellationToken token;

  std::thread canceller([&token] {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    token.Cancel();
  });

  bool cancelled = false;
  try {
    (void)pipeline->Ingest("https://www.twitch.tv/videos/1", {}, sink, token);
  } catch (const zget::util::CancelledError&) {
    cancelled = true;
  }
  canceller.join();

  assert(cancelled);
  assert(CountFiles(f.Videos()) == 0);
  assert(CountEntries(f.Temp()) == 0);
  assert(f.store->Count() == 0);
}

void TestCancelledTokenNeverDownloads() {
  Fixture           f("pipeline_cancel_early");
  auto              pipeline = f.Pipeline();
  CountingSink      sink;
  CancellationToken token;
  token.Cancel();

  bool cancelled = false;
  try {
    (void)pipeline->Ingest("https://youtu.be/abc", {}, sink, token);
  } catch (const zget::util::CancelledError&) {
    cancelled = true;
  }
  assert(cancelled);
  assert(f.extractor->calls == 0);
  assert(f.store->Count() == 0);
}

void TestFailuresPropagateWithoutLeftovers() {
  Fixture           f("pipeline_failures");
  CountingSink      sink;
  CancellationToken token;

  f.extractor->fail = true;
  auto pipeline     = f.Pipeline();
  bool extraction   = false;
  try {
    (void)pipeline->Ingest("https://youtu.be/fail", {}, sink, token);
  } catch (const zget::util::ExtractionError&) {
    extraction = true;
  }
  assert(extraction);

  // nothing the locator recognises as media
  f.extractor->fail        = false;
  f.extractor->report_path = false;
  f.extractor->extension   = ".part";
  bool io                  = false;
  try {
    (void)pipeline->Ingest("https://youtu.be/nofile", {}, sink, token);
  } catch (const zget::util::IOError& e) {
    io = std::string(e.what()).find("Downloaded file not found") != std::string::npos;
  }
  assert(io);

  assert(CountFiles(f.Videos()) == 0);
  assert(CountEntries(f.Temp()) == 0);
  assert(f.store->Count() == 0);
}

void TestLocatorFallsBackToNameMatch() {
  Fixture f("pipeline_name_match");
  f.extractor->report_path = false;
  f.extractor->extension   = ".webm";
  auto              pipeline = f.Pipeline();
  CountingSink      sink;
  CancellationToken token;

  auto record = pipeline->Ingest("https://youtu.be/webm", {}, sink, token);
  assert(fs::path(record.local_path).extension() == ".webm");
  assert(fs::exists(record.local_path));
}

void TestSideEffectFailuresDoNotFailTheRun() {
  Fixture f("pipeline_sidecar");
  f.extractor->write_thumbnail = true;
  const auto thumbnails        = fs::path(f.config.library().thumbnails_dir());
  auto       pipeline          = f.Pipeline(f.Options(), std::make_shared<zget::ingest::LocalThumbnailCache>(thumbnails),
                                            {std::make_shared<ThrowingSidecar>()});
  CountingSink      sink;
  CancellationToken token;

  auto record = pipeline->Ingest("https://www.youtube.com/watch?v=thumb", {}, sink, token);
  assert(record.id > 0);
  assert(!record.thumbnail_path.empty());
  assert(fs::path(record.thumbnail_path).parent_path() == thumbnails);
  assert(fs::exists(record.thumbnail_path));
  assert(f.store->Get(record.id).thumbnail_path == record.thumbnail_path);
}

void TestMetadataFallbacks() {
  Fixture f("pipeline_fallbacks");
  f.extractor->metadata = [](const std::string&) {
    zget::ingest::ExtractorResult r;
    r.uploader = "None";
    r.height   = 720;
    r.raw_json = "{\"big\":true}";
    return r;
  };
  auto options               = f.Options();
  options.store_raw_metadata = false;
  auto              pipeline = f.Pipeline(options);
  CountingSink      sink;
  CancellationToken token;

  const std::string url    = "https://www.c-span.org/video/?530000-1/hearing";
  auto              record = pipeline->Ingest(url, {}, sink, token);
  assert(record.platform == "c-span");
  assert(record.source_id == url);
  assert(record.title == "Untitled");
  assert(record.uploader == "C-SPAN");
  assert(record.resolution == "?x720");
  assert(!record.duration_seconds);
  assert(!record.upload_date);
  assert(record.raw_json.empty());
}

void TestDestinationOverride() {
  Fixture           f("pipeline_destination");
  auto              pipeline = f.Pipeline();
  CountingSink      sink;
  CancellationToken token;

  IngestOptions options;
  options.destination = (f.dir.Path() / "elsewhere").string();

  auto record = pipeline->Ingest("https://vimeo.com/1", options, sink, token);
  assert(record.platform == "other");
  assert(fs::path(record.local_path).parent_path() == f.dir.Path() / "elsewhere");
}

void TestConcurrentRunsForSameUrlAreSerialized() {
  Fixture f("pipeline_same_url");
  f.extractor->delay = std::chrono::milliseconds(200);
  auto pipeline      = f.Pipeline();

  const std::string url = "https://www.youtube.com/watch?v=race";
  std::atomic<int>  completed{0};
  std::atomic<int>  duplicates{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < 3; ++i) {
    threads.emplace_back([&] {
      CountingSink      sink;
      CancellationToken token;
      try {
        (void)pipeline->Ingest(url, {}, sink, token);
        ++completed;
      } catch (const DuplicateError& e) {
        assert(e.Kind() == DuplicateKind::kUrl);
        ++duplicates;
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(completed == 1);
  assert(duplicates == 2);
  assert(f.extractor->calls == 1);
  assert(f.store->Count() == 1);
}

void TestPlacedFilesAreNeverPartial() {
  Fixture f("pipeline_partial");
  f.extractor->write_in_chunks = true;
  f.extractor->content         = [](const std::string& url) { return std::string(150, 'v') + url; };
  auto pipeline                = f.Pipeline();

  const std::string url      = "https://www.youtube.com/watch?v=slow";
  const std::string expected = f.extractor->content(url);

  std::atomic<bool> done{false};
  std::atomic<int>  partial{0};
  std::atomic<int>  samples{0};
  std::thread       sampler([&] {
    while (!done) {
      std::error_code ec;
      for (fs::recursive_directory_iterator it(f.Videos(), ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec) || it->path().filename().string().front() == '.') continue;
        std::ifstream in(it->path(), std::ios::binary);
        const std::string seen((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        if (in && seen != expected) ++partial;
      }
      ++samples;
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  });

  CountingSink      sink;
  CancellationToken token;
  auto              record = pipeline->Ingest(url, {}, sink, token);
  done                     = true;
  sampler.join();

  assert(samples > 10);
  assert(partial == 0);
  assert(record.file_size_bytes == expected.size());
}

void TestDistinctUrlsRunConcurrently() {
  Fixture f("pipeline_parallel");
  f.extractor->delay = std::chrono::milliseconds(300);
  auto pipeline      = f.Pipeline();

  std::vector<std::thread> threads;
  for (int i = 0; i < 3; ++i) {
    threads.emplace_back([&, i] {
      CountingSink      sink;
      CancellationToken token;
      (void)pipeline->Ingest("https://youtu.be/p" + std::to_string(i), {}, sink, token);
    });
  }
  for (auto& t : threads) t.join();

  assert(f.extractor->max_active >= 2);
  assert(f.store->Count() == 3);
}

} // namespace

int main() {
  TestSuccessfulIngestCommitsRecordAndFile();
  TestUrlDuplicateIsRejectedBeforeDownload();
  TestContentDuplicateLeavesNoFile();
  TestHashCheckCanBeDisabled();
  TestSourceIdCollisionRemovesPlacedAndSideFiles();
  TestConcurrentSourceIdCollisionKeepsWinnerSideFiles();
  TestCancellationDuringDownloadLeavesNothing();
  TestCancelledTokenNeverDownloads();
  TestFailuresPropagateWithoutLeftovers();
  TestLocatorFallsBackToNameMatch();
  TestSideEffectFailuresDoNotFailTheRun();
  TestMetadataFallbacks();
  TestDestinationOverride();
  TestConcurrentRunsForSameUrlAreSerialized();
  TestPlacedFilesAreNeverPartial();
  TestDistinctUrlsRunConcurrently();

  std::cout << "ingest_pipeline_test: pass\n";
  return 0;
}
