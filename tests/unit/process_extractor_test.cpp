#include "internal/ingest/process_extractor.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"
#include "support/fake_extractor.hpp"

namespace fs = std::filesystem;

using zget::ingest::CancellationToken;
using zget::ingest::ExtractRequest;
using zget::ingest::ProcessExtractor;

namespace {

class RecordingSink final : public zget::ingest::ProgressSink {
 public:
  void OnProgress(const zget::model::Progress& progress) override {
    events.push_back(progress);
  }

  std::vector<zget::model::Progress> events;
};

fs::path WriteScript(const fs::path& dir, const std::string& name, const std::string& body) {
  const auto path = dir / name;
  {
    std::ofstream out(path);
    out << "#!/bin/sh\n" << body;
  }
  fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace);
  return path;
}

// Finds the directory of the -o template among the arguments.
constexpr const char* kFindWorkDir = R"(out=""
while [ $# -gt 0 ]; do
  if [ "$1" = "-o" ]; then out="$2"; fi
  shift
done
dir=$(dirname "$out")
)";

void TestParseProgressLine() {
  auto progress = ProcessExtractor::ParseProgressLine("[download]  50.0% of 4.00KiB at 1.00KiB/s ETA 00:02");
  assert(progress);
  assert(progress->percent == 50.0);
  assert(progress->total_bytes && *progress->total_bytes == 4096);
  assert(progress->downloaded_bytes == 2048);
  assert(progress->rate_bytes_per_sec == 1024.0);
  assert(progress->eta_seconds && *progress->eta_seconds == 2);

  auto estimated = ProcessExtractor::ParseProgressLine("[download]  10.0% of ~ 2.00MB at 500.00KB/s ETA 1:02:03");
  assert(estimated);
  assert(*estimated->total_bytes == 2000000);
  assert(estimated->rate_bytes_per_sec == 500000.0);
  assert(*estimated->eta_seconds == 3723);

  auto finished = ProcessExtractor::ParseProgressLine("[download] 100% of 10.00MiB");
  assert(finished);
  assert(finished->percent == 100.0);
  assert(!finished->eta_seconds);

  assert(!ProcessExtractor::ParseProgressLine("[youtube] dQw4w9WgXcQ: Downloading webpage"));
  assert(!ProcessExtractor::ParseProgressLine("[download] Destination: /tmp/x.mp4"));

  // lone dots are not numbers
  assert(!ProcessExtractor::ParseProgressLine("[download] .% of 4.00KiB"));
  assert(!ProcessExtractor::ParseProgressLine("[download] 50% of .MiB"));
  auto no_rate = ProcessExtractor::ParseProgressLine("[download]  5.0% of 1.00KiB at .KiB/s");
  assert(no_rate && no_rate->rate_bytes_per_sec == 0.0);
}

void TestParseInfoJson() {
  const std::string json = R"({
    "id": "dQw4w9WgXcQ",
    "title": "Never Gonna",
    "uploader": "Rick",
    "upload_date": "20091025",
    "duration": 212.9,
    "width": 1920,
    "height": 1080,
    "fps": 25,
    "vcodec": "avc1.640028",
    "view_count": 1500000000,
    "like_count": null,
    "thumbnail": "https://i.ytimg.com/vi/x/maxresdefault.jpg",
    "thumbnails": [{"url": "a"}, {"url": "b", "filepath": "/w/clip.webp"}],
    "requested_downloads": [{"filepath": "/w/clip.mp4"}],
    "formats": [{"format_id": "137"}],
    "http_headers": {"User-Agent": "x"},
    "_filename": "/w/clip.f137.mp4",
    "_type": "video",
    "tags": ["music"]
  })";

  auto result = ProcessExtractor::ParseInfoJson(json);
  assert(result.source_id == "dQw4w9WgXcQ");
  assert(result.title == "Never Gonna");
  assert(result.uploader == "Rick");
  assert(result.upload_date == "20091025");
  assert(result.duration && *result.duration == 212.9);
  assert(result.width && *result.width == 1920);
  assert(result.fps && *result.fps == 25.0);
  assert(result.view_count && *result.view_count == 1500000000);
  assert(!result.like_count);
  assert(!result.comment_count);
  assert(result.thumbnail_url == "https://i.ytimg.com/vi/x/maxresdefault.jpg");
  assert(result.thumbnail_file == "/w/clip.webp");
  assert(result.filepath == "/w/clip.f137.mp4");
  assert(result.produced_files.size() == 1 && result.produced_files[0] == "/w/clip.mp4");

  // large and internal keys are dropped from the stored metadata
  assert(result.raw_json.find("dQw4w9WgXcQ") != std::string::npos);
  assert(result.raw_json.find("\"tags\"") != std::string::npos);
  assert(result.raw_json.find("formats") == std::string::npos);
  assert(result.raw_json.find("thumbnails") == std::string::npos);
  assert(result.raw_json.find("requested_downloads") == std::string::npos);
  assert(result.raw_json.find("http_headers") == std::string::npos);
  assert(result.raw_json.find("_filename") == std::string::npos);
  assert(result.raw_json.find("_type") == std::string::npos);

  bool threw = false;
  try {
    (void)ProcessExtractor::ParseInfoJson("{not json");
  } catch (const zget::util::ExtractionError&) {
    threw = true;
  }
  assert(threw);
}

void TestFormatSelector() {
  const auto best = ProcessExtractor::FormatSelector("best");
  assert(best == "bv*[ext=mp4][vcodec^=avc]+ba[ext=m4a]/bv*[ext=mp4]+ba[ext=m4a]/b");
  assert(ProcessExtractor::FormatSelector("") == best);

  const auto capped = ProcessExtractor::FormatSelector("720p");
  assert(capped == ProcessExtractor::FormatSelector("720"));
  assert(capped.find("[height<=720]") != std::string::npos);
  assert(capped.size() >= 2 && capped.substr(capped.size() - 2) == "/b");
}

void TestBuildArgs() {
  ExtractRequest request;
  request.url         = "-not-a-flag";
  request.work_dir    = "/tmp/work";
  request.max_quality = "best";

  ProcessExtractor::Options options;
  options.command    = "yt-dlp";
  options.extra_args = {"--retries", "3"};

  const auto args = ProcessExtractor::BuildArgs(request, options);
  assert(args.front() == "yt-dlp");
  assert(args.back() == "-not-a-flag");
  assert(args[args.size() - 2] == "--");
  assert(args[args.size() - 4] == "--retries");

  bool saw_template = false;
  bool saw_format   = false;
  for (std::size_t i = 0; i + 1 < args.size(); ++i) {
    if (args[i] == "-o") saw_template = args[i + 1] == "/tmp/work/%(upload_date)s_%(uploader)s_%(title)s.%(ext)s";
    if (args[i] == "-f") saw_format = args[i + 1] == ProcessExtractor::FormatSelector("best");
  }
  assert(saw_template);
  assert(saw_format);

  // an explicit format id replaces the quality selector
  request.format_id = "137+140";
  const auto explicit_args = ProcessExtractor::BuildArgs(request, options);
  bool       saw_explicit  = false;
  for (std::size_t i = 0; i + 1 < explicit_args.size(); ++i) {
    if (explicit_args[i] == "-f") saw_explicit = explicit_args[i + 1] == "137+140";
  }
  assert(saw_explicit);
}

void TestEmptyCommandRejected() {
  bool threw = false;
  try {
    ProcessExtractor extractor(ProcessExtractor::Options{"", {}});
  } catch (const zget::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestRunsScriptedDownloader() {
  zget::testing::TestDir dir("process_ok");
  const auto             work = dir.Path() / "work";
  fs::create_directories(work);

  const auto script = WriteScript(dir.Path(), "fake-dl", std::string(kFindWorkDir) + R"(printf 'data' > "$dir/20240115_Someone_Fake.mp4"
echo "[download] Destination: $dir/20240115_Someone_Fake.mp4"
echo "[download]  50.0% of 4.00KiB at 1.00KiB/s ETA 00:02"
echo "[download] 100% of 4.00KiB"
echo "some warning" >&2
echo "{\"id\": \"abc\", \"title\": \"Fake\", \"filepath\": \"$dir/20240115_Someone_Fake.mp4\"}"
)");

  ProcessExtractor  extractor(ProcessExtractor::Options{script.string(), {}});
  RecordingSink     sink;
  CancellationToken token;

  ExtractRequest request{"https://example.com/v/1", work, "", "best"};
  auto           result = extractor.Extract(request, sink, token);

  assert(result.source_id == "abc");
  assert(result.title == "Fake");
  assert(fs::path(result.filepath) == work / "20240115_Someone_Fake.mp4");
  assert(fs::exists(result.filepath));
  assert(sink.events.size() == 2);
  assert(sink.events[1].percent == 100.0);
}

void TestFailureCarriesExitStatusAndStderr() {
  zget::testing::TestDir dir("process_fail");
  const auto             script = WriteScript(dir.Path(), "fake-dl", "echo 'ERROR: Video unavailable' >&2\nexit 3\n");

  ProcessExtractor  extractor(ProcessExtractor::Options{script.string(), {}});
  RecordingSink     sink;
  CancellationToken token;

  std::string message;
  try {
    (void)extractor.Extract(ExtractRequest{"https://example.com/v/2", dir.Path(), "", "best"}, sink, token);
  } catch (const zget::util::ExtractionError& e) {
    message = e.what();
  }
  assert(message.find("exit status 3") != std::string::npos);
  assert(message.find("Video unavailable") != std::string::npos);
}

void TestMissingMetadataIsAnError() {
  zget::testing::TestDir dir("process_silent");
  const auto             script = WriteScript(dir.Path(), "fake-dl", "exit 0\n");

  ProcessExtractor  extractor(ProcessExtractor::Options{script.string(), {}});
  RecordingSink     sink;
  CancellationToken token;

  std::string message;
  try {
    (void)extractor.Extract(ExtractRequest{"https://example.com/v/3", dir.Path(), "", "best"}, sink, token);
  } catch (const zget::util::ExtractionError& e) {
    message = e.what();
  }
  assert(message.find("printed no metadata") != std::string::npos);
}

void TestMissingCommand() {
  ProcessExtractor  extractor(ProcessExtractor::Options{"/nonexistent/zget-downloader", {}});
  RecordingSink     sink;
  CancellationToken token;

  std::string message;
  try {
    (void)extractor.Extract(ExtractRequest{"https://example.com/v/4", fs::temp_directory_path(), "", "best"}, sink, token);
  } catch (const zget::util::ExtractionError& e) {
    message = e.what();
  }
  assert(message.find("cannot run") != std::string::npos);
}

void TestCancellationTerminatesChild() {
  zget::testing::TestDir dir("process_cancel");
  const auto             script = WriteScript(dir.Path(), "fake-dl", "echo started\nexec sleep 30\n");

  ProcessExtractor  extractor(ProcessExtractor::Options{script.string(), {}});
  RecordingSink     sink;
  CancellationToken token;

  std::thread canceller([&token] {
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    token.Cancel();
  });

  const auto start     = std::chrono::steady_clock::now();
  bool       cancelled = false;
  try {
    (void)extractor.Extract(ExtractRequest{"https://example.com/v/5", dir.Path(), "", "best"}, sink, token);
  } catch (const zget::util::CancelledError&) {
    cancelled = true;
  }
  canceller.join();

  assert(cancelled);
  assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(10));
}

} // namespace

int main() {
  TestParseProgressLine();
  TestParseInfoJson();
  TestFormatSelector();
  TestBuildArgs();
  TestEmptyCommandRejected();
  TestRunsScriptedDownloader();
  TestFailureCarriesExitStatusAndStderr();
  TestMissingMetadataIsAnError();
  TestMissingCommand();
  TestCancellationTerminatesChild();

  std::cout << "process_extractor_test: pass\n";
  return 0;
}
