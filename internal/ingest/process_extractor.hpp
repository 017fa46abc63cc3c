#pragma once

#include <optional>
#include <string>
#include <vector>

#include "internal/ingest/extractor.hpp"

namespace zget::ingest {

/*
  Extractor backed by an external downloader process (yt-dlp compatible).

  The child writes into request.work_dir only. Progress lines on stdout are
  parsed into ProgressSink events; the single JSON line printed at the end
  becomes the ExtractorResult. Cancellation terminates the child.
*/
class ProcessExtractor final : public Extractor {
 public:
  struct Options {
    std::string              command = "yt-dlp";
    std::vector<std::string> extra_args;
  };

  explicit ProcessExtractor(Options options);

  ExtractorResult Extract(const ExtractRequest& request, ProgressSink& sink, const CancellationToken& token) override;

  // argv for the child, command first.
  static std::vector<std::string> BuildArgs(const ExtractRequest& request, const Options& options);

  // yt-dlp format selector for a max quality ("best", "1080", "720p", ...).
  static std::string FormatSelector(const std::string& max_quality);

  // "[download]  42.0% of 10.00MiB at 1.00MiB/s ETA 00:06" -> Progress
  static std::optional<model::Progress> ParseProgressLine(const std::string& line);

  // Parses the downloader's info JSON. Throws ExtractionError when it is not a JSON object.
  static ExtractorResult ParseInfoJson(const std::string& json);

 private:
  Options options_;
};

} // namespace zget::ingest
