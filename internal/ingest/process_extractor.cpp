#include "process_extractor.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstring>
#include <regex>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace zget::ingest {

using observability::StringField;

namespace {

constexpr int         kPollIntervalMs  = 200;
constexpr std::size_t kStderrTailBytes = 4096;
constexpr auto        kTerminateGrace  = std::chrono::seconds(2);
constexpr const char* kOutputTemplate  = "%(upload_date)s_%(uploader)s_%(title)s.%(ext)s";

// Keys that are large or internal to the downloader; dropped from raw_json.
constexpr std::array<const char*, 7> kExcludedKeys = {
    "formats", "thumbnails", "subtitles", "automatic_captions", "requested_downloads", "requested_formats", "http_headers"};

class FileDescriptor {
 public:
  FileDescriptor() = default;
  ~FileDescriptor() {
    Reset();
  }

  FileDescriptor(const FileDescriptor&)            = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;

  int Get() const {
    return fd_;
  }

  void Reset(int fd = -1) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = fd;
  }

 private:
  int fd_ = -1;
};

struct Pipe {
  FileDescriptor read;
  FileDescriptor write;
};

void OpenPipe(Pipe& p) {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    throw util::ExtractionError(std::string("pipe: ") + std::strerror(errno));
  }
  p.read.Reset(fds[0]);
  p.write.Reset(fds[1]);
}

/*
  Owns a running child. If the parent unwinds while the child is alive the
  child is killed and reaped.
*/
class ChildProcess {
 public:
  explicit ChildProcess(pid_t pid) : pid_(pid) {
  }
  ~ChildProcess() {
    if (pid_ > 0) {
      ::kill(pid_, SIGKILL);
      int status = 0;
      ::waitpid(pid_, &status, 0);
    }
  }

  ChildProcess(const ChildProcess&)            = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  // SIGTERM, then SIGKILL after the grace period.
  void Terminate() {
    if (pid_ <= 0) return;
    ::kill(pid_, SIGTERM);
    const auto deadline = std::chrono::steady_clock::now() + kTerminateGrace;
    while (std::chrono::steady_clock::now() < deadline) {
      int status = 0;
      if (::waitpid(pid_, &status, WNOHANG) == pid_) {
        pid_ = -1;
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    ::kill(pid_, SIGKILL);
    int status = 0;
    ::waitpid(pid_, &status, 0);
    pid_ = -1;
  }

  int Wait() {
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0) {
      if (errno != EINTR) {
        throw util::ExtractionError(std::string("waitpid: ") + std::strerror(errno));
      }
    }
    pid_ = -1;
    return status;
  }

 private:
  pid_t pid_;
};

double UnitMultiplier(const std::string& unit) {
  static const std::array<std::pair<const char*, double>, 9> kUnits = {{{"B", 1.0},
                                                                        {"KiB", 1024.0},
                                                                        {"MiB", 1024.0 * 1024},
                                                                        {"GiB", 1024.0 * 1024 * 1024},
                                                                        {"TiB", 1024.0 * 1024 * 1024 * 1024},
                                                                        {"KB", 1e3},
                                                                        {"MB", 1e6},
                                                                        {"GB", 1e9},
                                                                        {"TB", 1e12}}};
  for (const auto& [name, multiplier] : kUnits) {
    if (unit == name) return multiplier;
  }
  return 1.0;
}

int64_t ParseClock(const std::string& text) {
  int64_t     seconds = 0;
  std::size_t start   = 0;
  while (start <= text.size()) {
    const auto end = text.find(':', start);
    seconds        = seconds * 60 + std::stoll(text.substr(start, end - start));
    if (end == std::string::npos) break;
    start = end + 1;
  }
  return seconds;
}

const google::protobuf::Value* Field(const google::protobuf::Struct& object, const char* key) {
  auto it = object.fields().find(key);
  if (it == object.fields().end() || it->second.has_null_value()) {
    return nullptr;
  }
  return &it->second;
}

std::string StringOf(const google::protobuf::Struct& object, const char* key) {
  const auto* value = Field(object, key);
  if (!value) return {};
  if (value->has_string_value()) return value->string_value();
  if (value->has_number_value()) {
    const double n = value->number_value();
    return n == std::floor(n) ? std::to_string(static_cast<int64_t>(n)) : std::to_string(n);
  }
  return {};
}

std::optional<double> NumberOf(const google::protobuf::Struct& object, const char* key) {
  const auto* value = Field(object, key);
  if (!value || !value->has_number_value()) return std::nullopt;
  return value->number_value();
}

std::optional<int64_t> IntOf(const google::protobuf::Struct& object, const char* key) {
  auto number = NumberOf(object, key);
  if (!number) return std::nullopt;
  return static_cast<int64_t>(*number);
}

} // namespace

ProcessExtractor::ProcessExtractor(Options options) : options_(std::move(options)) {
  if (options_.command.empty()) {
    throw util::InvalidArgument("extractor command must not be empty");
  }
}

std::string ProcessExtractor::FormatSelector(const std::string& max_quality) {
  if (max_quality.empty() || max_quality == "best") {
    return "bv*[ext=mp4][vcodec^=avc]+ba[ext=m4a]/bv*[ext=mp4]+ba[ext=m4a]/b";
  }
  std::string height = max_quality;
  if (!height.empty() && (height.back() == 'p' || height.back() == 'P')) {
    height.pop_back();
  }
  return "bv*[height<=" + height + "][ext=mp4][vcodec^=avc]+ba[ext=m4a]" + "/bv*[height<=" + height + "][ext=mp4]+ba[ext=m4a]" +
         "/bv*[height<=" + height + "]+ba" + "/b[height<=" + height + "]" + "/b";
}

std::vector<std::string> ProcessExtractor::BuildArgs(const ExtractRequest& request, const Options& options) {
  std::vector<std::string> args = {options.command,
                                   "--newline",
                                   "--progress",
                                   "--print-json",
                                   "--no-playlist",
                                   "--windows-filenames",
                                   "--write-thumbnail",
                                   "--merge-output-format",
                                   "mp4",
                                   "-o",
                                   (request.work_dir / kOutputTemplate).string(),
                                   "-f",
                                   request.format_id.empty() ? FormatSelector(request.max_quality) : request.format_id};
  args.insert(args.end(), options.extra_args.begin(), options.extra_args.end());
  // end of options: a URL starting with '-' is never read as a flag
  args.push_back("--");
  args.push_back(request.url);
  return args;
}

std::optional<model::Progress> ProcessExtractor::ParseProgressLine(const std::string& line) {
  static const std::regex kProgress(
      R"(^\[download\]\s+(\d+(?:\.\d+)?)%\s+of\s+~?\s*(\d+(?:\.\d+)?)([KMGT]?i?B)(?:\s+at\s+(\d+(?:\.\d+)?)([KMGT]?i?B)/s)?(?:\s+ETA\s+(\d+(?::\d+)*))?)");

  std::smatch match;
  if (!std::regex_search(line, match, kProgress)) {
    return std::nullopt;
  }

  model::Progress progress;
  progress.percent          = std::stod(match[1].str());
  const double total        = std::stod(match[2].str()) * UnitMultiplier(match[3].str());
  progress.total_bytes      = static_cast<uint64_t>(total);
  progress.downloaded_bytes = static_cast<uint64_t>(total * progress.percent / 100.0);
  if (match[4].matched) {
    progress.rate_bytes_per_sec = std::stod(match[4].str()) * UnitMultiplier(match[5].str());
  }
  if (match[6].matched) {
    progress.eta_seconds = ParseClock(match[6].str());
  }
  return progress;
}

ExtractorResult ProcessExtractor::ParseInfoJson(const std::string& json) {
  google::protobuf::Struct info;
  if (!google::protobuf::util::JsonStringToMessage(json, &info).ok()) {
    throw util::ExtractionError("downloader printed invalid metadata JSON");
  }

  ExtractorResult result;
  result.source_id     = StringOf(info, "id");
  result.title         = StringOf(info, "title");
  result.description   = StringOf(info, "description");
  result.uploader      = StringOf(info, "uploader");
  result.uploader_id   = StringOf(info, "uploader_id");
  result.upload_date   = StringOf(info, "upload_date");
  result.duration      = NumberOf(info, "duration");
  result.width         = IntOf(info, "width");
  result.height        = IntOf(info, "height");
  result.fps           = NumberOf(info, "fps");
  result.vcodec        = StringOf(info, "vcodec");
  result.view_count    = IntOf(info, "view_count");
  result.like_count    = IntOf(info, "like_count");
  result.comment_count = IntOf(info, "comment_count");
  result.thumbnail_url = StringOf(info, "thumbnail");

  result.filepath = StringOf(info, "filepath");
  if (result.filepath.empty()) {
    result.filepath = StringOf(info, "_filename");
  }
  if (const auto* downloads = Field(info, "requested_downloads"); downloads && downloads->has_list_value()) {
    for (const auto& entry : downloads->list_value().values()) {
      if (!entry.has_struct_value()) continue;
      for (const char* key : {"filepath", "filename"}) {
        auto path = StringOf(entry.struct_value(), key);
        if (!path.empty()) result.produced_files.push_back(std::move(path));
      }
    }
  }

  if (const auto* thumbnails = Field(info, "thumbnails"); thumbnails && thumbnails->has_list_value()) {
    for (const auto& entry : thumbnails->list_value().values()) {
      if (!entry.has_struct_value()) continue;
      auto path = StringOf(entry.struct_value(), "filepath");
      if (!path.empty()) result.thumbnail_file = std::move(path);
    }
  }

  auto* fields = info.mutable_fields();
  for (const char* key : kExcludedKeys) {
    fields->erase(key);
  }
  for (auto it = fields->begin(); it != fields->end();) {
    if (!it->first.empty() && it->first.front() == '_') {
      it = fields->erase(it);
    } else {
      ++it;
    }
  }
  if (!google::protobuf::util::MessageToJsonString(info, &result.raw_json).ok()) {
    result.raw_json.clear();
  }
  return result;
}

ExtractorResult ProcessExtractor::Extract(const ExtractRequest& request, ProgressSink& sink, const CancellationToken& token) {
  const auto args = BuildArgs(request, options_);

  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (const auto& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  Pipe out;
  Pipe err;
  OpenPipe(out);
  OpenPipe(err);

  const pid_t pid = ::fork();
  if (pid < 0) {
    throw util::ExtractionError(std::string("fork: ") + std::strerror(errno));
  }
  if (pid == 0) {
    // child: only async-signal-safe calls until exec
    ::dup2(out.write.Get(), STDOUT_FILENO);
    ::dup2(err.write.Get(), STDERR_FILENO);
    ::execvp(argv[0], argv.data());
    ::_exit(127);
  }

  ChildProcess child(pid);
  out.write.Reset();
  err.write.Reset();

  ZGET_LOG_DEBUG("extractor started", {StringField("url", request.url), StringField("command", options_.command)});

  std::string stdout_buffer;
  std::string stderr_tail;
  std::string info_json;
  bool        out_open = true;
  bool        err_open = true;

  const auto handle_line = [&](const std::string& line) {
    if (!line.empty() && line.front() == '{') {
      info_json = line;
    } else if (auto progress = ParseProgressLine(line)) {
      sink.OnProgress(*progress);
    }
  };

  char buffer[8192];
  while (out_open || err_open) {
    if (token.IsCancelled()) {
      child.Terminate();
      throw util::CancelledError("cancelled during download");
    }

    pollfd fds[2] = {{out_open ? out.read.Get() : -1, POLLIN, 0}, {err_open ? err.read.Get() : -1, POLLIN, 0}};
    const int ready = ::poll(fds, 2, kPollIntervalMs);
    if (ready < 0) {
      if (errno == EINTR) continue;
      throw util::ExtractionError(std::string("poll: ") + std::strerror(errno));
    }
    if (ready == 0) continue;

    if (out_open && (fds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
      const ssize_t n = ::read(out.read.Get(), buffer, sizeof(buffer));
      if (n <= 0) {
        out_open = false;
      } else {
        stdout_buffer.append(buffer, static_cast<std::size_t>(n));
        std::size_t newline;
        while ((newline = stdout_buffer.find('\n')) != std::string::npos) {
          handle_line(stdout_buffer.substr(0, newline));
          stdout_buffer.erase(0, newline + 1);
        }
      }
    }
    if (err_open && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) {
      const ssize_t n = ::read(err.read.Get(), buffer, sizeof(buffer));
      if (n <= 0) {
        err_open = false;
      } else {
        stderr_tail.append(buffer, static_cast<std::size_t>(n));
        if (stderr_tail.size() > kStderrTailBytes) {
          stderr_tail.erase(0, stderr_tail.size() - kStderrTailBytes);
        }
      }
    }
  }
  if (!stdout_buffer.empty()) {
    handle_line(stdout_buffer);
  }

  const int status = child.Wait();
  token.ThrowIfCancelled("download");

  while (!stderr_tail.empty() && (stderr_tail.back() == '\n' || stderr_tail.back() == '\r')) {
    stderr_tail.pop_back();
  }
  if (WIFEXITED(status) && WEXITSTATUS(status) == 127 && info_json.empty()) {
    throw util::ExtractionError("cannot run " + options_.command);
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    const auto code = WIFEXITED(status) ? "exit status " + std::to_string(WEXITSTATUS(status)) : "signal " + std::to_string(WTERMSIG(status));
    throw util::ExtractionError(options_.command + " failed (" + code + ")" + (stderr_tail.empty() ? "" : ": " + stderr_tail));
  }
  if (info_json.empty()) {
    throw util::ExtractionError(options_.command + " printed no metadata");
  }
  return ParseInfoJson(info_json);
}

} // namespace zget::ingest
