#include <charconv>
#include <chrono>
#include <csignal>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using zget::model::MediaRecord;
using zget::model::QueueItem;
using zget::model::QueueStatus;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

void PrintUsage() {
  std::cerr << "Usage: zget [--config <config.yaml>] <command> [args]\n"
               "\n"
               "Commands:\n"
               "  get <url>...            download into the library\n"
               "  search <query> [limit]  full-text search\n"
               "  stats                   library totals and download rate\n"
               "  uploaders               record counts per uploader\n"
               "  uploader <name> [limit] records from one uploader\n"
               "  show <id>               print one record\n"
               "  rm <id>                 delete a record (the file is kept)\n"
               "  tag <id> <tag>...       add tags\n"
               "  rate <id> <1-5>         set rating\n";
}

int64_t ParseId(const std::string& text) {
  int64_t    id  = 0;
  const auto end = text.data() + text.size();
  const auto res = std::from_chars(text.data(), end, id);
  if (text.empty() || res.ec != std::errc() || res.ptr != end) {
    throw zget::util::InvalidArgument("not a number: " + text);
  }
  return id;
}

void PrintRecordLine(const MediaRecord& r) {
  std::cout << r.id << "\t" << r.platform << "\t" << r.uploader << "\t" << r.title << "\n";
}

/*
  Prints one line per finished item; progress goes to the log only.
*/
class ConsoleObserver final : public zget::queue::QueueObserver {
 public:
  void OnComplete(const QueueItem& item) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << "ok\t" << item.url << "\t" << item.local_path << "\n";
  }

  void OnError(const QueueItem& item, const std::string& message) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << (item.error_kind == "duplicate" ? "skip\t" : "fail\t") << item.url << "\t" << message << "\n";
  }

  void OnCancelled(const QueueItem& item) override {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << "cancelled\t" << item.url << "\n";
  }

 private:
  std::mutex mutex_;
};

int RunGet(const zget::runtime::config::RuntimeConfig& config, const std::vector<std::string>& urls) {
  if (urls.empty()) {
    PrintUsage();
    return 1;
  }

  auto app = zget::factory::Build(config, std::make_shared<ConsoleObserver>());

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  app.queue->EnqueueBatch(urls);
  app.queue->Start();
  while (g_running && !app.queue->WaitIdle(std::chrono::milliseconds(500))) {
  }
  if (!g_running) {
    ZGET_LOG_INFO("interrupted, stopping queue");
  }
  app.queue->Stop();

  int exit_code = 0;
  for (const auto& item : app.queue->Items()) {
    const bool ok = item.status == QueueStatus::kComplete || (item.status == QueueStatus::kFailed && item.error_kind == "duplicate");
    if (!ok) exit_code = 3;
  }
  return exit_code;
}

int RunSearch(zget::library::LibraryStore& store, const std::vector<std::string>& args) {
  if (args.empty()) {
    PrintUsage();
    return 1;
  }
  const uint32_t limit = args.size() > 1 ? static_cast<uint32_t>(ParseId(args[1])) : 20;
  for (const auto& record : store.Search(args[0], limit)) {
    PrintRecordLine(record);
  }
  return 0;
}

int RunStats(zget::library::LibraryStore& store) {
  const auto stats = store.Stats();
  std::cout << "items\t" << stats.count << "\n";
  std::cout << "bytes\t" << stats.total_bytes << "\n";
  for (const auto& platform : stats.platforms) {
    std::cout << platform.platform << "\t" << platform.count << "\n";
  }
  const auto rate = store.DownloadRateStats();
  std::cout << "today\t" << rate.today_count << "\t" << rate.today_bytes << "\n";
  std::cout << "week\t" << rate.week_count << "\t" << rate.week_bytes << "\n";
  return 0;
}

int RunUploaders(zget::library::LibraryStore& store) {
  for (const auto& entry : store.Uploaders()) {
    std::cout << entry.count << "\t" << entry.platform << "\t" << entry.uploader << "\n";
  }
  return 0;
}

int RunUploader(zget::library::LibraryStore& store, const std::vector<std::string>& args) {
  if (args.empty()) {
    PrintUsage();
    return 1;
  }
  const uint32_t limit = args.size() > 1 ? static_cast<uint32_t>(ParseId(args[1])) : 100;
  for (const auto& record : store.ListByUploader(args[0], limit)) {
    PrintRecordLine(record);
  }
  return 0;
}

int RunShow(zget::library::LibraryStore& store, int64_t id) {
  const auto r = store.Get(id);
  std::cout << "id\t" << r.id << "\n"
            << "url\t" << r.source_url << "\n"
            << "platform\t" << r.platform << "\n"
            << "source_id\t" << r.source_id << "\n"
            << "title\t" << r.title << "\n"
            << "uploader\t" << r.uploader << "\n";
  if (r.upload_date) std::cout << "upload_date\t" << zget::util::FormatIso8601(*r.upload_date) << "\n";
  if (r.duration_seconds) std::cout << "duration\t" << *r.duration_seconds << "\n";
  std::cout << "resolution\t" << r.resolution << "\n"
            << "size\t" << r.file_size_bytes << "\n"
            << "sha256\t" << r.content_hash << "\n"
            << "path\t" << r.local_path << "\n"
            << "ingested_at\t" << zget::util::FormatIso8601(r.ingested_at) << "\n";
  std::cout << "tags\t";
  for (std::size_t i = 0; i < r.tags.size(); ++i) std::cout << (i ? "," : "") << r.tags[i];
  std::cout << "\n";
  if (r.rating) std::cout << "rating\t" << *r.rating << "\n";
  if (!r.collection.empty()) std::cout << "collection\t" << r.collection << "\n";
  return 0;
}

int Dispatch(const zget::runtime::config::RuntimeConfig& config, const std::string& command, const std::vector<std::string>& args) {
  if (command == "get") {
    return RunGet(config, args);
  }

  auto store = zget::factory::BuildLibraryStore(config);
  if (command == "search") return RunSearch(*store, args);
  if (command == "stats") return RunStats(*store);
  if (command == "uploaders") return RunUploaders(*store);
  if (command == "uploader") return RunUploader(*store, args);

  if (args.empty()) {
    PrintUsage();
    return 1;
  }
  const auto id = ParseId(args[0]);

  if (command == "show") return RunShow(*store, id);
  if (command == "rm") {
    if (!store->Delete(id)) {
      std::cerr << "no record " << id << "\n";
      return 4;
    }
    return 0;
  }
  if (command == "tag") {
    auto record = store->Get(id);
    record.tags.insert(record.tags.end(), args.begin() + 1, args.end());
    store->Update(record);
    return 0;
  }
  if (command == "rate" && args.size() == 2) {
    auto record   = store->Get(id);
    record.rating = static_cast<int>(ParseId(args[1]));
    store->Update(record);
    return 0;
  }

  PrintUsage();
  return 1;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  std::string              config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }
  if (args.empty()) {
    PrintUsage();
    return 1;
  }
  const auto command = args.front();
  args.erase(args.begin());

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? zget::config::ConfigLoader::Defaults() : zget::config::ConfigLoader::LoadFromYaml(config_path);

    zget::observability::InitializeTracing(config);
    zget::observability::InitializeMetrics(config);
    zget::observability::InitializeLogging(config);

    const int rc = Dispatch(config, command, args);

    zget::observability::ShutdownLogging();
    zget::observability::ShutdownMetrics();
    zget::observability::ShutdownTracing();
    return rc;
  } catch (const zget::util::NotFound& e) {
    std::cerr << e.what() << "\n";
    return 4;
  } catch (const zget::util::InvalidArgument& e) {
    std::cerr << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    ZGET_LOG_ERROR("Fatal error", {zget::observability::StringField("error", e.what())});
    zget::observability::ShutdownLogging();
    zget::observability::ShutdownMetrics();
    zget::observability::ShutdownTracing();
    return 2;
  }
}
