#include "internal/library/library_store.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "support/fake_extractor.hpp"

using zget::library::LibraryStore;
using zget::model::MediaRecord;
using zget::util::DuplicateError;
using zget::util::DuplicateKind;

namespace {

zget::runtime::config::RuntimeConfig ConfigFor(const zget::testing::TestDir& dir) {
  zget::runtime::config::RuntimeConfig config;
  config.mutable_library()->set_home(dir.Path().string());
  zget::config::ConfigLoader::ApplyDefaults(config);
  return config;
}

MediaRecord MakeRecord(int n, const std::string& platform = "youtube") {
  MediaRecord record;
  record.source_url      = "https://example.com/" + platform + "/" + std::to_string(n);
  record.platform        = platform;
  record.source_id       = "src" + std::to_string(n);
  record.title           = "Example clip " + std::to_string(n);
  record.uploader        = "uploader";
  record.resolution      = "1920x1080";
  record.file_size_bytes = 1000 + static_cast<uint64_t>(n);
  record.content_hash    = "sha256-" + std::to_string(n);
  record.local_path      = "/library/videos/" + platform + "/clip" + std::to_string(n) + ".mp4";
  record.ingested_at     = zget::util::Now() + std::chrono::seconds(n);
  return record;
}

void TestInsertAndGetRoundTrip() {
  zget::testing::TestDir dir("store_roundtrip");
  auto                   store = zget::factory::BuildLibraryStore(ConfigFor(dir));

  auto record             = MakeRecord(1);
  record.description      = "A longer description";
  record.uploader_id      = "UC123";
  record.upload_date      = zget::util::ParseUploadDate("20240115");
  record.duration_seconds = 212;
  record.view_count       = 1500000000;
  record.like_count       = 0;
  record.fps              = 29.97;
  record.codec            = "avc1.640028";
  record.thumbnail_path   = "/library/thumbnails/youtube_src1.jpg";
  record.tags             = {"music", "live \"set\""};
  record.collection       = "favourites";
  record.raw_json         = "{\"id\":\"src1\"}";

  const auto id = store->Insert(record);
  assert(id > 0);

  auto stored = store->Get(id);
  assert(stored.id == id);
  assert(stored.source_url == record.source_url);
  assert(stored.platform == "youtube");
  assert(stored.source_id == "src1");
  assert(stored.title == record.title);
  assert(stored.description == record.description);
  assert(stored.uploader_id == "UC123");
  assert(stored.upload_date && *stored.upload_date == *record.upload_date);
  assert(stored.duration_seconds == record.duration_seconds);
  assert(stored.view_count == record.view_count);
  assert(stored.like_count && *stored.like_count == 0);
  assert(!stored.comment_count);
  assert(stored.fps && *stored.fps == 29.97);
  assert(stored.codec == record.codec);
  assert(stored.file_size_bytes == record.file_size_bytes);
  assert(stored.content_hash == record.content_hash);
  assert(stored.local_path == record.local_path);
  assert(stored.thumbnail_path == record.thumbnail_path);
  assert(zget::util::FormatIso8601(stored.ingested_at) == zget::util::FormatIso8601(record.ingested_at));
  assert(stored.tags == record.tags);
  assert(!stored.rating);
  assert(stored.collection == "favourites");
  assert(stored.raw_json == record.raw_json);

  assert(store->ExistsByUrl(record.source_url));
  assert(!store->ExistsByUrl("https://example.com/none"));
  assert(store->ExistsByHash(record.content_hash));
  assert(store->FindByUrl(record.source_url)->id == id);
  assert(store->FindByHash(record.content_hash)->id == id);
  assert(!store->FindByHash(std::string(64, 'f')));

  bool not_found = false;
  try {
    (void)store->Get(id + 100);
  } catch (const zget::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
}

void TestUniquenessIsClassified() {
  zget::testing::TestDir dir("store_unique");
  auto                   store = zget::factory::BuildLibraryStore(ConfigFor(dir));

  const auto original = MakeRecord(1);
  const auto id       = store->Insert(original);

  const auto expect_duplicate = [&](MediaRecord candidate, DuplicateKind kind) {
    bool matched = false;
    try {
      (void)store->Insert(std::move(candidate));
    } catch (const DuplicateError& e) {
      matched = e.Kind() == kind && e.ExistingId() == id;
    }
    assert(matched);
  };

  auto same_url         = MakeRecord(2);
  same_url.source_url   = original.source_url;
  expect_duplicate(same_url, DuplicateKind::kUrl);

  auto same_hash         = MakeRecord(3);
  same_hash.content_hash = original.content_hash;
  expect_duplicate(same_hash, DuplicateKind::kContentHash);

  auto same_source      = MakeRecord(4);
  same_source.source_id = original.source_id;
  expect_duplicate(same_source, DuplicateKind::kSourceId);

  // the same source id on another platform is a different item
  auto other_platform      = MakeRecord(5, "tiktok");
  other_platform.source_id = original.source_id;
  assert(store->Insert(other_platform) > id);

  // rows without a hash never collide on it
  auto no_hash_a         = MakeRecord(6);
  auto no_hash_b         = MakeRecord(7);
  no_hash_a.content_hash = "";
  no_hash_b.content_hash = "";
  store->Insert(no_hash_a);
  store->Insert(no_hash_b);

  assert(store->Count() == 4);
}

void TestSearchFollowsUpdatesAndDeletes() {
  zget::testing::TestDir dir("store_search");
  auto                   store = zget::factory::BuildLibraryStore(ConfigFor(dir));

  const auto first  = store->Insert(MakeRecord(1));
  const auto second = store->Insert(MakeRecord(2));
  auto       other  = MakeRecord(3);
  other.title       = "Completely unrelated";
  other.description = "Nothing to see";
  const auto third  = store->Insert(other);

  // prefix match
  auto results = store->Search("exam");
  assert(results.size() == 2);
  assert(store->Search("zzz").empty());

  // equal relevance: most recently ingested first
  assert(results[0].id == second);
  assert(results[1].id == first);

  assert(store->Search("exam", 1).size() == 1);
  assert(store->Search("exam", 0).empty());
  assert(store->Search("").empty());
  assert(store->Search("   ").empty());

  // user fields are indexed and follow updates
  auto updated  = store->Get(third);
  updated.notes = "watch with popcorn";
  updated.tags  = {"documentary"};
  store->Update(updated);
  assert(store->Search("popcorn").size() == 1);
  assert(store->Search("documentary").size() == 1);

  updated.notes = "rewatch later";
  store->Update(updated);
  assert(store->Search("popcorn").empty());
  assert(store->Search("rewatch")[0].id == third);

  assert(store->Delete(first));
  assert(!store->Delete(first));
  results = store->Search("exam");
  assert(results.size() == 1);
  assert(results[0].id == second);
}

void TestSearchByTitlePrefix() {
  zget::testing::TestDir dir("store_search_prefix");
  auto                   store = zget::factory::BuildLibraryStore(ConfigFor(dir));

  auto record       = MakeRecord(1);
  record.source_url = "https://example.com/v1";
  record.title      = "An Example upload";
  store->Insert(record);

  assert(store->Search("exam").size() == 1);
  assert(store->Search("EXAM").size() == 1);
  assert(store->Search("zzz").empty());
}

void TestSearchTreatsInputAsText() {
  zget::testing::TestDir dir("store_search_escape");
  auto                   store = zget::factory::BuildLibraryStore(ConfigFor(dir));

  auto quoted  = MakeRecord(1);
  quoted.title = "It's \"Quoted\" title";
  store->Insert(quoted);

  assert(LibraryStore::BuildFtsQuery("it's \"x\"") == "\"it's \"\"x\"\"\"*");

  assert(store->Search("it's \"quoted").size() == 1);
  // query syntax is not interpreted
  assert(store->Search("title OR nothing").empty());
  assert(store->Search("NEAR(title").empty());
  assert(store->Search("title:x").empty());
  assert(store->Search("quo").size() == 1);
}

void TestUpdateValidation() {
  zget::testing::TestDir dir("store_update");
  auto                   store = zget::factory::BuildLibraryStore(ConfigFor(dir));

  auto record   = MakeRecord(1);
  record.id     = store->Insert(record);
  record.rating = 4;
  store->Update(record);
  assert(store->Get(record.id).rating == 4);

  record.rating = 6;
  bool invalid  = false;
  try {
    store->Update(record);
  } catch (const zget::util::InvalidArgument&) {
    invalid = true;
  }
  assert(invalid);
  assert(store->Get(record.id).rating == 4);

  auto missing   = MakeRecord(2);
  missing.id     = record.id + 50;
  bool not_found = false;
  try {
    store->Update(missing);
  } catch (const zget::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
}

void TestListingsAndStats() {
  zget::testing::TestDir dir("store_stats");
  auto                   store = zget::factory::BuildLibraryStore(ConfigFor(dir));

  auto empty = store->Stats();
  assert(empty.count == 0);
  assert(empty.total_bytes == 0);
  assert(empty.platforms.empty());

  uint64_t total = 0;
  for (int i = 0; i < 3; ++i) {
    auto record = MakeRecord(i, "youtube");
    total += record.file_size_bytes;
    store->Insert(record);
  }
  auto clip       = MakeRecord(10, "tiktok");
  clip.collection = "shorts";
  total += clip.file_size_bytes;
  store->Insert(clip);

  auto stats = store->Stats();
  assert(stats.count == 4);
  assert(stats.total_bytes == total);
  assert(stats.platforms.size() == 2);
  assert(stats.platforms[0].platform == "youtube" && stats.platforms[0].count == 3);
  assert(stats.platforms[1].platform == "tiktok" && stats.platforms[1].count == 1);

  auto recent = store->ListRecent(2);
  assert(recent.size() == 2);
  assert(recent[0].source_id == "src10");
  assert(recent[1].source_id == "src2");

  assert(store->ListByPlatform("youtube").size() == 3);
  assert(store->ListByPlatform("reddit").empty());
  assert(store->ListByCollection("shorts").size() == 1);
  assert(store->Count() == 4);
}

void TestUploaderListings() {
  zget::testing::TestDir dir("store_uploaders");
  auto                   store = zget::factory::BuildLibraryStore(ConfigFor(dir));

  for (int i = 0; i < 3; ++i) {
    auto record        = MakeRecord(i, "youtube");
    record.uploader    = "Channel One";
    record.uploader_id = "UC1";
    store->Insert(record);
  }
  auto clip     = MakeRecord(10, "tiktok");
  clip.uploader = "Channel One";
  store->Insert(clip);
  auto other     = MakeRecord(11, "youtube");
  other.uploader = "Someone Else";
  store->Insert(other);

  auto by_name = store->ListByUploader("Channel One");
  assert(by_name.size() == 4);
  assert(by_name[0].source_id == "src10");

  auto by_id = store->ListByUploader("UC1", 2);
  assert(by_id.size() == 2);
  assert(by_id[0].source_id == "src2");
  assert(store->ListByUploader("nobody").empty());

  auto uploaders = store->Uploaders();
  assert(uploaders.size() == 3);
  assert(uploaders[0].uploader == "Channel One" && uploaders[0].platform == "youtube" && uploaders[0].count == 3);
  assert(uploaders[1].count == 1 && uploaders[2].count == 1);
}

void TestDownloadRateStats() {
  zget::testing::TestDir dir("store_rate");
  auto                   store = zget::factory::BuildLibraryStore(ConfigFor(dir));

  const auto now = *zget::util::ParseIso8601("2024-03-10T12:00:00");

  auto early_today        = MakeRecord(1);
  early_today.ingested_at = *zget::util::ParseIso8601("2024-03-10T00:00:00");
  auto this_week          = MakeRecord(2);
  this_week.ingested_at   = *zget::util::ParseIso8601("2024-03-09T23:59:59");
  auto week_edge          = MakeRecord(3);
  week_edge.ingested_at   = *zget::util::ParseIso8601("2024-03-03T12:00:00");
  auto old                = MakeRecord(4);
  old.ingested_at         = *zget::util::ParseIso8601("2024-03-03T11:59:59");
  for (const auto& record : {early_today, this_week, week_edge, old}) {
    store->Insert(record);
  }

  const auto rate = store->DownloadRateStats(now);
  assert(rate.today_count == 1);
  assert(rate.today_bytes == early_today.file_size_bytes);
  assert(rate.week_count == 3);
  assert(rate.week_bytes == early_today.file_size_bytes + this_week.file_size_bytes + week_edge.file_size_bytes);
}

void TestReopenKeepsData() {
  zget::testing::TestDir dir("store_reopen");
  const auto             config = ConfigFor(dir);

  int64_t id = 0;
  {
    auto store = zget::factory::BuildLibraryStore(config);
    id         = store->Insert(MakeRecord(1));
  }
  auto reopened = zget::factory::BuildLibraryStore(config);
  assert(reopened->Get(id).source_id == "src1");
  assert(reopened->Search("example").size() == 1);
}

void TestConcurrentWriters() {
  zget::testing::TestDir dir("store_concurrent");
  auto                   store = zget::factory::BuildLibraryStore(ConfigFor(dir));

  std::atomic<int>         failures{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < 10; ++i) {
        auto record         = MakeRecord(t * 100 + i);
        record.content_hash = std::to_string(t) + "_" + std::to_string(i);
        try {
          store->Insert(record);
          (void)store->Search("example", 5);
        } catch (const std::exception&) {
          ++failures;
        }
      }
    });
  }
  for (auto& thread : threads) thread.join();

  assert(failures == 0);
  assert(store->Count() == 40);
}

} // namespace

int main() {
  TestInsertAndGetRoundTrip();
  TestUniquenessIsClassified();
  TestSearchFollowsUpdatesAndDeletes();
  TestSearchByTitlePrefix();
  TestSearchTreatsInputAsText();
  TestUpdateValidation();
  TestListingsAndStats();
  TestUploaderListings();
  TestDownloadRateStats();
  TestReopenKeepsData();
  TestConcurrentWriters();

  std::cout << "library_store_test: pass\n";
  return 0;
}
