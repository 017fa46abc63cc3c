#pragma once

#include <filesystem>
#include <string>

namespace zget::ingest {

/*
  Maps a platform to the directory its files are placed in:
  <videos_dir>/<platform>, or <videos_dir> when flat. An explicit override
  wins. The directory is created if missing.
*/
class DestinationResolver {
 public:
  DestinationResolver(std::filesystem::path videos_dir, bool flat_structure);

  std::filesystem::path Resolve(const std::string& platform, const std::string& override_dir = {}) const;

 private:
  std::filesystem::path videos_dir_;
  bool                  flat_structure_;
};

} // namespace zget::ingest
