#include "destination_resolver.hpp"

#include <system_error>

#include "internal/util/errors.hpp"

namespace zget::ingest {

DestinationResolver::DestinationResolver(std::filesystem::path videos_dir, bool flat_structure)
    : videos_dir_(std::move(videos_dir)), flat_structure_(flat_structure) {
}

std::filesystem::path DestinationResolver::Resolve(const std::string& platform, const std::string& override_dir) const {
  std::filesystem::path dir;
  if (!override_dir.empty()) {
    dir = override_dir;
  } else if (flat_structure_ || platform.empty()) {
    dir = videos_dir_;
  } else {
    dir = videos_dir_ / platform;
  }

  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw util::IOError("create destination " + dir.string() + ": " + ec.message());
  }
  return dir;
}

} // namespace zget::ingest
