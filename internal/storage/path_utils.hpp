#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace zget::storage {

/*
  Strips characters that are unsafe on common filesystems (<>:"/\|?* and
  control characters), collapses runs of whitespace/underscores to a single
  underscore, trims leading/trailing '.' and '_', and limits the result to
  max_length bytes while keeping the extension.
*/
std::string SanitizeFilename(const std::string& filename, std::size_t max_length = 200);

// "name.ext" -> "name_<n>.ext"
std::filesystem::path WithSuffix(const std::filesystem::path& path, int n);

} // namespace zget::storage
