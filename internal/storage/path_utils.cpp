#include "path_utils.hpp"

#include <cctype>

namespace zget::storage {

namespace {

bool IsUnsafe(unsigned char c) {
  switch (c) {
    case '<':
    case '>':
    case ':':
    case '"':
    case '/':
    case '\\':
    case '|':
    case '?':
    case '*':
      return true;
    default:
      return c < 0x20 || c == 0x7F;
  }
}

// Never cut a UTF-8 sequence in half.
std::size_t Utf8Boundary(const std::string& s, std::size_t pos) {
  while (pos > 0 && pos < s.size() && (static_cast<unsigned char>(s[pos]) & 0xC0) == 0x80) {
    --pos;
  }
  return pos;
}

std::string Trim(const std::string& s) {
  const auto first = s.find_first_not_of("._");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = s.find_last_not_of("._");
  return s.substr(first, last - first + 1);
}

} // namespace

std::string SanitizeFilename(const std::string& filename, std::size_t max_length) {
  std::string out;
  out.reserve(filename.size());

  bool in_run = false;
  for (unsigned char c : filename) {
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r' && IsUnsafe(c)) {
      continue;
    }
    if (std::isspace(c) || c == '_') {
      if (!in_run) {
        out.push_back('_');
      }
      in_run = true;
      continue;
    }
    in_run = false;
    out.push_back(static_cast<char>(c));
  }

  if (out.size() > max_length) {
    const auto dot = out.rfind('.');
    if (dot != std::string::npos && dot > 0 && out.size() - dot < max_length) {
      const std::string ext  = out.substr(dot);
      const auto        keep = Utf8Boundary(out, max_length - ext.size());
      out                    = out.substr(0, keep) + ext;
    } else {
      out = out.substr(0, Utf8Boundary(out, max_length));
    }
  }

  return Trim(out);
}

std::filesystem::path WithSuffix(const std::filesystem::path& path, int n) {
  auto renamed = path;
  renamed.replace_filename(path.stem().string() + "_" + std::to_string(n) + path.extension().string());
  return renamed;
}

} // namespace zget::storage
