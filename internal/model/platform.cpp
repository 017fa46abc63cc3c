#include "platform.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace zget::model {

namespace {

struct PlatformPattern {
  std::string_view platform;
  std::string_view host;
};

// Checked in order; the first boundary match wins.
constexpr std::array<PlatformPattern, 17> kPatterns = {{
    {"youtube", "youtube.com"},
    {"youtube", "youtu.be"},
    {"youtube", "youtube-nocookie.com"},
    {"tiktok", "tiktok.com"},
    {"tiktok", "vm.tiktok.com"},
    {"instagram", "instagram.com"},
    {"instagram", "instagr.am"},
    {"twitter", "twitter.com"},
    {"twitter", "x.com"},
    {"twitter", "t.co"},
    {"reddit", "reddit.com"},
    {"reddit", "redd.it"},
    {"twitch", "twitch.tv"},
    {"twitch", "clips.twitch.tv"},
    {"c-span", "c-span.org"},
    {"c-span", "cspan.org"},
    {"c-span", "c-span.tv"},
}};

bool IsBoundary(char c) {
  return c == '/' || c == ':' || c == '?' || c == '#';
}

bool IsHostStart(char c) {
  return c == '/' || c == '.' || c == '@';
}

} // namespace

std::string DetectPlatform(const std::string& url) {
  std::string lower(url);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  for (const auto& pattern : kPatterns) {
    // "t.co" must not match inside "combatfootage.com", nor "x.com" inside "netflix.com"
    for (auto pos = lower.find(pattern.host); pos != std::string::npos; pos = lower.find(pattern.host, pos + 1)) {
      const auto end = pos + pattern.host.size();
      if ((pos == 0 || IsHostStart(lower[pos - 1])) && (end >= lower.size() || IsBoundary(lower[end]))) {
        return std::string(pattern.platform);
      }
    }
  }
  return "other";
}

} // namespace zget::model
