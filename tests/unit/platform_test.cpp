#include "internal/model/platform.hpp"

#include <cassert>
#include <iostream>

using zget::model::DetectPlatform;

namespace {

void TestKnownHosts() {
  assert(DetectPlatform("https://www.youtube.com/watch?v=dQw4w9WgXcQ") == "youtube");
  assert(DetectPlatform("https://youtu.be/dQw4w9WgXcQ") == "youtube");
  assert(DetectPlatform("https://www.youtube-nocookie.com/embed/abc") == "youtube");
  assert(DetectPlatform("https://www.tiktok.com/@someone/video/123") == "tiktok");
  assert(DetectPlatform("https://vm.tiktok.com/ZMabc/") == "tiktok");
  assert(DetectPlatform("https://www.instagram.com/reel/Cabc/") == "instagram");
  assert(DetectPlatform("https://x.com/user/status/1") == "twitter");
  assert(DetectPlatform("https://twitter.com/user/status/1") == "twitter");
  assert(DetectPlatform("https://t.co/abc") == "twitter");
  assert(DetectPlatform("https://old.reddit.com/r/videos/comments/x") == "reddit");
  assert(DetectPlatform("https://clips.twitch.tv/Clip") == "twitch");
  assert(DetectPlatform("https://www.c-span.org/video/?123") == "c-span");
}

void TestCaseInsensitive() {
  assert(DetectPlatform("HTTPS://WWW.YOUTUBE.COM/watch?v=x") == "youtube");
}

void TestHostBoundaries() {
  assert(DetectPlatform("https://www.netflix.com/title/1") == "other");
  assert(DetectPlatform("https://combatfootage.com/v/1") == "other");
  assert(DetectPlatform("https://notyoutube.company/x") == "other");
  assert(DetectPlatform("https://youtube.com:443/watch?v=x") == "youtube");
  assert(DetectPlatform("https://vimeo.com/12345") == "other");
  assert(DetectPlatform("") == "other");
}

} // namespace

int main() {
  TestKnownHosts();
  TestCaseInsensitive();
  TestHostBoundaries();

  std::cout << "platform_test: pass\n";
  return 0;
}
