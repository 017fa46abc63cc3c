#pragma once

#include <string>

namespace zget::model {

// Returns the platform key for url ("youtube", "tiktok", ...) or "other".
std::string DetectPlatform(const std::string& url);

} // namespace zget::model
