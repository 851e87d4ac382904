#pragma once

#include <string>

namespace ds {

// Open url in the desktop's default browser. Best effort: returns false and
// logs at debug level when no launcher could be started.
bool open_browser(const std::string& url);

} // namespace ds
