#pragma once

#include <string>

namespace pong {

bool fileExists(const std::string& path);
std::string readFile(const std::string& path);

// Rewrites the whole file: data goes to "<path>.tmp" first and is renamed over
// the target, so readers never observe a half-written record file.
bool writeFile(const std::string& path, const std::string& data);

}  // namespace pong
