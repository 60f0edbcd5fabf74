#pragma once
#include <string>
#include <cstdint>

// Hidden temporary path beside `finalPath`, keeping its extension so encoders
// can still infer the container: /a/b/.clip.tmp42.mp4
std::string tempPathFor(const std::string& finalPath);

// Validates a finished temporary file (size >= minBytes), flushes it and
// renames it over finalPath. On failure the temporary is removed and
// finalPath is left untouched.
bool promoteFile(const std::string& tmpPath, const std::string& finalPath,
                 uint64_t minBytes, std::string& error);

bool writeFileAtomic(const std::string& finalPath, const void* data, size_t len,
                     uint64_t minBytes, std::string& error);

bool writeFileAtomic(const std::string& finalPath, const std::string& content);
