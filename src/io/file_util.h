#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace file_util
{
// Whole-file read. Sets err (and returns an empty vector) when the file cannot be
// opened or read; an existing empty file returns an empty vector with err empty.
std::vector<std::uint8_t> ReadAllBytes(const std::string& path, std::string& err);

// Writes to "<path>.tmp" then renames over `path`, so readers never observe a
// half-written file. Parent directories are created as needed.
bool WriteAllBytesAtomic(const std::string& path, const std::vector<std::uint8_t>& bytes, std::string& err);
bool WriteTextAtomic(const std::string& path, const std::string& text, std::string& err);
} // namespace file_util
