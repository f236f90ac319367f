#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

// Content sniffing over the first BINARY_SNIFF_BYTES bytes: NUL bytes or more
// than 10% control/non-UTF-8 bytes mean binary. Byte order marks mean text.
bool looks_binary(const std::string& head);

// Sniffs the beginning of a file. Empty files are text.
Result<bool> is_binary_file(const std::filesystem::path& path);
