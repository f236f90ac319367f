#include "binary_detect.hpp"
#include <core/constants.hpp>
#include <algorithm>
#include <fstream>

static bool has_prefix(const std::string& s, const char* bytes, size_t n) {
    return s.size() >= n && s.compare(0, n, bytes, n) == 0;
}

bool looks_binary(const std::string& head) {
    if (head.empty()) return false;

    // Byte order marks: UTF-8, UTF-32 BE/LE, GB-18030, UTF-16 BE/LE
    if (has_prefix(head, "\xEF\xBB\xBF", 3)) return false;
    if (has_prefix(head, "\x00\x00\xFE\xFF", 4)) return false;
    if (has_prefix(head, "\xFF\xFE\x00\x00", 4)) return false;
    if (has_prefix(head, "\x84\x31\x95\x33", 4)) return false;
    if (has_prefix(head, "%PDF-", 5)) return true;
    if (has_prefix(head, "\xFE\xFF", 2)) return false;
    if (has_prefix(head, "\xFF\xFE", 2)) return false;

    const size_t total = std::min(head.size(), static_cast<size_t>(BINARY_SNIFF_BYTES));
    const auto* b = reinterpret_cast<const unsigned char*>(head.data());
    size_t suspicious = 0;

    for (size_t i = 0; i < total; i++) {
        if (b[i] == 0) return true;

        bool control_or_high = (b[i] < 7 || b[i] > 14) && (b[i] < 32 || b[i] > 127);
        if (!control_or_high) continue;

        // Accept well-formed 2- and 3-byte UTF-8 sequences
        if (b[i] > 193 && b[i] < 224 && i + 1 < total) {
            i++;
            if (b[i] > 127 && b[i] < 192) continue;
        } else if (b[i] > 223 && b[i] < 240 && i + 2 < total) {
            i++;
            if (b[i] > 127 && b[i] < 192 && b[i + 1] > 127 && b[i + 1] < 192) {
                i++;
                continue;
            }
        }

        suspicious++;
        if (i >= 32 && suspicious * 100 > 10 * total) return true;
    }

    return suspicious * 100 > 10 * total;
}

Result<bool> is_binary_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<bool>::Err("Cannot open " + path.string());
    }

    std::string head(BINARY_SNIFF_BYTES, '\0');
    in.read(&head[0], BINARY_SNIFF_BYTES);
    if (in.bad()) {
        return Result<bool>::Err("Cannot read " + path.string());
    }
    head.resize(static_cast<size_t>(in.gcount()));
    return Result<bool>::Ok(looks_binary(head));
}
