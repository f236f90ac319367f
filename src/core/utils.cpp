#include "utils.hpp"
#include <platform/platform.hpp>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <memory>
#include <vector>

namespace fs = std::filesystem;

fs::path expand_home(const std::string& path) {
    if (path == "~") return platform::home_dir();
    if (path.rfind("~/", 0) == 0) {
        return platform::home_dir() / path.substr(2);
    }
    return fs::path(path);
}

Result<std::string> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string>::Err("Cannot open " + path.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return Result<std::string>::Err("Cannot read " + path.string());
    }
    return Result<std::string>::Ok(ss.str());
}

Result<void> write_file_atomic(const fs::path& path, const std::string& content) {
    fs::path tmp = path;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Result<void>::Err("Cannot create " + tmp.string());
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.close();
        if (!out) {
            std::error_code ec;
            fs::remove(tmp, ec);
            return Result<void>::Err("Cannot write " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return Result<void>::Err(fmt::format("Cannot replace {}: {}", path.string(), ec.message()));
    }
    return Result<void>::Ok();
}

// ── MD5 ────────────────────────────────────────────────────

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

std::string to_hex(const unsigned char* digest, unsigned int len) {
    static const char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; i++) {
        out += HEX[digest[i] >> 4];
        out += HEX[digest[i] & 0x0F];
    }
    return out;
}

MdCtx new_md5_ctx() {
    MdCtx ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize MD5 digest");
    }
    return ctx;
}

std::string finish_md5(EVP_MD_CTX* ctx) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &len) != 1) {
        throw std::runtime_error("Failed to finalize MD5 digest");
    }
    return to_hex(digest, len);
}

} // namespace

std::string md5_hex(const std::string& data) {
    auto ctx = new_md5_ctx();
    EVP_DigestUpdate(ctx.get(), data.data(), data.size());
    return finish_md5(ctx.get());
}

Result<std::string> compute_file_md5(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string>::Err("Cannot open " + path.string());
    }

    auto ctx = new_md5_ctx();
    std::vector<char> buf(64 * 1024);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto n = in.gcount();
        if (n > 0) EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(n));
    }
    if (in.bad()) {
        return Result<std::string>::Err("Cannot read " + path.string());
    }
    return Result<std::string>::Ok(finish_md5(ctx.get()));
}

// ── Revision tokens ────────────────────────────────────────

std::string generate_revision_id() {
    unsigned char b[16];
    if (RAND_bytes(b, sizeof(b)) != 1) {
        throw std::runtime_error("Failed to generate random revision id");
    }
    b[6] = static_cast<unsigned char>((b[6] & 0x0F) | 0x40);  // version 4
    b[8] = static_cast<unsigned char>((b[8] & 0x3F) | 0x80);  // variant 10

    std::string hex = to_hex(b, sizeof(b));
    return fmt::format("{}-{}-{}-{}-{}",
                       hex.substr(0, 8), hex.substr(8, 4), hex.substr(12, 4),
                       hex.substr(16, 4), hex.substr(20, 12));
}

// ── Paths ──────────────────────────────────────────────────

std::string normalize_path(const std::string& path) {
    if (path.empty()) return path;

    std::string s = path;
    for (auto& c : s) {
        if (c == '\\') c = '/';
    }

    bool absolute = s[0] == '/';
    std::vector<std::string> parts;
    std::string part;
    std::istringstream ss(s);
    while (std::getline(ss, part, '/')) {
        if (part.empty() || part == ".") continue;
        parts.push_back(part);
    }

    std::string out = absolute ? "/" : "";
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += '/';
        out += parts[i];
    }
    return out;
}

std::string join_remote_path(const std::string& base, const std::string& rel) {
    if (base.empty()) return normalize_path(rel);
    if (rel.empty()) return normalize_path(base);
    return normalize_path(base + "/" + rel);
}
