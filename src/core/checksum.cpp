/**
 * @file checksum.cpp
 * @brief Implementation of SHA-256 utilities on top of OpenSSL EVP
 */

#include <clipxfer/core/checksum.h>

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

namespace clipxfer {

namespace {

constexpr std::size_t read_block_size = 64 * 1024;

struct md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, md_ctx_deleter>;

auto digest_to_hex(const unsigned char* digest, unsigned int length) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

auto new_sha256_context() -> md_ctx_ptr {
    md_ctx_ptr ctx(EVP_MD_CTX_new());
    if (ctx && EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        ctx.reset();
    }
    return ctx;
}

auto finish(EVP_MD_CTX* ctx) -> result<std::string> {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx, digest.data(), &length) != 1) {
        return unexpected(error{error_code::internal_error, "SHA-256 finalization failed"});
    }
    return digest_to_hex(digest.data(), length);
}

auto to_lower(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

}  // namespace

auto checksum::sha256(std::span<const std::byte> data) -> std::string {
    auto ctx = new_sha256_context();
    if (!ctx) {
        return {};
    }
    if (!data.empty() &&
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        return {};
    }
    auto hex = finish(ctx.get());
    return hex ? hex.value() : std::string{};
}

auto checksum::sha256_file(const std::filesystem::path& path) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(
            error{error_code::file_not_found, "cannot open file: " + path.string()});
    }

    auto ctx = new_sha256_context();
    if (!ctx) {
        return unexpected(error{error_code::internal_error, "cannot create SHA-256 context"});
    }

    std::vector<char> block(read_block_size);
    while (file) {
        file.read(block.data(), static_cast<std::streamsize>(block.size()));
        auto bytes_read = file.gcount();
        if (bytes_read > 0 &&
            EVP_DigestUpdate(ctx.get(), block.data(), static_cast<std::size_t>(bytes_read)) != 1) {
            return unexpected(error{error_code::internal_error, "SHA-256 update failed"});
        }
    }

    if (file.bad()) {
        return unexpected(
            error{error_code::file_read_error, "read failed: " + path.string()});
    }

    return finish(ctx.get());
}

auto checksum::verify_sha256(const std::filesystem::path& path, const std::string& expected)
    -> bool {
    auto result = sha256_file(path);
    if (!result) {
        return false;
    }
    return result.value() == to_lower(expected);
}

auto checksum::is_sha256_hex(const std::string& value) -> bool {
    if (value.size() != sha256_hex_length) {
        return false;
    }
    return std::all_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

}  // namespace clipxfer
