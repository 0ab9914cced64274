#include "als/hash/hash_store.hpp"

#include <openssl/evp.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace als::hash {
namespace {

constexpr std::size_t kChunkSize = 64 * 1024;

struct EvpCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using EvpCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpCtxDeleter>;

std::string to_hex(const unsigned char* bytes, unsigned int length) {
    std::ostringstream oss;
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

bool is_gone(const std::error_code& ec) {
    return ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
}

} // namespace

Result<std::string> digest(std::istream& input) {
    EvpCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return Err<std::string>(ErrorCode::IOError, "initializing sha256 context");
    }

    std::array<char, kChunkSize> buffer{};
    while (input) {
        input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto got = input.gcount();
        if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(got)) != 1) {
            return Err<std::string>(ErrorCode::IOError, "updating sha256 digest");
        }
    }
    if (input.bad()) {
        return Err<std::string>(ErrorCode::IOError, "read failed");
    }

    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out, &out_len) != 1) {
        return Err<std::string>(ErrorCode::IOError, "finalizing sha256 digest");
    }
    return Ok(to_hex(out, out_len));
}

Result<std::string> digest_file(const fs::path& path) {
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec && !is_gone(ec)) {
        const ErrorCode code = ec == std::errc::permission_denied ? ErrorCode::PermissionDenied
                                                                  : ErrorCode::IOError;
        return Err<std::string>(code, "opening " + path.string() + ": " + ec.message());
    }
    if (ec || !fs::exists(status)) {
        const std::string reason = ec ? ec.message() : "no such file or directory";
        return Err<std::string>(ErrorCode::NotFound, "opening " + path.string() + ": " + reason);
    }
    if (fs::is_directory(status)) {
        return Err<std::string>(ErrorCode::IsADirectory, "hashing " + path.string() + ": is a directory");
    }
    if (!fs::is_regular_file(status)) {
        return Err<std::string>(ErrorCode::IOError, "hashing " + path.string() + ": not a regular file");
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        const int err = errno;
        const ErrorCode code = err == EACCES ? ErrorCode::PermissionDenied : ErrorCode::IOError;
        return Err<std::string>(code, "opening " + path.string() + ": " + std::strerror(err));
    }

    auto result = digest(input);
    if (result.is_error()) {
        return Err<std::string>(ErrorCode::IOError,
                                "hashing " + path.string() + ": " + result.error().message);
    }
    return result;
}

} // namespace als::hash
