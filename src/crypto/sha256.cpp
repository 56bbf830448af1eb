#include "diagpack/crypto/sha256.hpp"

#include "diagpack/io/fd.hpp"

#include <openssl/evp.h>

#include <array>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <unistd.h>
#include <vector>

namespace diagpack {

namespace {

struct EvpCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using EvpCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpCtxDeleter>;

std::string HexEncode(const std::uint8_t* bytes, size_t n) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out(n * 2, '0');
    for (size_t i = 0; i < n; ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

} // namespace

Result Sha256HexFile(const std::string& path, std::string& out_hex) {
    out_hex.clear();

    Fd fd;
    if (auto r = Fd::Open(path, O_RDONLY, 0, fd); !r.is_ok())
        return r;

    EvpCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
        return Result::Fail(-1, "sha256 init failed");

    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = ::read(fd.Get(), buf.data(), buf.size());
        if (n == 0)
            break;
        if (n < 0) {
            if (errno == EINTR)
                continue;
            const int e = errno;
            return Result::Fail(e, "read " + path + ": " + std::strerror(e));
        }
        if (EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(n)) != 1)
            return Result::Fail(-1, "sha256 update failed: " + path);
    }

    std::array<std::uint8_t, EVP_MAX_MD_SIZE> digest{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1 || len != 32)
        return Result::Fail(-1, "sha256 final failed: " + path);

    out_hex = HexEncode(digest.data(), len);
    return Result::Ok();
}

} // namespace diagpack
