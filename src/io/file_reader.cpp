#include "diagpack/io/file_reader.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace diagpack {

Result FileOrStdinReader::Open(std::string path, FileOrStdinReader& out) {
    out.path_ = std::move(path);

    if (out.path_ == "-") {
        out.fd_.Reset(STDIN_FILENO);
        out.size_ = std::nullopt;
        return Result::Ok();
    }

    if (auto r = Fd::Open(out.path_, O_RDONLY, 0, out.fd_); !r.is_ok())
        return r;

    struct stat st{};
    if (::fstat(out.fd_.Get(), &st) == 0 && st.st_size > 0) {
        out.size_ = static_cast<std::uint64_t>(st.st_size);
    } else {
        out.size_ = std::nullopt;
    }

    return Result::Ok();
}

std::optional<std::uint64_t> FileOrStdinReader::TotalSize() const { return size_; }

ssize_t FileOrStdinReader::Read(std::span<std::uint8_t> out) {
    while (true) {
        ssize_t n = ::read(fd_.Get(), out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

Result FileOrStdinReader::ReadAll(std::string& out) {
    out.clear();
    if (size_.has_value()) {
        out.reserve(static_cast<size_t>(*size_));
    }
    std::array<std::uint8_t, 64 * 1024> buf{};
    while (true) {
        const ssize_t n = Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0)
            break;
        if (n < 0)
            return Result::Fail(errno, "read failed: " + path_ + " (" + std::strerror(errno) + ")");
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }
    return Result::Ok();
}

} // namespace diagpack
