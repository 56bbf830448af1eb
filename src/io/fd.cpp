#include "diagpack/io/fd.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace diagpack {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.Release()) {}

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other)
        Reset(other.Release());
    return *this;
}

Fd::~Fd() { Close(); }

Result Fd::Open(const std::string& path, int flags, mode_t mode, Fd& out) {
    int fd;
    do {
        fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        const int e = errno;
        return Result::Fail(e, "open " + path + ": " + std::strerror(e));
    }
    out.Reset(fd);
    return Result::Ok();
}

int Fd::Get() const { return fd_; }

bool Fd::Valid() const { return fd_ >= 0; }

void Fd::Reset(int fd) {
    Close();
    fd_ = fd;
}

int Fd::Release() {
    const int fd = fd_;
    fd_ = -1;
    return fd;
}

void Fd::Close() {
    if (fd_ >= 0 && fd_ != STDIN_FILENO) {
        ::close(fd_);
    }
    fd_ = -1;
}

Result Fd::Sync() const {
    if (::fsync(fd_) != 0) {
        const int e = errno;
        return Result::Fail(e, std::string("fsync: ") + std::strerror(e));
    }
    return Result::Ok();
}

} // namespace diagpack
