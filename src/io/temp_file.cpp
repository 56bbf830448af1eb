#include "diagpack/io/temp_file.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <unistd.h>
#include <vector>

namespace diagpack {

Result TempFile::Create(const std::string& dir,
                        std::string_view prefix,
                        std::string_view suffix,
                        TempFile& out) {
    out.Cleanup();

    std::string tmpl = dir.empty() ? std::string("/tmp") : dir;
    if (tmpl.back() != '/')
        tmpl.push_back('/');
    tmpl.append(prefix);
    tmpl.append("XXXXXX");
    tmpl.append(suffix);

    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    const int fd = ::mkstemps(buf.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        const int e = errno;
        return Result::Fail(e, "mkstemps failed in " + dir + ": " + std::strerror(e));
    }
    out.fd_.Reset(fd);
    out.path_ = buf.data();
    return Result::Ok();
}

TempFile::TempFile() = default;
TempFile::TempFile(TempFile&& other) noexcept { *this = std::move(other); }
TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        Cleanup();
        fd_ = std::move(other.fd_);
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}
TempFile::~TempFile() { Cleanup(); }

Result TempFile::WriteAll(std::string_view data) {
    if (!fd_.Valid())
        return Result::Fail(EBADF, "temp file is not open: " + path_);

    size_t off = 0;
    while (off < data.size()) {
        const ssize_t n = ::write(fd_.Get(), data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            const int e = errno;
            return Result::Fail(e, "write failed: " + path_ + " (" + std::strerror(e) + ")");
        }
        off += static_cast<size_t>(n);
    }
    return Result::Ok();
}

int TempFile::GetFd() const { return fd_.Get(); }
const std::string& TempFile::Path() const { return path_; }

void TempFile::Close() { fd_.Close(); }

void TempFile::Cleanup() {
    Close();
    if (!path_.empty()) {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

} // namespace diagpack
