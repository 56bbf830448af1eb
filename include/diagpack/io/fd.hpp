#pragma once

#include "diagpack/util/result.hpp"

#include <string>
#include <sys/types.h>

namespace diagpack {

// Owning file descriptor. STDIN_FILENO is borrowed, never closed.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    // open(2) with O_CLOEXEC added; errno ends up in Result::err.
    static Result Open(const std::string& path, int flags, mode_t mode, Fd& out);

    int Get() const;
    bool Valid() const;

    void Reset(int fd);
    int Release();
    void Close();

    Result Sync() const;

  private:
    int fd_{-1};
};

} // namespace diagpack
