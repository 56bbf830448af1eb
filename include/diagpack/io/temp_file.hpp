#pragma once

#include "diagpack/io/fd.hpp"
#include "diagpack/util/result.hpp"

#include <string>
#include <string_view>

namespace diagpack {

// A file created with mkstemps() that is unlinked when the object goes away,
// on every exit path.
class TempFile {
public:
    static Result Create(const std::string& dir,
                         std::string_view prefix,
                         std::string_view suffix,
                         TempFile& out);

    TempFile();
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;
    ~TempFile();

    Result WriteAll(std::string_view data);

    int GetFd() const;
    const std::string& Path() const;
    void Close();

private:
    void Cleanup();

    Fd fd_;
    std::string path_;
};

} // namespace diagpack
