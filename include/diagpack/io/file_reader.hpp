#pragma once

#include "diagpack/io/fd.hpp"
#include "diagpack/io/io.hpp"
#include "diagpack/util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace diagpack {

class FileOrStdinReader final : public IReader {
public:
    static Result Open(std::string path, FileOrStdinReader &out);

    std::optional<std::uint64_t> TotalSize() const override;
    ssize_t Read(std::span<std::uint8_t> out) override;

    // Reads until EOF.
    Result ReadAll(std::string &out);

private:
    std::string path_;
    Fd fd_;
    std::optional<std::uint64_t> size_;
};

} // namespace diagpack
