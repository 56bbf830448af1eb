#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <sys/types.h>

namespace diagpack {

class IReader {
public:
    virtual ~IReader() = default;
    virtual ssize_t Read(std::span<std::uint8_t> out) = 0;
    virtual std::optional<std::uint64_t> TotalSize() const { return std::nullopt; }
};

} // namespace diagpack
