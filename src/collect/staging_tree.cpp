#include "diagpack/collect/staging_tree.hpp"

#include "diagpack/util/logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace diagpack {

StagingTree::StagingTree(StagingTree&& other) noexcept : dir_(std::move(other.dir_)) {
    other.dir_.clear();
}

StagingTree& StagingTree::operator=(StagingTree&& other) noexcept {
    if (this == &other)
        return *this;
    (void)Remove();
    dir_ = std::move(other.dir_);
    other.dir_.clear();
    return *this;
}

StagingTree::~StagingTree() {
    if (auto r = Remove(); !r.is_ok()) {
        LogError("%s", r.msg.c_str());
    }
}

Result StagingTree::Create(const std::string& dir, StagingTree& out) {
    if (auto r = out.Remove(); !r.is_ok())
        return r;

    std::error_code ec;
    if (dir.empty()) {
        const char* tmp = std::getenv("TMPDIR");
        const fs::path base = (tmp && *tmp) ? fs::path(tmp) : fs::path("/tmp");
        std::string tmpl = (base / "diagpack-staging-XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        char* created = ::mkdtemp(buf.data());
        if (!created) {
            const int e = errno;
            return Result::Fail(e, "mkdtemp failed: " + std::string(std::strerror(e)));
        }
        out.dir_ = created;
        return Result::Ok();
    }

    // A leftover tree from an earlier run must not leak into this one.
    fs::remove_all(dir, ec);
    if (ec)
        return Result::Fail(ec.value(), "cannot clear staging dir " + dir + ": " + ec.message());
    fs::create_directories(dir, ec);
    if (ec)
        return Result::Fail(ec.value(), "cannot create staging dir " + dir + ": " + ec.message());

    out.dir_ = dir;
    return Result::Ok();
}

Result StagingTree::Remove() {
    if (dir_.empty())
        return Result::Ok();

    std::error_code ec;
    fs::remove_all(dir_, ec);
    if (ec)
        return Result::Fail(ec.value(), "cannot remove staging dir " + dir_ + ": " + ec.message());
    LogDebug("Removed staging dir %s", dir_.c_str());
    dir_.clear();
    return Result::Ok();
}

} // namespace diagpack
