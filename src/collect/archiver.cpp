#include "diagpack/collect/archiver.hpp"

#include "diagpack/io/fd.hpp"
#include "diagpack/io/file_reader.hpp"
#include "diagpack/util/host_info.hpp"
#include "diagpack/util/logger.hpp"
#include "diagpack/util/path_utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <span>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace diagpack {

namespace {

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

struct ArchiveEntryDeleter {
    void operator()(archive_entry* e) const {
        if (e) archive_entry_free(e);
    }
};

std::string ArchiveErr(archive* a) {
    const char* s = archive_error_string(a);
    return s ? s : "unknown libarchive error";
}

// Unlinks a partially written archive unless Commit() was called.
class PartialFileGuard {
  public:
    explicit PartialFileGuard(std::string path) : path_(std::move(path)) {}
    PartialFileGuard(const PartialFileGuard&) = delete;
    PartialFileGuard& operator=(const PartialFileGuard&) = delete;
    ~PartialFileGuard() {
        if (!committed_)
            ::unlink(path_.c_str());
    }
    void Commit() { committed_ = true; }

  private:
    std::string path_;
    bool committed_ = false;
};

struct StagedFile {
    std::string entry_name;
    fs::path path;
};

Result CollectFiles(const fs::path& staging_root, std::vector<StagedFile>& out) {
    std::error_code ec;
    fs::recursive_directory_iterator it(staging_root, ec);
    if (ec)
        return Result::Fail(ec.value(), "cannot walk " + staging_root.string() + ": " + ec.message());

    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec)
            return Result::Fail(ec.value(), "cannot walk " + staging_root.string() + ": " + ec.message());
        if (!it->is_regular_file(ec))
            continue;
        StagedFile f;
        f.path = it->path();
        f.entry_name = NormalizeEntryPath(f.path.lexically_relative(staging_root).generic_string());
        out.push_back(std::move(f));
    }
    if (ec)
        return Result::Fail(ec.value(), "cannot walk " + staging_root.string() + ": " + ec.message());

    std::sort(out.begin(), out.end(), [](const StagedFile& a, const StagedFile& b) {
        return a.entry_name < b.entry_name;
    });
    return Result::Ok();
}

Result WriteEntry(archive* a, const StagedFile& file) {
    struct stat st{};
    if (::stat(file.path.c_str(), &st) != 0) {
        const int e = errno;
        return Result::Fail(e, "stat " + file.path.string() + ": " + std::strerror(e));
    }

    std::unique_ptr<archive_entry, ArchiveEntryDeleter> entry(archive_entry_new());
    if (!entry)
        return Result::Fail(-1, "archive_entry_new failed");
    archive_entry_set_pathname(entry.get(), file.entry_name.c_str());
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), 0644);
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(st.st_size));
    archive_entry_set_mtime(entry.get(), st.st_mtime, 0);

    if (archive_write_header(a, entry.get()) != ARCHIVE_OK)
        return Result::Fail(-1, "archive_write_header(" + file.entry_name + "): " + ArchiveErr(a));

    FileOrStdinReader reader;
    if (auto r = FileOrStdinReader::Open(file.path.string(), reader); !r.is_ok())
        return r;

    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0)
            break;
        if (n < 0) {
            const int e = errno;
            return Result::Fail(e, "read " + file.path.string() + ": " + std::strerror(e));
        }
        if (archive_write_data(a, buf.data(), static_cast<size_t>(n)) < 0)
            return Result::Fail(-1, "archive_write_data(" + file.entry_name + "): " + ArchiveErr(a));
    }

    if (archive_write_finish_entry(a) != ARCHIVE_OK)
        return Result::Fail(-1, "archive_write_finish_entry(" + file.entry_name + "): " + ArchiveErr(a));
    return Result::Ok();
}

} // namespace

Archiver::Archiver(std::string host_id, Clock clock)
    : host_id_(std::move(host_id)),
      clock_(clock ? std::move(clock) : Clock([] { return std::time(nullptr); })) {}

Result Archiver::Archive(const fs::path& staging_root,
                         const fs::path& destination_dir,
                         std::string& out_path) const {
    std::error_code ec;
    if (!fs::is_directory(staging_root, ec))
        return Result::Fail(-1, "staging root is not a directory: " + staging_root.string());

    fs::create_directories(destination_dir, ec);
    if (ec) {
        return Result::Fail(ec.value(),
                            "cannot create " + destination_dir.string() + ": " + ec.message());
    }

    const fs::path target = destination_dir / ArchiveFileName(host_id_, clock_());

    std::vector<StagedFile> files;
    if (auto r = CollectFiles(staging_root, files); !r.is_ok())
        return r;

    Fd fd;
    if (auto r = Fd::Open(target.string(), O_WRONLY | O_CREAT | O_EXCL, 0644, fd); !r.is_ok()) {
        if (r.err == EEXIST)
            return Result::Fail(r.err, "archive already exists: " + target.string());
        return r;
    }
    PartialFileGuard guard(target.string());

    {
        std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_new());
        if (!aw)
            return Result::Fail(-1, "archive_write_new failed");
        if (archive_write_set_format_zip(aw.get()) != ARCHIVE_OK)
            return Result::Fail(-1, "archive_write_set_format_zip: " + ArchiveErr(aw.get()));
        if (archive_write_set_options(aw.get(), "zip:compression=deflate") != ARCHIVE_OK)
            LogWarn("zip deflate unavailable, storing entries: %s", ArchiveErr(aw.get()).c_str());
        if (archive_write_open_fd(aw.get(), fd.Get()) != ARCHIVE_OK)
            return Result::Fail(-1, "archive_write_open_fd: " + ArchiveErr(aw.get()));

        for (const auto& file : files) {
            if (auto r = WriteEntry(aw.get(), file); !r.is_ok())
                return r;
        }

        if (archive_write_close(aw.get()) != ARCHIVE_OK)
            return Result::Fail(-1, "archive_write_close: " + ArchiveErr(aw.get()));
    }

    if (auto r = fd.Sync(); !r.is_ok())
        return Result::Fail(r.err, target.string() + ": " + r.msg);
    fd.Close();
    guard.Commit();

    LogInfo("Archived %zu file(s) into %s", files.size(), target.c_str());
    out_path = target.string();
    return Result::Ok();
}

} // namespace diagpack
