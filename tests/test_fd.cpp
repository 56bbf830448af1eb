#include <gtest/gtest.h>

#include "diagpack/io/fd.hpp"
#include "diagpack/io/temp_file.hpp"
#include "testing.hpp"

#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

TEST(FdTests, ClosesFileDescriptorOnDestruct) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    {
        diagpack::Fd holder(fd);
        ASSERT_TRUE(holder.Valid());
        EXPECT_EQ(holder.Get(), fd);
    }

    errno = 0;
    int rc = ::close(fd);
    EXPECT_EQ(rc, -1);
    EXPECT_EQ(errno, EBADF);
}

TEST(FdTests, ReleaseHandsOwnershipBack) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    {
        diagpack::Fd holder(fd);
        EXPECT_EQ(holder.Release(), fd);
        EXPECT_FALSE(holder.Valid());
    }

    EXPECT_EQ(::close(fd), 0);
}

TEST(FdTests, OpenReportsErrno) {
    diagpack::Fd fd;
    auto r = diagpack::Fd::Open("/nonexistent/diagpack/file", O_RDONLY, 0, fd);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.err, ENOENT);
    EXPECT_FALSE(fd.Valid());
}

TEST(FdTests, ExclusiveCreateRefusesExistingFile) {
    testutil::TemporaryDirectory tmp;
    const std::string p = tmp.Path() + "/once";

    diagpack::Fd first;
    ASSERT_TRUE(diagpack::Fd::Open(p, O_WRONLY | O_CREAT | O_EXCL, 0644, first).ok);
    EXPECT_TRUE(first.Sync().ok);

    diagpack::Fd second;
    auto r = diagpack::Fd::Open(p, O_WRONLY | O_CREAT | O_EXCL, 0644, second);
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.err, EEXIST);
}

TEST(TempFileTests, RemovedWhenObjectGoesAway) {
    testutil::TemporaryDirectory tmp;
    std::string path;
    {
        diagpack::TempFile f;
        auto r = diagpack::TempFile::Create(tmp.Path(), "script-", ".sh", f);
        ASSERT_TRUE(r.ok) << r.msg;
        path = f.Path();
        EXPECT_EQ(path.rfind(tmp.Path() + "/script-", 0), 0u);
        EXPECT_EQ(path.substr(path.size() - 3), ".sh");

        ASSERT_TRUE(f.WriteAll("echo hi\n").ok);
        f.Close();
        EXPECT_EQ(testutil::ReadTextFile(path), "echo hi\n");
    }

    struct stat st {};
    EXPECT_NE(::stat(path.c_str(), &st), 0);
}

TEST(TempFileTests, CreateFailsInMissingDirectory) {
    diagpack::TempFile f;
    auto r = diagpack::TempFile::Create("/nonexistent/diagpack", "x-", "", f);
    EXPECT_FALSE(r.ok);
}

} // namespace
