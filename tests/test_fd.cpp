#include <gtest/gtest.h>

#include "io/fd.hpp"
#include "io/scratch_dir.hpp"
#include "io/temp_file.hpp"
#include "testing.hpp"

#include <fcntl.h>
#include <filesystem>
#include <unistd.h>

namespace {

TEST(FdTests, ClosesFileDescriptorOnDestruct) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    {
        extupd::Fd holder(fd);
        ASSERT_TRUE(holder.Valid());
        EXPECT_EQ(holder.Get(), fd);
    }

    errno = 0;
    int rc = ::close(fd);
    EXPECT_EQ(rc, -1);
    EXPECT_EQ(errno, EBADF);
}

TEST(FdTests, ReleaseKeepsDescriptorOpen) {
    int fd = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(fd, 0);

    int released = -1;
    {
        extupd::Fd holder(fd);
        released = holder.Release();
        EXPECT_FALSE(holder.Valid());
    }

    EXPECT_EQ(released, fd);
    EXPECT_EQ(::close(fd), 0);
}

TEST(FdTests, OpenAndWriteAll) {
    testutil::TemporaryDirectory dir;
    const std::string path = dir.Sub("out.txt");

    {
        extupd::Fd fd;
        ASSERT_TRUE(extupd::Fd::Open(path, O_WRONLY | O_CREAT | O_APPEND, 0644, fd).is_ok());
        ASSERT_TRUE(fd.WriteAll("hello ").is_ok());
        ASSERT_TRUE(fd.WriteAll("world").is_ok());
        EXPECT_TRUE(fd.Sync().is_ok());
    }
    EXPECT_EQ(testutil::ReadFile(path), "hello world");

    extupd::Fd missing;
    auto res = extupd::Fd::Open(dir.Sub("no/such/file"), O_RDONLY, 0, missing);
    EXPECT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, extupd::ErrorKind::IOFailure);
    EXPECT_FALSE(missing.Valid());
    EXPECT_FALSE(missing.WriteAll("x").is_ok());
}

TEST(TempFileTests, RemovedOnDestructUnlessReleased) {
    testutil::TemporaryDirectory dir;
    std::string dropped;
    std::string kept;

    {
        extupd::TempFile tmp;
        ASSERT_TRUE(extupd::TempFile::Create(dir.Path(), "t_", ".part", tmp).is_ok());
        dropped = tmp.Path();
        EXPECT_TRUE(std::filesystem::exists(dropped));
        EXPECT_EQ(std::filesystem::path(dropped).extension(), ".part");
    }
    EXPECT_FALSE(std::filesystem::exists(dropped));

    {
        extupd::TempFile tmp;
        ASSERT_TRUE(extupd::TempFile::Create(dir.Path(), "t_", ".part", tmp).is_ok());
        kept = tmp.Release();
        EXPECT_TRUE(tmp.Empty());
    }
    EXPECT_TRUE(std::filesystem::exists(kept));
}

TEST(TempFileTests, RenameMovesOwnership) {
    testutil::TemporaryDirectory dir;
    const std::string target = dir.Sub("final.zip");

    {
        extupd::TempFile tmp;
        ASSERT_TRUE(extupd::TempFile::Create(dir.Path(), "t_", ".part", tmp).is_ok());
        const std::string data = "payload";
        ASSERT_EQ(::write(tmp.GetFd(), data.data(), data.size()), static_cast<ssize_t>(data.size()));
        const std::string before = tmp.Path();

        auto res = tmp.RenameTo(target);
        ASSERT_TRUE(res.is_ok()) << res.msg;
        EXPECT_EQ(tmp.Path(), target);
        EXPECT_FALSE(std::filesystem::exists(before));
        EXPECT_EQ(testutil::ReadFile(target), "payload");
    }
    EXPECT_FALSE(std::filesystem::exists(target));
}

TEST(ScratchDirTests, RemovesTreeOnDestruct) {
    testutil::TemporaryDirectory dir;
    std::string path;

    {
        extupd::ScratchDir scratch;
        ASSERT_TRUE(extupd::ScratchDir::Create(dir.Path(), "scratch-", scratch).is_ok());
        path = scratch.Path();
        testutil::WriteFile(path + "/a/b/c.txt", "x");
    }

    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_TRUE(testutil::ListDir(dir.Path()).empty());
}

} // namespace
