#include "../include/download.hpp"
#include "../include/errors.hpp"
#include "support/fake_allocator.hpp"
#include "support/test_support.hpp"

#include <gtest/gtest.h>

using namespace testing_support;

namespace {

std::string payload() {
    std::string s;
    for (int i = 0; i < 50000; ++i) s.push_back(static_cast<char>('a' + i % 26));
    return s;
}

}  // namespace

TEST(DownloadTest, FetchesWholeFile)
{
    FakeAllocator server;
    server.serve_file("/files/a.car", payload());
    TempDir dir;

    download_to_file(server.base_url() + "/files/a.car", dir / "a.car");
    EXPECT_EQ(read_file(dir / "a.car"), payload());
}

TEST(DownloadTest, ResumesPartialFile)
{
    FakeAllocator server;
    server.serve_file("/files/a.car", payload());
    TempDir dir;
    write_file(dir / "a.car", payload().substr(0, 12345));

    download_to_file(server.base_url() + "/files/a.car", dir / "a.car");
    EXPECT_EQ(read_file(dir / "a.car"), payload());
    auto reqs = server.requests();
    ASSERT_EQ(reqs.size(), 1u);
    EXPECT_EQ(reqs[0].range, "bytes=12345-");
}

TEST(DownloadTest, CompleteFileIsLeftAlone)
{
    FakeAllocator server;
    server.serve_file("/files/a.car", payload());
    TempDir dir;
    write_file(dir / "a.car", payload());

    download_to_file(server.base_url() + "/files/a.car", dir / "a.car");
    EXPECT_EQ(read_file(dir / "a.car"), payload());
}

TEST(DownloadTest, RestartsWhenServerIgnoresRanges)
{
    FakeAllocator server;
    server.serve_file("/files/a.car", payload(), false);
    TempDir dir;
    write_file(dir / "a.car", "stale-prefix");

    download_to_file(server.base_url() + "/files/a.car", dir / "a.car");
    EXPECT_EQ(read_file(dir / "a.car"), payload());
}

TEST(DownloadTest, HttpErrorIsNetworkError)
{
    FakeAllocator server;
    TempDir dir;
    try {
        download_to_file(server.base_url() + "/files/missing.car", dir / "missing.car");
        FAIL();
    } catch (const FetchError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::network);
    }
}

TEST(DownloadTest, RefusedConnectionRetriesUpToLimit)
{
    std::string dead;
    {
        FakeAllocator server;
        dead = server.base_url();
    }
    TempDir dir;
    DownloadOptions opts;
    opts.attempts = 2;
    opts.retry_pause_ms = 10;
    EXPECT_THROW(download_to_file(dead + "/files/a.car", dir / "a.car", opts), FetchError);
}
