#include <gtest/gtest.h>

#include "io/temp_file.hpp"
#include "update/http_transport.hpp"
#include "update/progress_sinks.hpp"
#include "testing.hpp"

#include <nlohmann/json.hpp>

namespace extupd {

// Only checks that never reach the network.
class CurlHttpTransportTest : public ::testing::Test {
protected:
    testutil::TemporaryDirectory temp_dir;
    CurlHttpTransport transport;

    Result Get(const std::string& url, bool force_https) {
        TempFile out;
        auto res = TempFile::Create(temp_dir.Path(), "dl_", ".part", out);
        if (!res.is_ok()) return res;

        HttpRequest req;
        req.url = url;
        req.force_https = force_https;
        HttpResponse response;
        return transport.Download(req, out.GetFd(), TransferCallback{}, response);
    }
};

TEST_F(CurlHttpTransportTest, RejectsNonHttpSchemes) {
    testutil::WriteFile(temp_dir.Sub("local.txt"), "secret");
    auto res = Get("file://" + temp_dir.Sub("local.txt"), false);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::TransportFailure);
}

TEST_F(CurlHttpTransportTest, ForceHttpsRejectsPlainHttp) {
    auto res = Get("http://repo.invalid/foo.zip", true);
    ASSERT_FALSE(res.is_ok());
    EXPECT_EQ(res.kind, ErrorKind::TransportFailure);
}

TEST(FileProgressSinkTest, WritesStatusFile) {
    testutil::TemporaryDirectory dir;
    const std::string path = dir.Sub("progress.json");
    FileProgressSink sink(path);

    sink.OnProgress(ProgressEvent{"foo", 512, 1024});
    auto j = nlohmann::json::parse(testutil::ReadFile(path));
    EXPECT_EQ(j["extension"], "foo");
    EXPECT_EQ(j["bytes"], 512);
    EXPECT_EQ(j["total"], 1024);
    EXPECT_EQ(j["percent"], 50);

    sink.OnProgress(ProgressEvent{"foo", 2048, 0});
    j = nlohmann::json::parse(testutil::ReadFile(path));
    EXPECT_EQ(j["percent"], -1);
    EXPECT_EQ(testutil::ListDir(dir.Path()), std::vector<std::string>{"progress.json"});
}

} // namespace extupd
