#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <bunkget/downloader/download_orchestrator.hpp>
#include <bunkget/downloader/url_cipher.hpp>

#include "support/mock_http_adapter.hpp"
#include "support/temp_dir_scope.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

using namespace bunkget::downloader;
using bunkget::test_support::httpError;
using bunkget::test_support::MockHttpAdapter;
using bunkget::test_support::read_file;
using bunkget::test_support::RecordingTiming;
using bunkget::test_support::response;
using bunkget::test_support::streamBody;
using bunkget::test_support::TempDirScope;
using json = nlohmann::json;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::StrictMock;
using ::testing::UnorderedElementsAre;

namespace fs = std::filesystem;

namespace {

constexpr double kTimestamp = 1712345678.0;

std::string albumPage(const std::vector<std::string>& slugs) {
    std::string html = R"(<html><body><div class="text-subs font-semibold flex text-base sm:text-lg">)"
                       R"(<h1>Holiday</h1></div>)";
    for (const auto& s : slugs)
        html += R"(<a class="after:absolute after:z-10 after:inset-0" href="/f/)" + s + R"("></a>)";
    return html + "</body></html>";
}

std::string itemPage(const std::string& slug) {
    return "<html><body><h1 class=\"text-subs font-semibold text-base sm:text-lg truncate\">" +
           slug + ".mp4</h1></body></html>";
}

std::string apiBodyFor(const std::string& slug) {
    const std::string real = "https://kebab.cdn.example/" + slug + ".mp4";
    std::vector<std::byte> bytes;
    for (unsigned char c : real)
        bytes.push_back(static_cast<std::byte>(c));
    const auto encrypted = cipher::base64Encode(cipher::encrypt(bytes, kTimestamp));
    return json{{"timestamp", kTimestamp}, {"url", encrypted}}.dump();
}

std::string contentFor(std::string_view url) {
    return "content of " + std::string(url);
}

class DownloadOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        http = std::make_shared<StrictMock<MockHttpAdapter>>();
        config.statusPageUrl.clear();
        config.apiUrl = "https://api.example/vs";
        request.destinationDir = tmp.path() / "out";
    }

    std::unique_ptr<DownloadOrchestrator> makeOrchestrator() {
        return std::make_unique<DownloadOrchestrator>(config, http, makeHtmlPageExtractor(),
                                                      nullptr, timing.timing());
    }

    // Pages and API answers for an album of `slugs`, served by URL.
    void serveSite(const std::vector<std::string>& slugs) {
        EXPECT_CALL(*http, get(_, _))
            .WillRepeatedly([slugs](std::string_view url,
                                    const RequestOptions&) -> Expected<HttpResponse> {
                const std::string u(url);
                if (u.find("/a/") != std::string::npos)
                    return response(200, albumPage(slugs));
                const auto slash = u.rfind('/');
                return response(200, itemPage(u.substr(slash + 1)));
            });
        EXPECT_CALL(*http, post(_, _, _, _))
            .WillRepeatedly([](std::string_view, std::string_view body, std::string_view,
                               const RequestOptions&) -> Expected<HttpResponse> {
                return response(200, apiBodyFor(json::parse(body).at("slug").get<std::string>()));
            });
    }

    void serveFiles() {
        EXPECT_CALL(*http, fetchStream(_, _, _))
            .WillRepeatedly([](std::string_view url, const RequestOptions& opts,
                               const StreamHandlers& h) -> Expected<void> {
                const auto body = contentFor(url);
                return streamBody(body, body.size())(url, opts, h);
            });
    }

    TempDirScope tmp = TempDirScope::unique_under("bunkget_orchestrator");
    std::shared_ptr<StrictMock<MockHttpAdapter>> http;
    DownloaderConfig config;
    RecordingTiming timing;
    DownloadRequest request;
};

void expectCountsConsistent(const AggregateResult& r) {
    EXPECT_EQ(r.succeeded + r.failed + r.skipped, r.attempted);
    EXPECT_EQ(r.downloadedFiles.size(), r.succeeded);
    EXPECT_EQ(r.failedFiles.size(), r.failed);
    EXPECT_EQ(r.skippedFiles.size(), r.skipped);
}

} // namespace

TEST_F(DownloadOrchestratorTest, UnsupportedHostFailsWithoutIo) {
    request.url = "https://example.com/f/abc";
    auto r = makeOrchestrator()->downloadAsset(request);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    EXPECT_FALSE(fs::exists(request.destinationDir));
}

TEST_F(DownloadOrchestratorTest, UnknownKindFailsWithoutIo) {
    request.url = "https://bunkr.cr/x/abc";
    auto r = makeOrchestrator()->downloadAsset(request);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::UnsupportedResource);
    EXPECT_FALSE(fs::exists(request.destinationDir));
}

TEST_F(DownloadOrchestratorTest, SingleFileIsDownloaded) {
    serveSite({});
    serveFiles();
    request.url = "https://bunkr.cr/f/alpha";

    auto r = makeOrchestrator()->downloadAsset(request);
    ASSERT_TRUE(r.ok());
    const auto& res = r.value();
    EXPECT_TRUE(res.success);
    EXPECT_EQ(res.kind, ResourceKind::File);
    EXPECT_EQ(res.attempted, 1u);
    EXPECT_EQ(res.succeeded, 1u);
    EXPECT_THAT(res.downloadedFiles, UnorderedElementsAre("alpha.mp4"));
    EXPECT_FALSE(res.error.has_value());
    EXPECT_EQ(read_file(request.destinationDir / "alpha.mp4"),
              contentFor("https://kebab.cdn.example/alpha.mp4"));
    expectCountsConsistent(res);
}

TEST_F(DownloadOrchestratorTest, UnresolvableItemIsReportedAsFailed) {
    EXPECT_CALL(*http, get(_, _)).WillOnce(::testing::Return(response(404, "gone")));
    request.url = "https://bunkr.cr/v/missing";

    auto r = makeOrchestrator()->downloadAsset(request);
    ASSERT_TRUE(r.ok());
    const auto& res = r.value();
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.failed, 1u);
    EXPECT_THAT(res.failedFiles, UnorderedElementsAre("https://bunkr.cr/v/missing"));
    ASSERT_TRUE(res.error.has_value());
    EXPECT_EQ(res.error->code, ErrorCode::ResolutionFailed);
    expectCountsConsistent(res);
}

TEST_F(DownloadOrchestratorTest, ExistingFilesAreSkippedWithoutDownloading) {
    serveSite({"alpha", "beta", "gamma"});
    fs::create_directories(request.destinationDir);
    tmp.write("out/alpha.mp4", "already here");
    tmp.write("out/beta.mp4", "already here");
    EXPECT_CALL(*http, fetchStream(_, _, _))
        .WillOnce(streamBody("gamma bytes", 11));
    request.url = "https://bunkr.cr/a/holiday";

    auto r = makeOrchestrator()->downloadAsset(request);
    ASSERT_TRUE(r.ok());
    const auto& res = r.value();
    EXPECT_TRUE(res.success);
    EXPECT_EQ(res.albumName.value_or(""), "Holiday");
    EXPECT_EQ(res.attempted, 3u);
    EXPECT_EQ(res.skipped, 2u);
    EXPECT_EQ(res.succeeded, 1u);
    EXPECT_THAT(res.skippedFiles, UnorderedElementsAre("alpha.mp4", "beta.mp4"));
    EXPECT_EQ(read_file(request.destinationDir / "alpha.mp4"), "already here");
    // Pauses between the three items, none before the first.
    EXPECT_EQ(timing.sleeps.size(), 2u);
    expectCountsConsistent(res);
}

TEST_F(DownloadOrchestratorTest, IgnoreAndIncludeFilters) {
    serveSite({"alpha", "beta", "gamma"});
    serveFiles();
    request.url = "https://bunkr.cr/a/holiday";
    request.ignorePatterns = {"beta"};
    request.includePatterns = {"alp", "bet"};

    auto r = makeOrchestrator()->downloadAsset(request);
    ASSERT_TRUE(r.ok());
    const auto& res = r.value();
    EXPECT_THAT(res.downloadedFiles, UnorderedElementsAre("alpha.mp4"));
    EXPECT_THAT(res.skippedFiles, UnorderedElementsAre("beta.mp4", "gamma.mp4"));
    EXPECT_FALSE(fs::exists(request.destinationDir / "gamma.mp4"));
    expectCountsConsistent(res);
}

TEST_F(DownloadOrchestratorTest, ConcurrentAlbumDownloadsEverything) {
    const std::vector<std::string> slugs{"s1", "s2", "s3", "s4", "s5", "s6"};
    serveSite(slugs);
    serveFiles();
    config.concurrency = 3;
    request.url = "https://bunkr.cr/a/many";
    request.concurrent = true;

    auto r = makeOrchestrator()->downloadAsset(request);
    ASSERT_TRUE(r.ok());
    const auto& res = r.value();
    EXPECT_TRUE(res.success);
    EXPECT_EQ(res.succeeded, slugs.size());
    for (const auto& s : slugs)
        EXPECT_TRUE(fs::exists(request.destinationDir / (s + ".mp4"))) << s;
    EXPECT_TRUE(timing.sleeps.empty());
    expectCountsConsistent(res);
}

TEST_F(DownloadOrchestratorTest, PartialAlbumFailureStillSucceeds) {
    serveSite({"alpha", "beta"});
    EXPECT_CALL(*http, fetchStream(_, _, _))
        .WillRepeatedly([](std::string_view url, const RequestOptions& opts,
                           const StreamHandlers& h) -> Expected<void> {
            if (std::string(url).find("beta") != std::string::npos)
                return httpError(502);
            return streamBody("ok", 2)(url, opts, h);
        });
    request.url = "https://bunkr.cr/a/holiday";

    auto r = makeOrchestrator()->downloadAsset(request);
    ASSERT_TRUE(r.ok());
    const auto& res = r.value();
    EXPECT_TRUE(res.success);
    EXPECT_EQ(res.failed, 1u);
    EXPECT_THAT(res.failedFiles, UnorderedElementsAre("beta.mp4"));
    EXPECT_THAT(res.downloadedFiles, UnorderedElementsAre("alpha.mp4"));
    expectCountsConsistent(res);
}

TEST_F(DownloadOrchestratorTest, EmptyAlbumIsAnError) {
    serveSite({});
    request.url = "https://bunkr.cr/a/empty";

    auto r = makeOrchestrator()->downloadAsset(request);
    ASSERT_TRUE(r.ok());
    const auto& res = r.value();
    EXPECT_FALSE(res.success);
    EXPECT_EQ(res.attempted, 0u);
    ASSERT_TRUE(res.error.has_value());
    EXPECT_THAT(res.error->message, HasSubstr("No items"));
}

TEST_F(DownloadOrchestratorTest, SharedHealthTrackerSkipsOfflineNodes) {
    serveSite({});
    auto tracker = std::make_shared<ServerHealthTracker>(http, makeHtmlPageExtractor(), config);
    tracker->markOffline("https://kebab.cdn.example/");
    DownloadOrchestrator orchestrator(config, http, makeHtmlPageExtractor(), tracker,
                                      timing.timing());
    request.url = "https://bunkr.cr/f/alpha";

    auto r = orchestrator.downloadAsset(request);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value().failed, 1u);
    EXPECT_EQ(&orchestrator.health(), tracker.get());
    EXPECT_FALSE(fs::exists(request.destinationDir / "alpha.mp4"));
}
