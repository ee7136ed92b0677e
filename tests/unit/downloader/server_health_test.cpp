#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <bunkget/downloader/server_health.hpp>

#include "support/mock_http_adapter.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace bunkget::downloader;
using bunkget::test_support::MockHttpAdapter;
using bunkget::test_support::response;
using bunkget::test_support::transportError;
using ::testing::_;
using ::testing::Return;

namespace {

const char* kRow = "flex items-center gap-4 py-4 border-b border-soft last:border-b-0";

std::string statusPage(std::initializer_list<std::pair<const char*, const char*>> rows) {
    std::string html = "<html><body>";
    for (const auto& [name, state] : rows) {
        html += "<div class=\"";
        html += kRow;
        html += "\"><p>";
        html += name;
        html += "</p><span>";
        html += state;
        html += "</span></div>";
    }
    html += "</body></html>";
    return html;
}

class ServerHealthTest : public ::testing::Test {
protected:
    void SetUp() override {
        http = std::make_shared<::testing::StrictMock<MockHttpAdapter>>();
        config.statusPageUrl = "https://status.example/";
    }

    std::unique_ptr<ServerHealthTracker> makeTracker() {
        return std::make_unique<ServerHealthTracker>(http, makeHtmlPageExtractor(), config,
                                                     [this] { return now; });
    }

    std::shared_ptr<::testing::StrictMock<MockHttpAdapter>> http;
    DownloaderConfig config;
    std::chrono::steady_clock::time_point now{std::chrono::hours(1)};
};

} // namespace

TEST_F(ServerHealthTest, SubdomainIsCapitalizedFirstLabel) {
    EXPECT_EQ(ServerHealthTracker::subdomainOf("https://kebab.bunkr.ru/file.mp4"), "Kebab");
    EXPECT_EQ(ServerHealthTracker::subdomainOf("https://BURGER-2.cdn.net/x"), "Burger-2");
}

TEST_F(ServerHealthTest, FetchesAndParsesStatusPage) {
    EXPECT_CALL(*http, get(_, _))
        .WillOnce(Return(response(200, statusPage({{"Kebab", "Operational"},
                                                    {"Burger", "Non-operational"},
                                                    {"Taco", "Degraded"}}))));
    auto tracker = makeTracker();

    auto status = tracker->status();
    ASSERT_EQ(status.size(), 3u);
    EXPECT_EQ(status.at("Kebab").state, ServerState::Operational);
    EXPECT_EQ(status.at("Burger").state, ServerState::NonOperational);
    EXPECT_EQ(status.at("Taco").stateText, "Degraded");

    auto offline = tracker->offlineServers();
    EXPECT_EQ(offline.size(), 2u);
    EXPECT_TRUE(tracker->isOffline("https://burger.bunkr.ru/x.mp4"));
    EXPECT_FALSE(tracker->isOffline("https://kebab.bunkr.ru/x.mp4"));
    EXPECT_FALSE(tracker->isOffline("https://unlisted.bunkr.ru/x.mp4"));
}

TEST_F(ServerHealthTest, CacheIsReusedWithinTtlAndRefreshedAfter) {
    EXPECT_CALL(*http, get(_, _))
        .WillOnce(Return(response(200, statusPage({{"Kebab", "Operational"}}))))
        .WillOnce(Return(response(200, statusPage({{"Kebab", "Non-operational"}}))));
    auto tracker = makeTracker();

    EXPECT_FALSE(tracker->isOffline("https://kebab.x/y"));
    now += std::chrono::seconds(299);
    EXPECT_FALSE(tracker->isOffline("https://kebab.x/y"));
    now += std::chrono::seconds(2);
    EXPECT_TRUE(tracker->isOffline("https://kebab.x/y"));
}

TEST_F(ServerHealthTest, FailedFetchKeepsPreviousCache) {
    EXPECT_CALL(*http, get(_, _))
        .WillOnce(Return(response(200, statusPage({{"Kebab", "Non-operational"}}))))
        .WillOnce(Return(transportError()))
        .WillOnce(Return(response(500, "oops")));
    auto tracker = makeTracker();

    EXPECT_EQ(tracker->status().size(), 1u);
    now += std::chrono::minutes(10);
    auto afterError = tracker->status();
    ASSERT_EQ(afterError.size(), 1u);
    EXPECT_EQ(afterError.at("Kebab").state, ServerState::NonOperational);
    auto afterHttpError = tracker->status();
    EXPECT_EQ(afterHttpError.size(), 1u);
}

TEST_F(ServerHealthTest, FailureWithEmptyCacheReturnsEmpty) {
    EXPECT_CALL(*http, get(_, _)).WillOnce(Return(transportError()));
    auto tracker = makeTracker();
    EXPECT_TRUE(tracker->status().empty());
}

TEST_F(ServerHealthTest, EmptyStatusUrlNeverFetches) {
    config.statusPageUrl.clear();
    auto tracker = makeTracker();
    EXPECT_TRUE(tracker->status().empty());
    EXPECT_FALSE(tracker->isOffline("https://kebab.x/y"));
}

TEST_F(ServerHealthTest, MarkOfflineBypassesTtl) {
    EXPECT_CALL(*http, get(_, _))
        .WillOnce(Return(response(200, statusPage({{"Kebab", "Operational"}}))));
    auto tracker = makeTracker();

    EXPECT_FALSE(tracker->isOffline("https://kebab.x/y"));
    EXPECT_EQ(tracker->markOffline("https://kebab.x/y"), "Kebab");
    EXPECT_TRUE(tracker->isOffline("https://kebab.x/other"));
    EXPECT_EQ(tracker->status().at("Kebab").stateText, "Non-operational");
}

TEST_F(ServerHealthTest, MarkOfflineWithoutStatusPage) {
    config.statusPageUrl.clear();
    auto tracker = makeTracker();
    tracker->markOffline("https://burger.example/x");
    EXPECT_TRUE(tracker->isOffline("https://burger.example/y"));
}

TEST_F(ServerHealthTest, ConcurrentStaleReadersRefreshOnce) {
    EXPECT_CALL(*http, get(_, _)).WillOnce([](std::string_view, const RequestOptions&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        return response(200, statusPage({{"Kebab", "Operational"}}));
    });
    auto tracker = makeTracker();

    std::atomic<int> sized{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            if (tracker->status().size() == 1)
                ++sized;
        });
    }
    for (auto& t : threads)
        t.join();
    EXPECT_EQ(sized.load(), 8);
}
