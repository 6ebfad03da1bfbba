#include <gtest/gtest.h>
#include "market/feed_csv.h"
#include "market/market_feed.h"
#include "test_helpers.h"
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

using namespace hedging;
using hedging::testing_support::makeSnapshot;

class MarketFeedTest : public ::testing::Test {
protected:
    std::vector<MarketSnapshot> validPath() {
        return {
            makeSnapshot("2024-03-01", 100.0, 0.20, 0.040, 0.010),
            makeSnapshot("2024-03-04", 98.5, 0.23, 0.041, 0.012),
            makeSnapshot("2024-03-05", 97.0, 0.26, 0.042, 0.014),
        };
    }
};

TEST_F(MarketFeedTest, AcceptsValidPath) {
    MarketFeed feed(validPath());
    ASSERT_EQ(feed.size(), 3u);
    EXPECT_EQ(feed.front().date, Date::parse("2024-03-01"));
    EXPECT_EQ(feed.back().date, Date::parse("2024-03-05"));
    EXPECT_DOUBLE_EQ(feed[1].spot, 98.5);
    EXPECT_THROW(feed.at(3), std::out_of_range);
}

TEST_F(MarketFeedTest, SingleSnapshotIsValid) {
    MarketFeed feed({makeSnapshot("2024-03-01", 100.0)});
    EXPECT_EQ(feed.size(), 1u);
}

TEST_F(MarketFeedTest, RejectsEmptyFeed) {
    EXPECT_THROW(MarketFeed(std::vector<MarketSnapshot>{}), std::invalid_argument);
}

TEST_F(MarketFeedTest, RejectsOutOfDomainValues) {
    auto path = validPath();
    path[1].spot = 0.0;
    EXPECT_THROW(MarketFeed{path}, std::invalid_argument);

    path = validPath();
    path[2].vol = -0.1;
    EXPECT_THROW(MarketFeed{path}, std::invalid_argument);

    path = validPath();
    path[0].credit_spread = -0.001;
    EXPECT_THROW(MarketFeed{path}, std::invalid_argument);

    path = validPath();
    path[1].rate = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW(MarketFeed{path}, std::invalid_argument);
}

TEST_F(MarketFeedTest, NegativeRatesAreAllowed) {
    auto path = validPath();
    path[2].rate = -0.005;
    EXPECT_NO_THROW(MarketFeed{path});
}

TEST_F(MarketFeedTest, RejectsNonIncreasingDates) {
    auto path = validPath();
    path[2].date = path[1].date;
    EXPECT_THROW(MarketFeed{path}, std::invalid_argument);

    path = validPath();
    std::swap(path[0], path[1]);
    EXPECT_THROW(MarketFeed{path}, std::invalid_argument);
}

class FeedCsvTest : public ::testing::Test {};

TEST_F(FeedCsvTest, ReadsRowsAndSkipsBlankLines) {
    std::istringstream iss(
        "date,spot,vol,sofr,credit_spread\n"
        "2024-03-01,100,0.2,0.04,0.01\n"
        "\n"
        "2024-03-04, 95.5 ,0.25,0.041,0.015\r\n");

    MarketFeed feed = readFeedCsv(iss, "test.csv");
    ASSERT_EQ(feed.size(), 2u);
    EXPECT_DOUBLE_EQ(feed[1].spot, 95.5);
    EXPECT_DOUBLE_EQ(feed[1].vol, 0.25);
    EXPECT_DOUBLE_EQ(feed[1].rate, 0.041);
    EXPECT_DOUBLE_EQ(feed[1].credit_spread, 0.015);
}

TEST_F(FeedCsvTest, ReportsLineOfBadValue) {
    std::istringstream iss(
        "date,spot,vol,sofr,credit_spread\n"
        "2024-03-01,100,0.2,0.04,0.01\n"
        "2024-03-04,abc,0.25,0.041,0.015\n");

    try {
        readFeedCsv(iss, "feed.csv");
        FAIL() << "Expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("feed.csv:3"), std::string::npos) << e.what();
    }
}

TEST_F(FeedCsvTest, RejectsWrongColumnCount) {
    std::istringstream iss(
        "date,spot,vol,sofr,credit_spread\n"
        "2024-03-01,100,0.2,0.04\n");
    EXPECT_THROW(readFeedCsv(iss), std::runtime_error);
}

TEST_F(FeedCsvTest, RejectsEmptyInput) {
    std::istringstream empty("");
    EXPECT_THROW(readFeedCsv(empty), std::runtime_error);

    std::istringstream header_only("date,spot,vol,sofr,credit_spread\n");
    EXPECT_THROW(readFeedCsv(header_only), std::invalid_argument);
}

TEST_F(FeedCsvTest, WrittenFeedReadsBack) {
    MarketFeed original({
        makeSnapshot("2024-03-01", 100.0, 0.20, 0.04, 0.01),
        makeSnapshot("2024-03-04", 93.123456789, 0.2871, 0.0395, 0.0125),
    });

    std::stringstream ss;
    writeFeedCsv(original, ss);
    MarketFeed reloaded = readFeedCsv(ss);

    ASSERT_EQ(reloaded.size(), original.size());
    EXPECT_EQ(reloaded[1].date, original[1].date);
    EXPECT_NEAR(reloaded[1].spot, original[1].spot, 1e-9);
    EXPECT_NEAR(reloaded[1].vol, original[1].vol, 1e-12);
}

TEST_F(FeedCsvTest, MissingFileThrows) {
    EXPECT_THROW(loadFeedCsv("/nonexistent/path/feed.csv"), std::runtime_error);
}
