#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "core/test_base.hpp"
#include "options_ngin/core/time_utils.hpp"
#include "options_ngin/data/csv_market_data_provider.hpp"
#include "options_ngin/data/csv_news_provider.hpp"

using namespace options_ngin;

class CsvProvidersTest : public options_ngin::testing::TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        test_dir = std::filesystem::temp_directory_path() / "options_ngin_csv_provider_test";
        std::filesystem::create_directories(test_dir / "chains");
        config.data_directory = test_dir.string();
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
        TestBase::TearDown();
    }

    void write_file(const std::filesystem::path& relative, const std::string& content) {
        std::ofstream out(test_dir / relative);
        out << content;
    }

    CsvSnapshotConfig sample_config() const {
        CsvSnapshotConfig sample;
        sample.data_directory = "data/sample";
        return sample;
    }

    std::filesystem::path test_dir;
    CsvSnapshotConfig config;
};

TEST_F(CsvProvidersTest, QuoteLookup) {
    write_file("quotes.csv",
               "ticker,spot,timestamp\n"
               "SPY,589.00,2025-01-10T20:00:00Z\n"
               "SPY,590.25,2025-01-10T21:00:00Z\n");
    CsvMarketDataProvider provider(config);

    auto before = provider.get_quote("SPY");
    ASSERT_TRUE(before.is_error());
    EXPECT_EQ(before.error()->code(), ErrorCode::NOT_INITIALIZED);

    ASSERT_TRUE(provider.initialize().is_ok());
    EXPECT_EQ(provider.quote_count(), 1u);

    auto quote = provider.get_quote("SPY");
    ASSERT_TRUE(quote.is_ok());
    EXPECT_DOUBLE_EQ(quote.value().spot, 590.25);

    auto unknown = provider.get_quote("QQQ");
    ASSERT_TRUE(unknown.is_error());
    EXPECT_EQ(unknown.error()->code(), ErrorCode::DATA_NOT_FOUND);
}

TEST_F(CsvProvidersTest, MissingQuotesFileFailsInitialize) {
    CsvMarketDataProvider provider(config);
    auto result = provider.initialize();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(CsvProvidersTest, ChainLimitedToNearestExpirations) {
    write_file("quotes.csv", "ticker,spot,timestamp\nXYZ,100,2025-01-10T21:00:00Z\n");
    write_file("chains/XYZ.csv",
               "expiration,option_type,strike\n"
               "2025-02-21,call,100\n"
               "2025-01-17,call,100\n"
               "2025-01-24,put,95\n"
               "2025-01-17,put,95\n");
    CsvMarketDataProvider provider(config);
    ASSERT_TRUE(provider.initialize().is_ok());

    auto two = provider.get_option_chain("XYZ", 2);
    ASSERT_TRUE(two.is_ok()) << two.error()->what();
    ASSERT_EQ(two.value().size(), 3u);
    // File order is kept among the selected expirations
    EXPECT_EQ(core::format_date(two.value()[0].id.expiration), "2025-01-17");
    EXPECT_EQ(two.value()[0].id.type, OptionType::CALL);
    EXPECT_EQ(core::format_date(two.value()[1].id.expiration), "2025-01-24");
    EXPECT_EQ(two.value()[2].id.type, OptionType::PUT);

    auto all = provider.get_option_chain("XYZ", 6);
    ASSERT_TRUE(all.is_ok());
    EXPECT_EQ(all.value().size(), 4u);

    auto none = provider.get_option_chain("XYZ", 0);
    ASSERT_TRUE(none.is_ok());
    EXPECT_TRUE(none.value().empty());
}

TEST_F(CsvProvidersTest, ChainFailuresAreMarketDataErrors) {
    write_file("quotes.csv", "ticker,spot,timestamp\nXYZ,100,2025-01-10T21:00:00Z\n");
    write_file("chains/BAD.csv", "expiration,option_type,strike\n2025-01-17,butterfly,100\n");
    CsvMarketDataProvider provider(config);
    ASSERT_TRUE(provider.initialize().is_ok());

    auto missing = provider.get_option_chain("XYZ", 6);
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error()->code(), ErrorCode::MARKET_DATA_ERROR);

    auto malformed = provider.get_option_chain("BAD", 6);
    ASSERT_TRUE(malformed.is_error());
    EXPECT_EQ(malformed.error()->code(), ErrorCode::MARKET_DATA_ERROR);
}

TEST_F(CsvProvidersTest, SampleSnapshotLoads) {
    CsvMarketDataProvider provider(sample_config());
    ASSERT_TRUE(provider.initialize().is_ok());
    EXPECT_EQ(provider.quote_count(), 3u);

    auto chain = provider.get_option_chain("SPY", 6);
    ASSERT_TRUE(chain.is_ok()) << chain.error()->what();
    EXPECT_EQ(chain.value().size(), 12u);

    auto nearest = provider.get_option_chain("SPY", 2);
    ASSERT_TRUE(nearest.is_ok());
    EXPECT_EQ(nearest.value().size(), 7u);

    EXPECT_TRUE(provider.get_option_chain("MSFT", 6).is_error());
}

TEST_F(CsvProvidersTest, NewsByTickerColumn) {
    CsvNewsProvider provider(sample_config(), NewsSource::TICKER);

    auto before = provider.get_headlines("AAPL", 10);
    ASSERT_TRUE(before.is_error());
    EXPECT_EQ(before.error()->code(), ErrorCode::NOT_INITIALIZED);

    ASSERT_TRUE(provider.initialize().is_ok());
    EXPECT_EQ(provider.row_count(), 11u);

    auto apple = provider.get_headlines("AAPL", 10);
    ASSERT_TRUE(apple.is_ok());
    ASSERT_EQ(apple.value().size(), 4u);
    EXPECT_EQ(apple.value()[0].text, "Apple beats estimates as iPhone sales surge");

    auto limited = provider.get_headlines("SPY", 2);
    ASSERT_TRUE(limited.is_ok());
    EXPECT_EQ(limited.value().size(), 2u);

    auto nothing = provider.get_headlines("TSLA", 10);
    ASSERT_TRUE(nothing.is_ok());
    EXPECT_TRUE(nothing.value().empty());
}

TEST_F(CsvProvidersTest, NewsByTickerWordInQuery) {
    write_file("headlines.csv",
               "title,source,publishedAt,url,query\n"
               "Index rallies,AP,2025-01-10T15:00:00Z,https://x/1,SPY OR S&P 500\n"
               "Growth fund gains,AP,2025-01-10T15:00:00Z,https://x/2,SPYG\n"
               "Berkshire steady,AP,2025-01-10T15:00:00Z,https://x/3,BRK.B\n");
    CsvNewsProvider provider(config, NewsSource::TICKER);
    ASSERT_TRUE(provider.initialize().is_ok());

    auto spy = provider.get_headlines("spy", 10);
    ASSERT_TRUE(spy.is_ok());
    ASSERT_EQ(spy.value().size(), 1u);
    EXPECT_EQ(spy.value()[0].text, "Index rallies");

    auto brk = provider.get_headlines("BRK.B", 10);
    ASSERT_TRUE(brk.is_ok());
    EXPECT_EQ(brk.value().size(), 1u);
}

TEST_F(CsvProvidersTest, NewsByQuery) {
    CsvNewsProvider provider(sample_config(), NewsSource::QUERY);
    ASSERT_TRUE(provider.initialize().is_ok());

    auto exact = provider.get_headlines("spy or s&p 500", 100);
    ASSERT_TRUE(exact.is_ok());
    EXPECT_EQ(exact.value().size(), 5u);

    // No row carries this query, so titles are searched for each term
    auto terms = provider.get_headlines("Microsoft OR Tesla", 100);
    ASSERT_TRUE(terms.is_ok());
    ASSERT_EQ(terms.value().size(), 2u);
    EXPECT_EQ(terms.value()[0].text, "Microsoft cloud growth remains robust");
}

TEST_F(CsvProvidersTest, NewsDeduplicated) {
    write_file("headlines.csv",
               "title,source,publishedAt,url,query,ticker\n"
               "Stocks rally,AP,2025-01-10T15:00:00Z,https://x/1,SPY,SPY\n"
               "Stocks rally (update),AP,2025-01-10T16:00:00Z,https://x/1,SPY,SPY\n"
               "No link story,AP,2025-01-10T15:00:00Z,,SPY,SPY\n"
               "No link story,Wire,2025-01-10T15:30:00Z,,SPY,SPY\n"
               "Stocks slip,AP,2025-01-10T17:00:00Z,https://x/2,SPY,SPY\n");
    CsvNewsProvider provider(config, NewsSource::TICKER);
    ASSERT_TRUE(provider.initialize().is_ok());

    auto headlines = provider.get_headlines("SPY", 10);
    ASSERT_TRUE(headlines.is_ok());
    ASSERT_EQ(headlines.value().size(), 3u);
    EXPECT_EQ(headlines.value()[0].text, "Stocks rally");
    EXPECT_EQ(headlines.value()[1].text, "No link story");
    EXPECT_EQ(headlines.value()[2].text, "Stocks slip");
}

TEST_F(CsvProvidersTest, SplitOrTerms) {
    auto terms = CsvNewsProvider::split_or_terms("SPY OR S&P 500 or  index funds");
    std::vector<std::string> expected = {"SPY", "S&P 500", "index funds"};
    EXPECT_EQ(terms, expected);

    EXPECT_EQ(CsvNewsProvider::split_or_terms("ORACLE"), std::vector<std::string>{"ORACLE"});
    EXPECT_TRUE(CsvNewsProvider::split_or_terms("  OR  ").empty());
}

TEST_F(CsvProvidersTest, SnapshotConfigPaths) {
    CsvSnapshotConfig paths;
    paths.data_directory = "snap";
    EXPECT_EQ(paths.chain_path("SPY"),
              (std::filesystem::path("snap") / "chains" / "SPY.csv").string());
    EXPECT_EQ(paths.quotes_path(), (std::filesystem::path("snap") / "quotes.csv").string());

    paths.data_directory.clear();
    EXPECT_TRUE(paths.validate().is_error());
}
