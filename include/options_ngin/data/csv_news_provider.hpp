// include/options_ngin/data/csv_news_provider.hpp
#pragma once

#include <atomic>
#include <string>
#include <vector>
#include "options_ngin/data/conversion_utils.hpp"
#include "options_ngin/data/csv_snapshot_config.hpp"
#include "options_ngin/data/news_provider.hpp"

namespace options_ngin {

/**
 * @brief Headlines served from a CSV snapshot
 *
 * In TICKER mode a row matches when its ticker column equals the ticker or
 * the ticker appears as a whole word of its query column. In QUERY mode a
 * row matches when its query column equals the query (case-insensitive);
 * if none does, rows whose title contains any "OR"-separated term of the
 * query match instead. Matches keep file order and are de-duplicated by url
 * (by title when the url is empty).
 */
class CsvNewsProvider : public NewsProvider {
public:
    CsvNewsProvider(CsvSnapshotConfig config, NewsSource source);

    /**
     * @brief Load the headlines file
     */
    Result<void> initialize();

    Result<std::vector<Headline>> get_headlines(const std::string& ticker_or_query,
                                                size_t count) override;

    NewsSource source() const {
        return source_;
    }

    size_t row_count() const {
        return rows_.size();
    }

    /**
     * @brief Split "A OR B OR C" into trimmed terms
     */
    static std::vector<std::string> split_or_terms(const std::string& query);

private:
    bool matches_ticker(const NewsRow& row, const std::string& ticker) const;

    CsvSnapshotConfig config_;
    NewsSource source_;
    std::vector<NewsRow> rows_;
    std::atomic<bool> initialized_{false};
};

}  // namespace options_ngin
