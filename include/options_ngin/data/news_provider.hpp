// include/options_ngin/data/news_provider.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>
#include "options_ngin/core/error.hpp"
#include "options_ngin/core/types.hpp"

namespace options_ngin {

/**
 * @brief How headlines are keyed
 */
enum class NewsSource {
    TICKER,  // headlines about the ticker itself
    QUERY    // one free-text query shared by every ticker
};

inline std::string news_source_to_string(NewsSource source) {
    return source == NewsSource::TICKER ? "ticker" : "query";
}

inline std::optional<NewsSource> news_source_from_string(const std::string& text) {
    if (text == "ticker")
        return NewsSource::TICKER;
    if (text == "query")
        return NewsSource::QUERY;
    return std::nullopt;
}

/**
 * @brief Source of raw headlines
 *
 * Returns at most count headlines in provider order. An empty result is a
 * valid answer, distinct from an error.
 */
class NewsProvider {
public:
    virtual ~NewsProvider() = default;

    virtual Result<std::vector<Headline>> get_headlines(const std::string& ticker_or_query,
                                                        size_t count) = 0;
};

}  // namespace options_ngin
