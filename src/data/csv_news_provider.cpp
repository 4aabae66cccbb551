// src/data/csv_news_provider.cpp
#include "options_ngin/data/csv_news_provider.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_set>
#include "options_ngin/core/logger.hpp"

namespace options_ngin {

namespace {

std::string to_lower(const std::string& text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return text.substr(begin, end - begin);
}

// Tickers may contain '.', '-' and '^' (BRK.B, ^SPX)
bool is_ticker_char(char c) {
    unsigned char uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '.' || c == '-' || c == '^';
}

bool contains_word(const std::string& haystack, const std::string& word) {
    if (word.empty()) {
        return false;
    }
    size_t pos = haystack.find(word);
    while (pos != std::string::npos) {
        bool left_ok = pos == 0 || !is_ticker_char(haystack[pos - 1]);
        size_t after = pos + word.size();
        bool right_ok = after >= haystack.size() || !is_ticker_char(haystack[after]);
        if (left_ok && right_ok) {
            return true;
        }
        pos = haystack.find(word, pos + 1);
    }
    return false;
}

}  // namespace

CsvNewsProvider::CsvNewsProvider(CsvSnapshotConfig config, NewsSource source)
    : config_(std::move(config)), source_(source) {}

Result<void> CsvNewsProvider::initialize() {
    auto table = DataConversionUtils::read_csv(config_.headlines_path(),
                                               DataConversionUtils::news_column_types());
    if (table.is_error()) {
        return forward_error<void>(*table.error(), "CsvNewsProvider",
                                   "Failed to load headlines");
    }

    auto rows = DataConversionUtils::arrow_table_to_news(table.value());
    if (rows.is_error()) {
        return forward_error<void>(*rows.error(), "CsvNewsProvider",
                                   "Invalid headlines file " + config_.headlines_path());
    }

    rows_ = rows.take();
    initialized_.store(true, std::memory_order_release);
    INFO("Loaded " + std::to_string(rows_.size()) + " headlines from " +
         config_.headlines_path() + " (" + news_source_to_string(source_) + " mode)");
    return Result<void>();
}

std::vector<std::string> CsvNewsProvider::split_or_terms(const std::string& query) {
    std::vector<std::string> terms;
    std::string current;
    std::string word;
    auto flush_word = [&]() {
        if (word.empty()) {
            return;
        }
        if (to_lower(word) == "or") {
            std::string term = trim(current);
            if (!term.empty()) {
                terms.push_back(term);
            }
            current.clear();
        } else {
            if (!current.empty()) {
                current.push_back(' ');
            }
            current += word;
        }
        word.clear();
    };
    for (char c : query) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            flush_word();
        } else {
            word.push_back(c);
        }
    }
    flush_word();
    std::string last = trim(current);
    if (!last.empty()) {
        terms.push_back(last);
    }
    return terms;
}

bool CsvNewsProvider::matches_ticker(const NewsRow& row, const std::string& ticker) const {
    if (!row.ticker.empty()) {
        return to_lower(row.ticker) == to_lower(ticker);
    }
    return contains_word(to_lower(row.query), to_lower(ticker));
}

Result<std::vector<Headline>> CsvNewsProvider::get_headlines(const std::string& ticker_or_query,
                                                             size_t count) {
    if (!initialized_.load(std::memory_order_acquire)) {
        return make_error<std::vector<Headline>>(ErrorCode::NOT_INITIALIZED,
                                                 "Provider not initialized", "CsvNewsProvider");
    }

    std::vector<const NewsRow*> matched;
    if (source_ == NewsSource::TICKER) {
        for (const auto& row : rows_) {
            if (matches_ticker(row, ticker_or_query)) {
                matched.push_back(&row);
            }
        }
    } else {
        const std::string wanted = to_lower(trim(ticker_or_query));
        for (const auto& row : rows_) {
            if (to_lower(trim(row.query)) == wanted) {
                matched.push_back(&row);
            }
        }
        if (matched.empty()) {
            std::vector<std::string> terms;
            for (const auto& term : split_or_terms(ticker_or_query)) {
                terms.push_back(to_lower(term));
            }
            for (const auto& row : rows_) {
                const std::string title = to_lower(row.headline.text);
                for (const auto& term : terms) {
                    if (title.find(term) != std::string::npos) {
                        matched.push_back(&row);
                        break;
                    }
                }
            }
            DEBUG("No rows for query '" + ticker_or_query + "', matched " +
                  std::to_string(matched.size()) + " by title terms");
        }
    }

    std::vector<Headline> headlines;
    std::unordered_set<std::string> seen;
    for (const NewsRow* row : matched) {
        if (headlines.size() >= count) {
            break;
        }
        const std::string& key = row->headline.url.empty() ? row->headline.text : row->headline.url;
        if (!key.empty() && !seen.insert(key).second) {
            continue;
        }
        headlines.push_back(row->headline);
    }
    return headlines;
}

}  // namespace options_ngin
