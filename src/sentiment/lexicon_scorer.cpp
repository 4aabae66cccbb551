// src/sentiment/lexicon_scorer.cpp
#include "options_ngin/sentiment/lexicon_scorer.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include "options_ngin/sentiment/text_utils.hpp"

namespace options_ngin {
namespace sentiment {

namespace {

// Valences on the usual -4..4 rule-based scale
const std::pair<const char*, double> kDefaultValences[] = {
    // Positive
    {"bullish", 2.4},      {"rally", 1.9},       {"rallies", 1.9},     {"rallying", 1.9},
    {"breakout", 1.6},     {"breakouts", 1.6},   {"surge", 2.0},       {"surges", 2.0},
    {"surged", 2.0},       {"soar", 2.3},        {"soars", 2.3},       {"soared", 2.3},
    {"soaring", 2.3},      {"gain", 1.5},        {"gains", 1.5},       {"gained", 1.5},
    {"profit", 1.8},       {"profits", 1.8},     {"profitable", 1.9},  {"win", 2.0},
    {"wins", 2.0},         {"winning", 2.1},     {"growth", 1.7},      {"grow", 1.3},
    {"strong", 1.8},       {"stronger", 1.8},    {"recovery", 1.6},    {"recovers", 1.5},
    {"optimistic", 2.0},   {"optimism", 2.0},    {"bull", 1.5},        {"bulls", 1.5},
    {"undervalued", 1.4},  {"breakthrough", 2.2}, {"beat", 1.7},       {"beats", 1.7},
    {"beating", 1.7},      {"outperform", 1.9},  {"outperforms", 1.9}, {"upgrade", 1.9},
    {"upgrades", 1.9},     {"upgraded", 1.9},    {"record", 1.2},      {"jump", 1.4},
    {"jumps", 1.4},        {"climb", 1.3},       {"climbs", 1.3},      {"boost", 1.6},
    {"boosts", 1.6},       {"upbeat", 1.9},      {"robust", 1.7},      {"approval", 1.6},
    {"approved", 1.6},     {"dividend", 0.8},    {"buyback", 1.2},     {"expands", 1.1},
    {"positive", 2.0},     {"good", 1.9},        {"great", 3.1},       {"success", 2.7},
    // Negative
    {"bearish", -2.4},     {"dump", -1.6},       {"dumps", -1.6},      {"dumping", -1.6},
    {"crash", -2.7},       {"crashes", -2.7},    {"crashing", -2.7},   {"collapse", -2.8},
    {"collapses", -2.8},   {"plunge", -2.5},     {"plunges", -2.5},    {"plunged", -2.5},
    {"drop", -1.4},        {"drops", -1.4},      {"dropped", -1.4},    {"fall", -1.4},
    {"falls", -1.4},       {"fell", -1.4},       {"loss", -1.8},       {"losses", -1.8},
    {"bear", -1.5},        {"bears", -1.5},      {"overvalued", -1.4}, {"recession", -2.3},
    {"fear", -2.2},        {"fears", -2.2},      {"panic", -2.6},      {"miss", -1.6},
    {"misses", -1.6},      {"missed", -1.6},     {"downgrade", -1.9},  {"downgrades", -1.9},
    {"downgraded", -1.9},  {"weak", -1.9},       {"weaker", -1.9},     {"weakness", -1.8},
    {"slump", -2.0},       {"slumps", -2.0},     {"tumble", -2.0},     {"tumbles", -2.0},
    {"lawsuit", -1.7},     {"probe", -1.3},      {"fraud", -3.0},      {"bankruptcy", -3.0},
    {"layoffs", -1.9},     {"cuts", -1.1},       {"warning", -1.6},    {"warns", -1.6},
    {"decline", -1.5},     {"declines", -1.5},   {"sinks", -1.8},      {"selloff", -2.1},
    {"volatile", -0.9},    {"concern", -1.4},    {"concerns", -1.4},   {"risk", -1.1},
    {"negative", -2.0},    {"bad", -2.5},        {"worst", -3.1},      {"fails", -2.0},
};

const char* const kDefaultBoosters[] = {
    "very",  "sharply", "significantly", "strongly", "hugely",  "massive",
    "major", "extremely", "deeply",      "highly",   "heavily", "steeply",
};

const char* const kNegations[] = {
    "not",   "no",     "never",    "without", "isn't",  "wasn't", "aren't", "weren't",
    "don't", "doesn't", "didn't", "won't",    "can't",  "cannot", "nor",    "neither",
};

}  // namespace

LexiconScorer::LexiconScorer() {
    for (const auto& entry : kDefaultValences) {
        valences_[entry.first] = entry.second;
    }
    for (const char* booster : kDefaultBoosters) {
        boosters_.insert(booster);
    }
    for (const char* negation : kNegations) {
        negations_.insert(negation);
    }
}

Result<void> LexiconScorer::load_extensions(const std::string& filepath) {
    if (!std::filesystem::exists(filepath)) {
        return make_error<void>(ErrorCode::FILE_NOT_FOUND,
                                "Lexicon extension file not found: " + filepath, "LexiconScorer");
    }

    std::ifstream file(filepath);
    if (!file.is_open()) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Failed to open lexicon extension file: " + filepath,
                                "LexiconScorer");
    }

    try {
        nlohmann::json j;
        file >> j;
        if (j.contains("words")) {
            for (const auto& item : j.at("words").items()) {
                valences_[item.key()] = item.value().get<double>();
            }
        }
        if (j.contains("boosters")) {
            for (const auto& token : j.at("boosters")) {
                boosters_.insert(token.get<std::string>());
            }
        }
    } catch (const nlohmann::json::exception& e) {
        return make_error<void>(ErrorCode::JSON_PARSE_ERROR,
                                "Invalid lexicon extension file " + filepath + ": " + e.what(),
                                "LexiconScorer");
    }
    return Result<void>();
}

double LexiconScorer::score_text(const std::string& text) const {
    std::vector<std::string> tokens = tokenize(text);
    if (tokens.empty()) {
        return 0.0;
    }

    double sum = 0.0;
    for (size_t i = 0; i < tokens.size(); ++i) {
        auto it = valences_.find(tokens[i]);
        if (it == valences_.end()) {
            continue;
        }
        double valence = it->second;

        if (i > 0 && boosters_.count(tokens[i - 1]) > 0) {
            valence += valence > 0.0 ? BOOSTER_INCREMENT : -BOOSTER_INCREMENT;
        }

        size_t window_start = i >= NEGATION_WINDOW ? i - NEGATION_WINDOW : 0;
        for (size_t j = window_start; j < i; ++j) {
            if (negations_.count(tokens[j]) > 0) {
                valence *= NEGATION_SCALAR;
                break;
            }
        }
        sum += valence;
    }

    if (sum == 0.0) {
        return 0.0;
    }
    double normalized = sum / std::sqrt(sum * sum + NORMALIZATION_ALPHA);
    return std::max(-1.0, std::min(1.0, normalized));
}

Result<std::vector<double>> LexiconScorer::score(const std::vector<std::string>& texts) {
    std::vector<double> scores;
    scores.reserve(texts.size());
    for (const auto& text : texts) {
        scores.push_back(score_text(text));
    }
    return scores;
}

}  // namespace sentiment
}  // namespace options_ngin
