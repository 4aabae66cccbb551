// src/sentiment/text_utils.cpp
#include "options_ngin/sentiment/text_utils.hpp"
#include <cctype>
#include <utility>

namespace options_ngin {
namespace sentiment {

namespace {

const std::pair<const char*, const char*> kEntities[] = {
    {"&amp;", "&"}, {"&quot;", "\""}, {"&#39;", "'"}, {"&apos;", "'"},
    {"&lt;", "<"},  {"&gt;", ">"},    {"&nbsp;", " "},
};

std::string strip_tags(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool in_tag = false;
    for (char c : text) {
        if (c == '<') {
            in_tag = true;
            out.push_back(' ');
        } else if (c == '>' && in_tag) {
            in_tag = false;
        } else if (!in_tag) {
            out.push_back(c);
        }
    }
    return out;
}

std::string decode_entities(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        bool replaced = false;
        if (text[i] == '&') {
            for (const auto& entity : kEntities) {
                std::string key(entity.first);
                if (text.compare(i, key.size(), key) == 0) {
                    out += entity.second;
                    i += key.size();
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) {
            out.push_back(text[i]);
            ++i;
        }
    }
    return out;
}

}  // namespace

std::string normalize_headline(const std::string& text, size_t max_length) {
    std::string decoded = decode_entities(strip_tags(text));

    std::string collapsed;
    collapsed.reserve(decoded.size());
    bool pending_space = false;
    for (char c : decoded) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !collapsed.empty();
            continue;
        }
        if (pending_space) {
            collapsed.push_back(' ');
            pending_space = false;
        }
        collapsed.push_back(c);
    }

    if (collapsed.size() > max_length) {
        size_t cut = max_length;
        // Back off continuation bytes so a multi-byte character is never split
        while (cut > 0 && (static_cast<unsigned char>(collapsed[cut]) & 0xC0) == 0x80) {
            --cut;
        }
        collapsed.resize(cut);
        while (!collapsed.empty() && collapsed.back() == ' ') {
            collapsed.pop_back();
        }
    }
    return collapsed;
}

std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '\'') {
            current.push_back(static_cast<char>(std::tolower(uc)));
        } else if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }
    // Quotes used as punctuation ('Buy' rating) are not part of the word
    for (auto& token : tokens) {
        while (!token.empty() && token.front() == '\'') {
            token.erase(token.begin());
        }
        while (!token.empty() && token.back() == '\'') {
            token.pop_back();
        }
    }
    std::vector<std::string> filtered;
    filtered.reserve(tokens.size());
    for (auto& token : tokens) {
        if (!token.empty()) {
            filtered.push_back(std::move(token));
        }
    }
    return filtered;
}

}  // namespace sentiment
}  // namespace options_ngin
