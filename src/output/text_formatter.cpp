#include "output/text_formatter.hpp"

#include <cctype>

static std::string regex_escape(const std::string& s) {
    static const std::string special = R"(\^$.|?*+()[]{})";
    std::string out;
    for (char c : s) {
        if (special.find(c) != std::string::npos) out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

// Word boundaries are checked on the surrounding characters, so overrides
// may start or end with punctuation ("c++"). The leading separator is
// captured and put back by the replacement.
static std::regex whole_word(const std::string& word) {
    return std::regex("(^|\\W)" + regex_escape(word) + "(?!\\w)", std::regex::ECMAScript | std::regex::icase);
}

static std::string after_separator(const std::string& replacement) {
    std::string out = "$1";
    for (char c : replacement) {
        if (c == '$') out.push_back('$');
        out.push_back(c);
    }
    return out;
}

// Marks that attach to the preceding word swallow the space before them.
static std::regex attached_mark(const std::string& word) {
    return std::regex("\\s*\\b" + regex_escape(word) + "\\b", std::regex::ECMAScript | std::regex::icase);
}

static std::string trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) ++b;
    while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
    return s.substr(b, e - b);
}

// Constructor
TextFormatter::TextFormatter(Config config) {
    for (const auto& kv : config.wordOverrides) {
        if (kv.first.empty()) continue;
        overrides_.push_back({whole_word(kv.first), after_separator(kv.second)});
    }

    if (!config.spokenPunctuation) return;

    punctuation_.push_back({attached_mark("period"), "."});
    punctuation_.push_back({attached_mark("comma"), ","});
    punctuation_.push_back({attached_mark("question mark"), "?"});
    punctuation_.push_back({attached_mark("exclamation mark"), "!"});
    punctuation_.push_back({attached_mark("colon"), ":"});
    punctuation_.push_back({attached_mark("semicolon"), ";"});
    punctuation_.push_back({whole_word("new line"), after_separator("\n")});
    punctuation_.push_back({whole_word("tab"), after_separator("\t")});
}

std::string TextFormatter::format(const std::string& text) const {
    std::string out = trim(text);
    if (out.empty()) return {};

    for (const auto& rule : overrides_) {
        out = std::regex_replace(out, rule.pattern, rule.replacement);
    }
    for (const auto& rule : punctuation_) {
        out = std::regex_replace(out, rule.pattern, rule.replacement);
    }

    if (trim(out).empty() && out.find_first_of("\n\t") == std::string::npos) return {};
    return out + " ";
}
