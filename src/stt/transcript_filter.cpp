#include "stt/transcript_filter.hpp"

#include <cctype>
#include <string>

static const char* kHallucinations[] = {
    "blank audio",
    "blank",
    "music",
    "music playing",
};

static bool is_space(char c) { return std::isspace((unsigned char)c) != 0; }

static bool is_annotation_char(char c) {
    return std::isalpha((unsigned char)c) || is_space(c) || c == '-';
}

// Removes closed "[...]" and "(...)" spans made only of letters, spaces
// and hyphens. Anything else in brackets is dictated text and stays.
static std::string strip_annotations(const std::string& in) {
    std::string out;
    out.reserve(in.size());

    std::size_t i = 0;
    while (i < in.size()) {
        const char c = in[i];
        if (c == '[' || c == '(') {
            std::size_t j = i + 1;
            bool letter = false;
            while (j < in.size() && is_annotation_char(in[j])) {
                if (std::isalpha((unsigned char)in[j])) letter = true;
                ++j;
            }
            if (letter && j < in.size() && (in[j] == ']' || in[j] == ')')) {
                i = j + 1;
                continue;
            }
        }
        out.push_back(c);
        ++i;
    }
    return out;
}

static std::string collapse_whitespace(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    bool pendingSpace = false;
    for (char c : in) {
        if (is_space(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) out.push_back(' ');
        pendingSpace = false;
        out.push_back(c);
    }
    return out;
}

// Lowercase, '_' as space, trailing punctuation removed.
static std::string normalise(const std::string& in) {
    std::string out;
    for (char c : in) {
        if (c == '_') c = ' ';
        out.push_back((char)std::tolower((unsigned char)c));
    }
    while (!out.empty() && (std::ispunct((unsigned char)out.back()) || is_space(out.back()))) {
        out.pop_back();
    }
    return collapse_whitespace(out);
}

std::string filterTranscript(const std::string& raw) {
    // "[BLANK_AUDIO]" alone is a hallucination even before stripping
    const std::string whole = collapse_whitespace(raw);
    std::string inner = whole;
    if (inner.size() >= 2 && (inner.front() == '[' || inner.front() == '(')) {
        inner = inner.substr(1, inner.size() - 2);
    }
    const std::string key = normalise(inner);
    for (const char* h : kHallucinations) {
        if (key == h) return {};
    }

    std::string text = collapse_whitespace(strip_annotations(raw));
    const std::string textKey = normalise(text);
    for (const char* h : kHallucinations) {
        if (textKey == h) return {};
    }
    return text;
}
