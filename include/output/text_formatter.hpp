#ifndef TEXT_FORMATTER_HPP
#define TEXT_FORMATTER_HPP

#include <map>
#include <regex>
#include <string>
#include <utility>
#include <vector>

// Final clean-up of a transcript before it is typed.
class TextFormatter {
public:
    struct Config {
        std::map<std::string, std::string> wordOverrides;   // whole word, case-insensitive
        bool spokenPunctuation = true;                      // "period" -> "." etc.
    };

    explicit TextFormatter(Config config);

    // Returns the text to type, with one trailing space, or "" when there
    // is nothing to type.
    std::string format(const std::string& text) const;

private:
    struct Rule {
        std::regex pattern;
        std::string replacement;
    };

    std::vector<Rule> overrides_;
    std::vector<Rule> punctuation_;
};

#endif
