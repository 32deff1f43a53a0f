#ifndef TEXT_INJECTOR_HPP
#define TEXT_INJECTOR_HPP

#include "output/keystroke_sink.hpp"
#include "output/text_formatter.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

// Types finalised text into the focused window, one keystroke per code
// point, in call order. Calls are serialised; a failing keystroke ends the
// current text and is not retried.
class TextInjector {
public:
    struct Config {
        bool autoSubmit = false;
        TextFormatter::Config format;
    };

    TextInjector(KeystrokeSink& sink, Config config);

    // Returns false if the sink rejected a keystroke.
    bool inject(const std::string& text);

    uint64_t failureCount() const;

    // UTF-8 to code points; malformed sequences become U+FFFD.
    static std::vector<char32_t> decodeUtf8(const std::string& text);

private:
    KeystrokeSink& sink_;
    Config config_;
    TextFormatter formatter_;

    mutable std::mutex mutex_;
    uint64_t failures_ = 0;
};

#endif
