#ifndef TRANSCRIPT_FILTER_HPP
#define TRANSCRIPT_FILTER_HPP

#include <string>

// Cleans raw recogniser output: removes bracketed or parenthesised
// annotations such as "[music]" or "(sighs)", collapses whitespace and
// maps known whole-text hallucinations ("blank audio", "music playing")
// to the empty string.
std::string filterTranscript(const std::string& raw);

#endif
