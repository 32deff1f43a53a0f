#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

// Fatal at startup. Carries the hint shown to the operator.
class PermissionError : public std::runtime_error {
public:
    PermissionError(const std::string& what, std::string hint)
        : std::runtime_error(what), hint_(std::move(hint)) {}

    const std::string& hint() const { return hint_; }

private:
    std::string hint_;
};

class KeySourcePermissionError : public PermissionError {
public:
    using PermissionError::PermissionError;
};

class MicrophoneError : public PermissionError {
public:
    using PermissionError::PermissionError;
};

class InferenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InjectionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

#endif
