#pragma once
#include <stdexcept>
#include <string>

// Base of every failure a split can end with. Front ends catch this at their boundary.
class SplitError : public std::runtime_error {
public:
    explicit SplitError(const std::string& message) : std::runtime_error(message) {}
};

// Input does not start with BEGIN:VCALENDAR (includes empty input).
class InvalidFormatError : public SplitError {
public:
    explicit InvalidFormatError(const std::string& message) : SplitError(message) {}
};

// Output target already exists and overwriting was not allowed.
class WriteConflictError : public SplitError {
public:
    explicit WriteConflictError(const std::string& message) : SplitError(message) {}
};

class WriteIOError : public SplitError {
public:
    explicit WriteIOError(const std::string& message) : SplitError(message) {}
};

// Bad size string, unknown encoding, malformed config file or event limit.
class ConfigurationError : public SplitError {
public:
    explicit ConfigurationError(const std::string& message) : SplitError(message) {}
};

// Text that the output charset cannot represent.
class EncodingError : public SplitError {
public:
    explicit EncodingError(const std::string& message) : SplitError(message) {}
};

class InputError : public SplitError {
public:
    explicit InputError(const std::string& message) : SplitError(message) {}
};
