#pragma once

#include <stdexcept>
#include <string>

// Root of every fatal error raised while loading, storing or restoring properties.
class PropertiesError : public std::runtime_error {
public:
    explicit PropertiesError(const std::string& what)
        : std::runtime_error(what) {}
};

// A \uXXXX sequence with fewer than four hex digits or a non-hex digit.
class MalformedUnicodeEscape : public PropertiesError {
public:
    MalformedUnicodeEscape()
        : PropertiesError("Malformed \\uxxxx encoding.") {}
};

// The underlying stream went bad during a read or a write.
class IoFailure : public PropertiesError {
public:
    explicit IoFailure(const std::string& what)
        : PropertiesError(what) {}
};

// A snapshot could not be turned back into a store.
class InvalidRestoredState : public PropertiesError {
public:
    explicit InvalidRestoredState(const std::string& what)
        : PropertiesError(what) {}
};
