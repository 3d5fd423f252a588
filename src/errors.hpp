#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace glifzip {

enum class ErrorKind {
    Configuration,
    Format,
    HeaderChecksum,
    HashMismatch,
    SizeMismatch,
    Corruption,
    IO
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration:  return "ConfigurationError";
        case ErrorKind::Format:         return "FormatError";
        case ErrorKind::HeaderChecksum: return "HeaderChecksumError";
        case ErrorKind::HashMismatch:   return "HashMismatchError";
        case ErrorKind::SizeMismatch:   return "SizeMismatchError";
        case ErrorKind::Corruption:     return "CorruptionError";
        case ErrorKind::IO:             return "IOError";
    }
    return "GlifError";
}

/**
 * @brief Root of every error raised by the archive core.
 *
 * All errors are fatal to the operation that raised them; nothing is retried
 * and no partial output survives.
 */
class GlifError : public std::runtime_error {
public:
    GlifError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class ConfigurationError : public GlifError {
public:
    explicit ConfigurationError(const std::string& message)
        : GlifError(ErrorKind::Configuration, message) {}
};

class FormatError : public GlifError {
public:
    explicit FormatError(const std::string& message)
        : GlifError(ErrorKind::Format, message) {}
};

class HeaderChecksumError : public GlifError {
public:
    HeaderChecksumError(uint32_t expected, uint32_t actual)
        : GlifError(ErrorKind::HeaderChecksum,
                    "Header checksum mismatch: stored " + std::to_string(expected) +
                    ", computed " + std::to_string(actual)),
          expected_(expected), actual_(actual) {}

    uint32_t expected() const noexcept { return expected_; }
    uint32_t actual() const noexcept { return actual_; }

private:
    uint32_t expected_;
    uint32_t actual_;
};

class HashMismatchError : public GlifError {
public:
    HashMismatchError(const std::string& what, const std::string& expectedHex,
                      const std::string& actualHex)
        : GlifError(ErrorKind::HashMismatch,
                    what + " hash mismatch. Expected: " + expectedHex + ", Got: " + actualHex),
          expected_(expectedHex), actual_(actualHex) {}

    const std::string& expected() const noexcept { return expected_; }
    const std::string& actual() const noexcept { return actual_; }

private:
    std::string expected_;
    std::string actual_;
};

class SizeMismatchError : public GlifError {
public:
    SizeMismatchError(const std::string& what, uint64_t expected, uint64_t actual)
        : GlifError(ErrorKind::SizeMismatch,
                    what + " size mismatch: expected " + std::to_string(expected) +
                    ", got " + std::to_string(actual)),
          expected_(expected), actual_(actual) {}

    uint64_t expected() const noexcept { return expected_; }
    uint64_t actual() const noexcept { return actual_; }

private:
    uint64_t expected_;
    uint64_t actual_;
};

class CorruptionError : public GlifError {
public:
    explicit CorruptionError(const std::string& message)
        : GlifError(ErrorKind::Corruption, message) {}
};

class IOError : public GlifError {
public:
    explicit IOError(const std::string& message)
        : GlifError(ErrorKind::IO, message) {}
};

} // namespace glifzip
