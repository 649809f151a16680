#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

// ============================================================================
// Error taxonomy
// ============================================================================
// Every failure is thrown at the point of detection. Nothing is retried and no
// partial state is left behind.

class InvalidBufferLength : public std::invalid_argument {
public:
    InvalidBufferLength(size_t actual, size_t expected)
        : std::invalid_argument("Invalid field length: got " + std::to_string(actual) +
                                " bytes, expected " + std::to_string(expected))
        , actual_(actual)
        , expected_(expected) {}

    size_t actual() const { return actual_; }
    size_t expected() const { return expected_; }

private:
    size_t actual_;
    size_t expected_;
};

class InvalidEncoding : public std::invalid_argument {
public:
    explicit InvalidEncoding(const std::string& what)
        : std::invalid_argument("Invalid base64: " + what) {}
};

class IndexNotFound : public std::out_of_range {
public:
    explicit IndexNotFound(uint64_t index)
        : std::out_of_range("No board at index " + std::to_string(index))
        , index_(index) {}

    uint64_t index() const { return index_; }

private:
    uint64_t index_;
};

class RegistryNotInitialized : public std::logic_error {
public:
    RegistryNotInitialized()
        : std::logic_error("Registry used before initialize()") {}
};

// Clock reading lower than the height a stored generation was produced at.
class HeightRegression : public std::invalid_argument {
public:
    HeightRegression(uint64_t now, uint64_t stored)
        : std::invalid_argument("Clock height " + std::to_string(now) + " is below stored height " +
                                std::to_string(stored))
        , now_(now)
        , stored_(stored) {}

    uint64_t now() const { return now_; }
    uint64_t stored() const { return stored_; }

private:
    uint64_t now_;
    uint64_t stored_;
};

class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what)
        : std::runtime_error(what) {}
};

#endif // ERRORS_HPP
