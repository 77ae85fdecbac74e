#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * Failure categories of the hash chain.
 * End-of-stream is deliberately absent: the block server reports it as an
 * empty result, never as an exception.
 */
enum class ChainErrorKind
{
    NotARegularFile,
    InvalidBlockSize,
    CacheCorrupt,
    CacheMiss,
    IOFailure,
    TooShort,
    VerificationFailed
};

/** Stable name of an error kind, e.g. "VerificationFailed". */
const char *kindName(ChainErrorKind kind);

class ChainError : public std::runtime_error
{
public:
    ChainError(ChainErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind)
    {
    }

    /**
     * I/O failure raised mid-read. @p partial holds whatever was read
     * before the failure; it must not be trusted or forwarded.
     */
    ChainError(const std::string &message, std::vector<unsigned char> partial)
        : std::runtime_error(message), kind_(ChainErrorKind::IOFailure), partial_(std::move(partial))
    {
    }

    ChainErrorKind kind() const { return kind_; }

    const std::vector<unsigned char> &partialData() const { return partial_; }

private:
    ChainErrorKind kind_;
    std::vector<unsigned char> partial_;
};
