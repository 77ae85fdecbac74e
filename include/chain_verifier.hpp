#pragma once

#include "sha256.hpp"

#include <cstdint>

/** A block that matched its trusted hash, and the hash to trust next. */
struct VerifiedBlock
{
    Bytes block;
    Digest nextHash;

    /** True for the last block of the chain (zero trailer). */
    bool isTerminal() const { return isZeroDigest(nextHash); }
};

class ChainVerifier
{
public:
    /**
     * Check @p candidate ("block || next hash") against @p trusted.
     *
     * @throws ChainError TooShort if candidate is 32 bytes or less,
     *         VerificationFailed if SHA256(candidate) differs in any byte
     */
    static VerifiedBlock verify(const Digest &trusted, const Bytes &candidate);

    /**
     * Interpret the payload of request 0 as a root hash.
     * @throws ChainError VerificationFailed unless it is exactly 32 bytes
     */
    static Digest readRootHash(const Bytes &payload);
};

/**
 * Consumer-side cursor over one chain. Starts from a trusted root hash and
 * moves the trust forward with every accepted block.
 *
 * A failed verification is final: the reader refuses further input
 * rather than retrying with other data.
 */
class ChainReader
{
public:
    explicit ChainReader(const Digest &rootHash) : trusted_(rootHash) {}

    /**
     * Verify the next served payload and return its content bytes.
     * @throws ChainError TooShort, VerificationFailed
     * @throws std::logic_error after the terminal block or a failure
     */
    Bytes accept(const Bytes &candidate);

    bool finished() const { return finished_; }
    bool failed() const { return failed_; }

    std::int64_t blocksAccepted() const { return blocksAccepted_; }

    const Digest &trustedHash() const { return trusted_; }

private:
    Digest trusted_;
    bool finished_ = false;
    bool failed_ = false;
    std::int64_t blocksAccepted_ = 0;
};
