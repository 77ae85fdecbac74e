#include "chain_verifier.hpp"
#include "chain_error.hpp"

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <fmt/core.h>

VerifiedBlock ChainVerifier::verify(const Digest &trusted, const Bytes &candidate)
{
    const size_t hashSize = trusted.size();
    if (candidate.size() <= hashSize)
    {
        throw ChainError(ChainErrorKind::TooShort,
                         fmt::format("Hashed block too short, expected length > {}, got: {}",
                                     hashSize, candidate.size()));
    }

    Digest actual = Sha256::digest(candidate);
    if (!std::equal(actual.begin(), actual.end(), trusted.begin()))
    {
        throw ChainError(ChainErrorKind::VerificationFailed,
                         fmt::format("Hashed block failed verification, expected: {}, got: {}",
                                     toHex(trusted), toHex(actual)));
    }

    size_t hashOffset = candidate.size() - hashSize;

    VerifiedBlock result;
    result.block.assign(candidate.begin(), candidate.begin() + static_cast<std::ptrdiff_t>(hashOffset));
    std::copy(candidate.begin() + static_cast<std::ptrdiff_t>(hashOffset), candidate.end(),
              result.nextHash.begin());
    return result;
}

Digest ChainVerifier::readRootHash(const Bytes &payload)
{
    Digest root;
    if (payload.size() != root.size())
    {
        throw ChainError(ChainErrorKind::VerificationFailed,
                         fmt::format("Root hash must be {} bytes, got {}", root.size(), payload.size()));
    }
    std::copy(payload.begin(), payload.end(), root.begin());
    return root;
}

Bytes ChainReader::accept(const Bytes &candidate)
{
    if (failed_)
    {
        throw std::logic_error("Chain reader stopped after a failed verification");
    }
    if (finished_)
    {
        throw std::logic_error("Chain reader already received the terminal block");
    }

    VerifiedBlock verified;
    try
    {
        verified = ChainVerifier::verify(trusted_, candidate);
    }
    catch (const ChainError &)
    {
        failed_ = true;
        throw;
    }

    trusted_ = verified.nextHash;
    finished_ = verified.isTerminal();
    ++blocksAccepted_;
    return std::move(verified.block);
}
