#include "chain_error.hpp"

const char *kindName(ChainErrorKind kind)
{
    switch (kind)
    {
    case ChainErrorKind::NotARegularFile:
        return "NotARegularFile";
    case ChainErrorKind::InvalidBlockSize:
        return "InvalidBlockSize";
    case ChainErrorKind::CacheCorrupt:
        return "CacheCorrupt";
    case ChainErrorKind::CacheMiss:
        return "CacheMiss";
    case ChainErrorKind::IOFailure:
        return "IOFailure";
    case ChainErrorKind::TooShort:
        return "TooShort";
    case ChainErrorKind::VerificationFailed:
        return "VerificationFailed";
    }
    return "Unknown";
}
