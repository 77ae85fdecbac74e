#include "sha256.hpp"
#include "chain_error.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <fmt/core.h>

Sha256::Sha256() : context_(EVP_MD_CTX_new(), EVP_MD_CTX_free)
{
    if (!context_)
    {
        throw std::runtime_error("Failed to create OpenSSL context");
    }

    // EVP = "Envelope" API (high-level cryptography interface)
    if (EVP_DigestInit_ex(context_.get(), EVP_sha256(), nullptr) != 1)
    {
        throw std::runtime_error("Failed to initialize SHA-256 digest");
    }
}

void Sha256::update(const unsigned char *data, size_t size)
{
    if (finalized_)
    {
        throw std::logic_error("SHA-256 digest already finalized");
    }
    if (size == 0)
    {
        return;
    }
    if (EVP_DigestUpdate(context_.get(), data, size) != 1)
    {
        throw std::runtime_error("Failed to update SHA-256 digest");
    }
}

Digest Sha256::finalize()
{
    if (finalized_)
    {
        throw std::logic_error("SHA-256 digest already finalized");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLength = 0;

    if (EVP_DigestFinal_ex(context_.get(), hash, &hashLength) != 1)
    {
        throw std::runtime_error("Failed to finalize SHA-256 digest");
    }
    finalized_ = true;

    if (hashLength != std::tuple_size<Digest>::value)
    {
        throw std::runtime_error(
            fmt::format("Unexpected SHA-256 digest length {}", hashLength));
    }

    Digest result;
    std::copy(hash, hash + hashLength, result.begin());
    return result;
}

Digest Sha256::digest(const Bytes &data)
{
    Sha256 hasher;
    hasher.update(data);
    return hasher.finalize();
}

Digest Sha256::digest(const std::string &text)
{
    Sha256 hasher;
    hasher.update(reinterpret_cast<const unsigned char *>(text.data()), text.size());
    return hasher.finalize();
}

Digest Sha256::digestFile(const std::filesystem::path &filePath)
{
    std::ifstream file(filePath, std::ios::binary);
    if (!file)
    {
        throw ChainError(ChainErrorKind::IOFailure,
                         fmt::format("Cannot open file for digest: {}", filePath.string()));
    }

    Sha256 hasher;
    std::vector<char> buffer(CHUNK_SIZE);

    while (file.read(buffer.data(), CHUNK_SIZE) || file.gcount() > 0)
    {
        size_t bytesRead = static_cast<size_t>(file.gcount());
        hasher.update(reinterpret_cast<const unsigned char *>(buffer.data()), bytesRead);
    }

    if (file.bad())
    {
        throw ChainError(ChainErrorKind::IOFailure,
                         fmt::format("Read error while hashing {}", filePath.string()));
    }

    return hasher.finalize();
}

std::string toHex(const Digest &digest)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (unsigned char byte : digest)
    {
        oss << std::setw(2) << static_cast<unsigned int>(byte);
    }

    return oss.str();
}

namespace
{
    // Lowercase, drop separators, reject anything that is not a hex digit.
    std::string normalizeHex(const std::string &hex)
    {
        std::string result;
        result.reserve(hex.length());

        for (char ch : hex)
        {
            unsigned char uch = static_cast<unsigned char>(ch);
            if (std::isspace(uch) || ch == ':' || ch == '-')
            {
                continue;
            }

            if (std::isxdigit(uch))
            {
                result += static_cast<char>(std::tolower(uch));
            }
            else
            {
                throw std::runtime_error(
                    fmt::format("Invalid character in digest: '{}'", ch));
            }
        }

        return result;
    }

    unsigned char hexValue(char ch)
    {
        return static_cast<unsigned char>(ch <= '9' ? ch - '0' : ch - 'a' + 10);
    }
}

Digest parseDigest(const std::string &text)
{
    std::string hexHash = text;

    // Optional "algorithm:" prefix; only sha256 chains exist
    size_t colonPos = text.find(':');
    if (colonPos != std::string::npos)
    {
        std::string algorithmStr = text.substr(0, colonPos);
        std::transform(algorithmStr.begin(), algorithmStr.end(), algorithmStr.begin(),
                       [](char ch) { return static_cast<char>(std::tolower(static_cast<unsigned char>(ch))); });
        if (algorithmStr != "sha256")
        {
            throw std::runtime_error(
                fmt::format("Unsupported algorithm: '{}'", algorithmStr));
        }
        hexHash = text.substr(colonPos + 1);
    }

    std::string normalized = normalizeHex(hexHash);

    // 256 bits / 4 bits per hex digit
    if (normalized.length() != 64)
    {
        throw std::runtime_error(
            fmt::format("Invalid sha256 digest length. Expected 64 hex characters, got {}",
                        normalized.length()));
    }

    Digest result;
    for (size_t i = 0; i < result.size(); ++i)
    {
        result[i] = static_cast<unsigned char>((hexValue(normalized[2 * i]) << 4) |
                                               hexValue(normalized[2 * i + 1]));
    }
    return result;
}

Digest zeroDigest()
{
    Digest zero;
    zero.fill(0);
    return zero;
}

bool isZeroDigest(const Digest &digest)
{
    return std::all_of(digest.begin(), digest.end(),
                       [](unsigned char byte) { return byte == 0; });
}
