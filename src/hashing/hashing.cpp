#include "hashing.hpp"
#include "../errors/errors.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace hashing
{

    std::string toHex(const uint8_t *data, std::size_t size)
    {
        std::stringstream ss;
        for (std::size_t i = 0; i < size; i++)
        {
            ss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
        }
        return ss.str();
    }

    std::string toHex(const H256 &hash)
    {
        return toHex(hash.data(), hash.size());
    }

    namespace
    {
        int hexValue(char c)
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }
    }

    std::vector<uint8_t> fromHex(const std::string &hex)
    {
        std::size_t start = 0;
        if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X'))
        {
            start = 2;
        }
        if ((hex.size() - start) % 2 != 0)
        {
            throw std::invalid_argument("Hex string has odd length: " + hex);
        }

        std::vector<uint8_t> bytes;
        bytes.reserve((hex.size() - start) / 2);
        for (std::size_t i = start; i < hex.size(); i += 2)
        {
            int hi = hexValue(hex[i]);
            int lo = hexValue(hex[i + 1]);
            if (hi < 0 || lo < 0)
            {
                throw std::invalid_argument("Invalid hex character in: " + hex);
            }
            bytes.push_back(static_cast<uint8_t>((hi << 4) | lo));
        }
        return bytes;
    }

    Sha256Context::Sha256Context() : ctx_(EVP_MD_CTX_new())
    {
        if (!ctx_)
        {
            throw errors::SinkError("Failed to create EVP_MD_CTX");
        }
        reset();
    }

    Sha256Context::~Sha256Context()
    {
        EVP_MD_CTX_free(ctx_);
    }

    void Sha256Context::reset()
    {
        if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1)
        {
            throw errors::SinkError("Failed to initialize SHA-256 context");
        }
    }

    void Sha256Context::update(const uint8_t *data, std::size_t size)
    {
        if (size == 0)
            return;
        if (EVP_DigestUpdate(ctx_, data, size) != 1)
        {
            throw errors::SinkError("Failed to update SHA-256 hash");
        }
    }

    H256 Sha256Context::finish()
    {
        H256 out{};
        unsigned int md_len = 0;
        if (EVP_DigestFinal_ex(ctx_, out.data(), &md_len) != 1 || md_len != HASH_SIZE)
        {
            throw errors::SinkError("Failed to finalize SHA-256 hash");
        }
        return out;
    }

    H256 sha256(const uint8_t *data, std::size_t size)
    {
        Sha256Context ctx;
        ctx.update(data, size);
        return ctx.finish();
    }

    H256 Sha256Hasher::hash(const uint8_t *data, std::size_t size)
    {
        return sha256(data, size);
    }

} // namespace hashing
