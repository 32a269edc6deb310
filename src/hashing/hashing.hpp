#ifndef HASHING_HPP
#define HASHING_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <openssl/evp.h>

namespace hashing
{

    constexpr std::size_t HASH_SIZE = 32;

    // 32-byte hash value used for fingerprints and file keys.
    using H256 = std::array<uint8_t, HASH_SIZE>;

    // Lowercase hex, no prefix.
    std::string toHex(const uint8_t *data, std::size_t size);
    std::string toHex(const H256 &hash);

    // Accepts an optional "0x" prefix. Throws std::invalid_argument on malformed input.
    std::vector<uint8_t> fromHex(const std::string &hex);

    // Incremental SHA-256 over the OpenSSL EVP interface.
    // Throws errors::SinkError when OpenSSL reports a failure.
    class Sha256Context
    {
    public:
        Sha256Context();
        ~Sha256Context();

        Sha256Context(const Sha256Context &) = delete;
        Sha256Context &operator=(const Sha256Context &) = delete;

        void reset();
        void update(const uint8_t *data, std::size_t size);
        H256 finish();

    private:
        EVP_MD_CTX *ctx_;
    };

    H256 sha256(const uint8_t *data, std::size_t size);

    // Maps a canonical byte encoding to a fixed-size identifier.
    class Hasher
    {
    public:
        virtual ~Hasher() = default;
        virtual H256 hash(const uint8_t *data, std::size_t size) = 0;
    };

    class Sha256Hasher : public Hasher
    {
    public:
        H256 hash(const uint8_t *data, std::size_t size) override;
    };

} // namespace hashing

#endif // HASHING_HPP
