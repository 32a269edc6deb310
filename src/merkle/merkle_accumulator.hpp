#ifndef MERKLE_ACCUMULATOR_HPP
#define MERKLE_ACCUMULATOR_HPP

#include <cstddef>
#include <cstdint>
#include <vector>
#include "../hashing/hashing.hpp"

namespace merkle
{

    // Consumer of the ordered chunk sequence of one file.
    class ChunkSink
    {
    public:
        virtual ~ChunkSink() = default;

        // Appends one leaf.
        virtual void pushChunk(const uint8_t *data, std::size_t size) = 0;

        // Same as calling pushChunk once per CHUNK_SIZE slice of [data, data + size), in order.
        // The buffer is borrowed for the duration of the call only.
        virtual void pushChunksBatched(const uint8_t *data, std::size_t size);

        // Root over the chunks pushed so far.
        virtual hashing::H256 getRoot() const = 0;
    };

    // Binary SHA-256 Merkle tree built incrementally.
    //
    //   leaf = SHA-256(0x00 || index as u64 big-endian || chunk)
    //   node = SHA-256(0x01 || left || right)
    //
    // Only the roots of the perfect subtrees seen so far are kept (at most one
    // per level), so memory grows with log2 of the chunk count. The root folds
    // those subtrees from right to left. With no chunks the root is SHA-256("").
    class Sha256MerkleAccumulator : public ChunkSink
    {
    public:
        Sha256MerkleAccumulator();

        void pushChunk(const uint8_t *data, std::size_t size) override;
        hashing::H256 getRoot() const override;

        uint64_t chunkCount() const { return next_index_; }

    private:
        struct Subtree
        {
            hashing::H256 hash;
            unsigned level;
        };

        hashing::H256 hashLeaf(const uint8_t *data, std::size_t size);
        void appendLeaf(const hashing::H256 &leaf);

        std::vector<Subtree> stack_;
        uint64_t next_index_;
        hashing::Sha256Context leaf_ctx_;
    };

    hashing::H256 hashNode(const hashing::H256 &left, const hashing::H256 &right);

} // namespace merkle

#endif // MERKLE_ACCUMULATOR_HPP
