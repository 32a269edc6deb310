#include "merkle_accumulator.hpp"
#include "../constants/constants.hpp"
#include <algorithm>

namespace merkle
{

    namespace
    {
        const uint8_t LEAF_PREFIX = 0x00;
        const uint8_t NODE_PREFIX = 0x01;
    }

    void ChunkSink::pushChunksBatched(const uint8_t *data, std::size_t size)
    {
        std::size_t offset = 0;
        while (offset < size)
        {
            std::size_t len = std::min(constants::CHUNK_SIZE, size - offset);
            pushChunk(data + offset, len);
            offset += len;
        }
    }

    hashing::H256 hashNode(const hashing::H256 &left, const hashing::H256 &right)
    {
        hashing::Sha256Context ctx;
        ctx.update(&NODE_PREFIX, 1);
        ctx.update(left.data(), left.size());
        ctx.update(right.data(), right.size());
        return ctx.finish();
    }

    Sha256MerkleAccumulator::Sha256MerkleAccumulator() : next_index_(0)
    {
    }

    hashing::H256 Sha256MerkleAccumulator::hashLeaf(const uint8_t *data, std::size_t size)
    {
        uint8_t index[8];
        for (int i = 0; i < 8; i++)
        {
            index[i] = static_cast<uint8_t>(next_index_ >> (56 - 8 * i));
        }

        leaf_ctx_.reset();
        leaf_ctx_.update(&LEAF_PREFIX, 1);
        leaf_ctx_.update(index, sizeof(index));
        leaf_ctx_.update(data, size);
        return leaf_ctx_.finish();
    }

    void Sha256MerkleAccumulator::appendLeaf(const hashing::H256 &leaf)
    {
        stack_.push_back({leaf, 0});
        next_index_++;

        // Merge equal-height neighbours; afterwards levels strictly decrease towards the top.
        while (stack_.size() >= 2 && stack_[stack_.size() - 1].level == stack_[stack_.size() - 2].level)
        {
            Subtree right = stack_.back();
            stack_.pop_back();
            Subtree &left = stack_.back();
            left.hash = hashNode(left.hash, right.hash);
            left.level++;
        }
    }

    void Sha256MerkleAccumulator::pushChunk(const uint8_t *data, std::size_t size)
    {
        appendLeaf(hashLeaf(data, size));
    }

    hashing::H256 Sha256MerkleAccumulator::getRoot() const
    {
        if (stack_.empty())
        {
            return hashing::sha256(nullptr, 0);
        }

        hashing::H256 root = stack_.back().hash;
        for (auto it = stack_.rbegin() + 1; it != stack_.rend(); ++it)
        {
            root = hashNode(it->hash, root);
        }
        return root;
    }

} // namespace merkle
