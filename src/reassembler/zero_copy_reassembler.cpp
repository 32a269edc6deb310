#include "reassembler.hpp"
#include "../logger/Mylogger.hpp"
#include <algorithm>
#include <cstring>

namespace reassembler
{

    std::string toString(ReassemblerKind kind)
    {
        switch (kind)
        {
        case ReassemblerKind::General:
            return "general";
        case ReassemblerKind::ZeroCopy:
            return "zero_copy";
        }
        return "unknown";
    }

    std::size_t effectiveBatchSize(std::size_t batch_target_bytes)
    {
        std::size_t chunks = std::max<std::size_t>(1, batch_target_bytes / constants::CHUNK_SIZE);
        return chunks * constants::CHUNK_SIZE;
    }

    ZeroCopyBatchReassembler::ZeroCopyBatchReassembler(merkle::ChunkSink &sink, std::size_t batch_target_bytes)
        : Reassembler(sink), remainder_{}, rem_len_(0), batch_size_(effectiveBatchSize(batch_target_bytes))
    {
    }

    void ZeroCopyBatchReassembler::push(const uint8_t *data, std::size_t size)
    {
        if (size == 0)
            return;

        consumed_ += size;
        std::size_t offset = 0;

        // Complete a pending chunk first.
        if (rem_len_ > 0)
        {
            std::size_t take = std::min(constants::CHUNK_SIZE - rem_len_, size);
            std::memcpy(remainder_.data() + rem_len_, data, take);
            rem_len_ += take;
            offset += take;
            if (rem_len_ == constants::CHUNK_SIZE)
            {
                sink_.pushChunk(remainder_.data(), constants::CHUNK_SIZE);
                rem_len_ = 0;
            }
        }

        // Whole chunks go to the sink straight from the fragment.
        std::size_t pushable = (size - offset) / constants::CHUNK_SIZE * constants::CHUNK_SIZE;
        while (pushable >= batch_size_)
        {
            sink_.pushChunksBatched(data + offset, batch_size_);
            offset += batch_size_;
            pushable = (size - offset) / constants::CHUNK_SIZE * constants::CHUNK_SIZE;
        }
        if (pushable > 0)
        {
            sink_.pushChunksBatched(data + offset, pushable);
            offset += pushable;
        }

        std::size_t left = size - offset;
        if (left > 0)
        {
            // rem_len_ is zero here: either it was empty or the fragment completed it.
            std::memcpy(remainder_.data(), data + offset, left);
            rem_len_ = left;
        }
    }

    void ZeroCopyBatchReassembler::finish()
    {
        if (rem_len_ > 0)
        {
            sink_.pushChunk(remainder_.data(), rem_len_);
            rem_len_ = 0;
        }
    }

    std::unique_ptr<Reassembler> makeReassembler(ReassemblerKind kind, merkle::ChunkSink &sink,
                                                 std::size_t batch_target_bytes)
    {
        if (kind == ReassemblerKind::General)
        {
            return std::make_unique<GeneralReassembler>(sink);
        }

        auto fast = std::make_unique<ZeroCopyBatchReassembler>(sink, batch_target_bytes);
        MyLogger::debug("Zero-copy reassembler batch size: " + std::to_string(fast->batchSize()) + " bytes");
        return fast;
    }

} // namespace reassembler
