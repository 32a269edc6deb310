#ifndef REASSEMBLER_HPP
#define REASSEMBLER_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "../constants/constants.hpp"
#include "../merkle/merkle_accumulator.hpp"

namespace reassembler
{

    enum class ReassemblerKind
    {
        General,
        ZeroCopy
    };

    std::string toString(ReassemblerKind kind);

    // Turns fragments of arbitrary size into CHUNK_SIZE-aligned pushes on a sink.
    // Fragments must be fed in stream order; finish() flushes the final partial chunk.
    class Reassembler
    {
    public:
        explicit Reassembler(merkle::ChunkSink &sink) : sink_(sink) {}
        virtual ~Reassembler() = default;

        Reassembler(const Reassembler &) = delete;
        Reassembler &operator=(const Reassembler &) = delete;

        virtual void push(const uint8_t *data, std::size_t size) = 0;
        virtual void finish() = 0;

        // Bytes fed through push() so far.
        uint64_t bytesConsumed() const { return consumed_; }

    protected:
        merkle::ChunkSink &sink_;
        uint64_t consumed_ = 0;
    };

    // Rebuilds carry + fragment into a fresh buffer on every read and slices chunks out of it.
    class GeneralReassembler : public Reassembler
    {
    public:
        explicit GeneralReassembler(merkle::ChunkSink &sink);

        // When set, every non-empty fragment is also appended to *contents.
        void captureContents(std::vector<uint8_t> *contents) { contents_ = contents; }

        void push(const uint8_t *data, std::size_t size) override;
        void finish() override;

    private:
        std::vector<uint8_t> carry_;
        std::vector<uint8_t> *contents_;
    };

    // Keeps at most one partial chunk in a fixed buffer and pushes whole-chunk runs
    // straight from the caller's fragment with pushChunksBatched.
    class ZeroCopyBatchReassembler : public Reassembler
    {
    public:
        ZeroCopyBatchReassembler(merkle::ChunkSink &sink, std::size_t batch_target_bytes);

        void push(const uint8_t *data, std::size_t size) override;
        void finish() override;

        std::size_t batchSize() const { return batch_size_; }

    private:
        std::array<uint8_t, constants::CHUNK_SIZE> remainder_;
        std::size_t rem_len_;
        std::size_t batch_size_;
    };

    // Rounds a batch target down to a multiple of CHUNK_SIZE, never below one chunk.
    std::size_t effectiveBatchSize(std::size_t batch_target_bytes);

    std::unique_ptr<Reassembler> makeReassembler(ReassemblerKind kind, merkle::ChunkSink &sink,
                                                 std::size_t batch_target_bytes);

} // namespace reassembler

#endif // REASSEMBLER_HPP
