#include "reassembler.hpp"
#include <cstring>

namespace reassembler
{

    GeneralReassembler::GeneralReassembler(merkle::ChunkSink &sink)
        : Reassembler(sink), contents_(nullptr)
    {
    }

    void GeneralReassembler::push(const uint8_t *data, std::size_t size)
    {
        if (size == 0)
            return;

        consumed_ += size;
        if (contents_)
        {
            contents_->insert(contents_->end(), data, data + size);
        }

        // Unconsumed tail first, then the new bytes.
        std::vector<uint8_t> buffer(carry_.size() + size);
        if (!carry_.empty())
        {
            std::memcpy(buffer.data(), carry_.data(), carry_.size());
        }
        std::memcpy(buffer.data() + carry_.size(), data, size);

        std::size_t offset = 0;
        while (buffer.size() - offset >= constants::CHUNK_SIZE)
        {
            sink_.pushChunk(buffer.data() + offset, constants::CHUNK_SIZE);
            offset += constants::CHUNK_SIZE;
        }

        carry_.assign(buffer.begin() + offset, buffer.end());
    }

    void GeneralReassembler::finish()
    {
        if (!carry_.empty())
        {
            sink_.pushChunk(carry_.data(), carry_.size());
            carry_.clear();
        }
    }

} // namespace reassembler
