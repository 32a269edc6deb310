#ifndef BYTE_STREAM_HPP
#define BYTE_STREAM_HPP

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace byte_stream
{

    // Borrowed view of one read. Valid until the next read() or close() on the stream that produced it.
    struct Fragment
    {
        const uint8_t *data = nullptr;
        std::size_t size = 0;
    };

    // Pull source of byte fragments. Not restartable.
    class ByteStream
    {
    public:
        virtual ~ByteStream() = default;

        // Returns false once the stream is exhausted.
        virtual bool read(Fragment &fragment) = 0;

        // Releases the underlying resource. Safe to call more than once.
        virtual void close() = 0;
    };

    // Calls close() on scope exit.
    class StreamGuard
    {
    public:
        explicit StreamGuard(ByteStream &stream) : stream_(stream) {}
        ~StreamGuard() { stream_.close(); }

        StreamGuard(const StreamGuard &) = delete;
        StreamGuard &operator=(const StreamGuard &) = delete;

    private:
        ByteStream &stream_;
    };

    // A file whose contents can be streamed. open() yields a fresh stream each call.
    struct FileSource
    {
        uint64_t size = 0;
        std::function<std::unique_ptr<ByteStream>()> open;
    };

    // Reads a file from disk in fragments of at most fragment_size bytes.
    class FileByteStream : public ByteStream
    {
    public:
        FileByteStream(const std::string &path, std::size_t fragment_size);

        bool read(Fragment &fragment) override;
        void close() override;

    private:
        std::string path_;
        std::ifstream file_;
        std::vector<uint8_t> buffer_;
        bool closed_;
    };

    // Replays a fixed list of fragments.
    class MemoryByteStream : public ByteStream
    {
    public:
        explicit MemoryByteStream(std::vector<std::vector<uint8_t>> fragments);

        bool read(Fragment &fragment) override;
        void close() override;

        std::size_t readCount() const { return reads_; }
        bool closed() const { return closed_; }

    private:
        std::vector<std::vector<uint8_t>> fragments_;
        std::size_t next_;
        std::size_t reads_;
        bool closed_;
    };

    // FileSource over a file on disk; size taken from the filesystem.
    FileSource fileSource(const std::string &path, std::size_t fragment_size);

    // Splits data into consecutive fragments of fragment_size bytes (last one shorter).
    std::vector<std::vector<uint8_t>> splitFragments(const std::vector<uint8_t> &data, std::size_t fragment_size);

} // namespace byte_stream

#endif // BYTE_STREAM_HPP
