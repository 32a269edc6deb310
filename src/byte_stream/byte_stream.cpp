#include "byte_stream.hpp"
#include "../errors/errors.hpp"
#include "../logger/Mylogger.hpp"
#include <algorithm>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace byte_stream
{

    FileByteStream::FileByteStream(const std::string &path, std::size_t fragment_size)
        : path_(path), file_(path, std::ios::binary), buffer_(fragment_size), closed_(false)
    {
        if (fragment_size == 0)
        {
            throw errors::StreamReadError("Fragment size must be positive for: " + path);
        }
        if (!file_)
        {
            MyLogger::error("Failed to open file: " + path);
            throw errors::StreamReadError("Failed to open file: " + path);
        }
    }

    bool FileByteStream::read(Fragment &fragment)
    {
        if (closed_)
        {
            throw errors::StreamReadError("Read on closed stream: " + path_);
        }

        file_.read(reinterpret_cast<char *>(buffer_.data()), static_cast<std::streamsize>(buffer_.size()));
        std::streamsize bytesRead = file_.gcount();
        if (file_.bad())
        {
            MyLogger::error("I/O error while reading: " + path_);
            throw errors::StreamReadError("I/O error while reading: " + path_);
        }
        if (bytesRead <= 0)
        {
            return false;
        }

        fragment.data = buffer_.data();
        fragment.size = static_cast<std::size_t>(bytesRead);
        return true;
    }

    void FileByteStream::close()
    {
        if (closed_)
            return;
        closed_ = true;
        file_.close();
        MyLogger::debug("Closed stream: " + path_);
    }

    MemoryByteStream::MemoryByteStream(std::vector<std::vector<uint8_t>> fragments)
        : fragments_(std::move(fragments)), next_(0), reads_(0), closed_(false)
    {
    }

    bool MemoryByteStream::read(Fragment &fragment)
    {
        if (closed_)
        {
            throw errors::StreamReadError("Read on closed memory stream");
        }
        reads_++;
        if (next_ >= fragments_.size())
        {
            return false;
        }

        const auto &current = fragments_[next_++];
        fragment.data = current.data();
        fragment.size = current.size();
        return true;
    }

    void MemoryByteStream::close()
    {
        closed_ = true;
    }

    FileSource fileSource(const std::string &path, std::size_t fragment_size)
    {
        std::error_code ec;
        auto size = fs::file_size(path, ec);
        if (ec)
        {
            MyLogger::error("Unable to stat file: " + path + " (" + ec.message() + ")");
            throw errors::StreamReadError("Unable to stat file: " + path);
        }

        FileSource source;
        source.size = size;
        source.open = [path, fragment_size]()
        {
            return std::unique_ptr<ByteStream>(std::make_unique<FileByteStream>(path, fragment_size));
        };
        return source;
    }

    std::vector<std::vector<uint8_t>> splitFragments(const std::vector<uint8_t> &data, std::size_t fragment_size)
    {
        std::vector<std::vector<uint8_t>> fragments;
        if (fragment_size == 0)
            return fragments;

        std::size_t offset = 0;
        while (offset < data.size())
        {
            std::size_t len = std::min(fragment_size, data.size() - offset);
            fragments.emplace_back(data.begin() + offset, data.begin() + offset + len);
            offset += len;
        }
        return fragments;
    }

} // namespace byte_stream
