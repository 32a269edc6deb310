#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace errors
{

    // Base class of every error raised while fingerprinting a file.
    class FingerprintError : public std::runtime_error
    {
    public:
        explicit FingerprintError(const std::string &what) : std::runtime_error(what) {}
    };

    // Declared size is above the configured ceiling. Raised before the stream is opened.
    class FileTooLarge : public FingerprintError
    {
    public:
        FileTooLarge(uint64_t size, uint64_t limit)
            : FingerprintError("File too large for fingerprint calculation. size=" + std::to_string(size) +
                               "B limit=" + std::to_string(limit) + "B"),
              size_(size), limit_(limit)
        {
        }

        uint64_t size() const { return size_; }
        uint64_t limit() const { return limit_; }

    private:
        uint64_t size_;
        uint64_t limit_;
    };

    // Raised by byte sources.
    class StreamReadError : public FingerprintError
    {
    public:
        explicit StreamReadError(const std::string &what) : FingerprintError(what) {}
    };

    // Raised by chunk sinks (Merkle accumulators).
    class SinkError : public FingerprintError
    {
    public:
        explicit SinkError(const std::string &what) : FingerprintError(what) {}
    };

    class FingerprintCancelled : public FingerprintError
    {
    public:
        FingerprintCancelled() : FingerprintError("Fingerprint computation cancelled") {}
    };

    class ConfigError : public FingerprintError
    {
    public:
        explicit ConfigError(const std::string &what) : FingerprintError(what) {}
    };

} // namespace errors

#endif // ERRORS_HPP
