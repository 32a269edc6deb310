#ifndef FILE_MANAGER_HPP
#define FILE_MANAGER_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "../byte_stream/byte_stream.hpp"
#include "../cancellation/cancellation.hpp"
#include "../hashing/hashing.hpp"
#include "../load_config/load_config.hpp"
#include "../merkle/merkle_accumulator.hpp"
#include "../reassembler/reassembler.hpp"
#include "../single_flight/single_flight.hpp"

namespace file_manager
{

    using SinkFactory = std::function<std::unique_ptr<merkle::ChunkSink>()>;

    // Canonical encoding hashed into a file key. Byte strings carry a u32
    // big-endian length prefix; size is a u64 big-endian integer.
    //
    //   len(owner) owner | len(bucket) bucket | len(location) location | size | len(fp) fp
    std::vector<uint8_t> encodeFileMetadata(const std::vector<uint8_t> &owner,
                                            const std::vector<uint8_t> &bucket_id,
                                            const std::string &location,
                                            uint64_t size,
                                            const hashing::H256 &fingerprint);

    // Fingerprint and file key of one file, each computed at most once.
    //
    // getFingerprint() streams the file through a reassembler into a fresh sink
    // and caches the sink's root. Concurrent first callers share a single
    // traversal. Errors propagate to every waiting caller and leave the cache
    // empty, so a later call opens a new stream and tries again.
    class FileManager
    {
    public:
        FileManager(byte_stream::FileSource file,
                    load_config::FingerprintConfig config,
                    SinkFactory sink_factory = SinkFactory(),
                    std::shared_ptr<hashing::Hasher> hasher = std::shared_ptr<hashing::Hasher>());

        FileManager(const FileManager &) = delete;
        FileManager &operator=(const FileManager &) = delete;

        // Uses the reassembler selected in the configuration.
        hashing::H256 getFingerprint();
        hashing::H256 getFingerprint(reassembler::ReassemblerKind kind);

        hashing::H256 computeFileKey(const std::vector<uint8_t> &owner,
                                     const std::vector<uint8_t> &bucket_id,
                                     const std::string &location);

        uint64_t getFileSize() const { return file_.size; }

        // Contents captured during a general-path traversal with retain_file_contents enabled.
        // Runs that traversal if no fingerprint exists yet. Throws without any I/O when
        // retention is disabled.
        std::shared_ptr<const std::vector<uint8_t>> getFileContents();

        // Asks the running traversal to stop before its next read. Issued while no
        // traversal runs, it stops the next one before its stream is opened.
        void cancel() { cancel_token_.cancel(); }

    private:
        struct FingerprintRecord
        {
            hashing::H256 fingerprint;
            std::shared_ptr<const std::vector<uint8_t>> contents;
        };

        struct FileKeyRecord
        {
            std::vector<uint8_t> encoded;
            hashing::H256 key;
        };

        FingerprintRecord traverse(reassembler::ReassemblerKind kind);

        byte_stream::FileSource file_;
        load_config::FingerprintConfig config_;
        SinkFactory sink_factory_;
        std::shared_ptr<hashing::Hasher> hasher_;
        cancellation::CancellationToken cancel_token_;

        single_flight::SingleFlight<FingerprintRecord> fingerprint_;
        single_flight::SingleFlight<FileKeyRecord> file_key_;
    };

} // namespace file_manager

#endif // FILE_MANAGER_HPP
