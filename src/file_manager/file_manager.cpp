#include "file_manager.hpp"
#include "../errors/errors.hpp"
#include "../logger/Mylogger.hpp"
#include <chrono>

namespace file_manager
{

    namespace
    {
        void appendU32(std::vector<uint8_t> &out, uint32_t value)
        {
            for (int shift = 24; shift >= 0; shift -= 8)
            {
                out.push_back(static_cast<uint8_t>(value >> shift));
            }
        }

        void appendU64(std::vector<uint8_t> &out, uint64_t value)
        {
            for (int shift = 56; shift >= 0; shift -= 8)
            {
                out.push_back(static_cast<uint8_t>(value >> shift));
            }
        }

        void appendBytes(std::vector<uint8_t> &out, const uint8_t *data, std::size_t size)
        {
            appendU32(out, static_cast<uint32_t>(size));
            out.insert(out.end(), data, data + size);
        }
    }

    std::vector<uint8_t> encodeFileMetadata(const std::vector<uint8_t> &owner,
                                            const std::vector<uint8_t> &bucket_id,
                                            const std::string &location,
                                            uint64_t size,
                                            const hashing::H256 &fingerprint)
    {
        std::vector<uint8_t> out;
        out.reserve(4 * 4 + 8 + owner.size() + bucket_id.size() + location.size() + fingerprint.size());
        appendBytes(out, owner.data(), owner.size());
        appendBytes(out, bucket_id.data(), bucket_id.size());
        appendBytes(out, reinterpret_cast<const uint8_t *>(location.data()), location.size());
        appendU64(out, size);
        appendBytes(out, fingerprint.data(), fingerprint.size());
        return out;
    }

    FileManager::FileManager(byte_stream::FileSource file,
                             load_config::FingerprintConfig config,
                             SinkFactory sink_factory,
                             std::shared_ptr<hashing::Hasher> hasher)
        : file_(std::move(file)),
          config_(std::move(config)),
          sink_factory_(std::move(sink_factory)),
          hasher_(std::move(hasher))
    {
        load_config::validate(config_);
        if (!file_.open)
        {
            throw errors::StreamReadError("File source has no stream factory");
        }
        if (!sink_factory_)
        {
            sink_factory_ = []()
            { return std::unique_ptr<merkle::ChunkSink>(std::make_unique<merkle::Sha256MerkleAccumulator>()); };
        }
        if (!hasher_)
        {
            hasher_ = std::make_shared<hashing::Sha256Hasher>();
        }
    }

    FileManager::FingerprintRecord FileManager::traverse(reassembler::ReassemblerKind kind)
    {
        // A cancel() issued before this point still applies to this run.
        cancellation::ResetOnExit rearm(cancel_token_);

        if (file_.size > config_.max_fingerprintable_bytes)
        {
            MyLogger::error("Refusing to fingerprint " + std::to_string(file_.size) + " bytes, limit is " +
                            std::to_string(config_.max_fingerprintable_bytes));
            throw errors::FileTooLarge(file_.size, config_.max_fingerprintable_bytes);
        }

        cancel_token_.throwIfCancelled();
        auto started = std::chrono::steady_clock::now();

        std::unique_ptr<merkle::ChunkSink> sink = sink_factory_();
        std::unique_ptr<reassembler::Reassembler> chunker =
            reassembler::makeReassembler(kind, *sink, config_.batch_target_bytes);

        std::shared_ptr<std::vector<uint8_t>> contents;
        if (kind == reassembler::ReassemblerKind::General && config_.retain_file_contents)
        {
            contents = std::make_shared<std::vector<uint8_t>>();
            contents->reserve(file_.size);
            static_cast<reassembler::GeneralReassembler &>(*chunker).captureContents(contents.get());
        }

        MyLogger::debug("Fingerprinting " + std::to_string(file_.size) + " bytes with the " +
                        reassembler::toString(kind) + " reassembler");

        try
        {
            std::unique_ptr<byte_stream::ByteStream> stream = file_.open();
            if (!stream)
            {
                throw errors::StreamReadError("File source returned no stream");
            }
            byte_stream::StreamGuard guard(*stream);

            byte_stream::Fragment fragment;
            while (true)
            {
                cancel_token_.throwIfCancelled();
                if (!stream->read(fragment))
                    break;
                chunker->push(fragment.data, fragment.size);
            }
            chunker->finish();
        }
        catch (const std::exception &e)
        {
            MyLogger::error(std::string("Fingerprint computation aborted: ") + e.what());
            throw;
        }

        if (chunker->bytesConsumed() != file_.size)
        {
            MyLogger::warning("Declared size " + std::to_string(file_.size) + " differs from streamed size " +
                              std::to_string(chunker->bytesConsumed()));
        }

        FingerprintRecord record;
        record.fingerprint = sink->getRoot();
        record.contents = contents;

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        MyLogger::info("Fingerprint " + hashing::toHex(record.fingerprint) + " computed over " +
                       std::to_string(chunker->bytesConsumed()) + " bytes in " + std::to_string(elapsed.count()) + " ms");
        return record;
    }

    hashing::H256 FileManager::getFingerprint()
    {
        return getFingerprint(config_.reassembler);
    }

    hashing::H256 FileManager::getFingerprint(reassembler::ReassemblerKind kind)
    {
        return fingerprint_.get([this, kind]()
                                { return traverse(kind); })
            .fingerprint;
    }

    std::shared_ptr<const std::vector<uint8_t>> FileManager::getFileContents()
    {
        if (!config_.retain_file_contents)
        {
            throw errors::FingerprintError("File contents are only kept with retain_file_contents enabled");
        }
        FingerprintRecord record = fingerprint_.get([this]()
                                                    { return traverse(reassembler::ReassemblerKind::General); });
        if (!record.contents)
        {
            throw errors::FingerprintError("File contents were not retained during fingerprint computation");
        }
        return record.contents;
    }

    hashing::H256 FileManager::computeFileKey(const std::vector<uint8_t> &owner,
                                              const std::vector<uint8_t> &bucket_id,
                                              const std::string &location)
    {
        hashing::H256 fingerprint = getFingerprint();
        std::vector<uint8_t> encoded = encodeFileMetadata(owner, bucket_id, location, file_.size, fingerprint);

        FileKeyRecord record = file_key_.get([this, &encoded]()
                                             { return FileKeyRecord{encoded, hasher_->hash(encoded.data(), encoded.size())}; });
        if (record.encoded == encoded)
        {
            return record.key;
        }

        // Different owner, bucket or location than the cached key.
        FileKeyRecord fresh{encoded, hasher_->hash(encoded.data(), encoded.size())};
        file_key_.set(fresh);
        MyLogger::debug("File key recomputed for location " + location);
        return fresh.key;
    }

} // namespace file_manager
