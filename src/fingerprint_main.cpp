#include "file_manager/file_manager.hpp"
#include "load_config/load_config.hpp"
#include "logger/Mylogger.hpp"
#include "errors/errors.hpp"
#include <chrono>
#include <iostream>
#include <string>

namespace
{
    void usage(const char *prog)
    {
        std::cerr << "Usage: " << prog << " <file> [options]\n"
                  << "  --config <path>          JSON configuration file\n"
                  << "  --reassembler <name>     general | zero_copy\n"
                  << "  --batch-bytes <n>        batch target for the zero-copy reassembler\n"
                  << "  --owner <hex>            owner account id (file key)\n"
                  << "  --bucket <hex>           bucket id (file key)\n"
                  << "  --location <path>        location inside the bucket (file key)\n";
    }
}

int main(int argc, char *argv[])
{
    if (argc < 2)
    {
        usage(argv[0]);
        return 1;
    }

    std::string file_path = argv[1];
    std::string config_path;
    std::string reassembler_name;
    std::string batch_bytes;
    std::string owner_hex;
    std::string bucket_hex;
    std::string location;

    for (int i = 2; i < argc; i++)
    {
        std::string arg = argv[i];
        if (i + 1 >= argc)
        {
            std::cerr << "Missing value for " << arg << "\n";
            usage(argv[0]);
            return 1;
        }
        std::string value = argv[++i];
        if (arg == "--config")
            config_path = value;
        else if (arg == "--reassembler")
            reassembler_name = value;
        else if (arg == "--batch-bytes")
            batch_bytes = value;
        else if (arg == "--owner")
            owner_hex = value;
        else if (arg == "--bucket")
            bucket_hex = value;
        else if (arg == "--location")
            location = value;
        else
        {
            std::cerr << "Unknown option: " << arg << "\n";
            usage(argv[0]);
            return 1;
        }
    }

    try
    {
        load_config::FingerprintConfig config;
        if (!config_path.empty())
        {
            config = load_config::loadFingerprintConfig(config_path);
        }
        if (!reassembler_name.empty())
        {
            config.reassembler = load_config::parseReassemblerKind(reassembler_name);
        }
        if (!batch_bytes.empty())
        {
            config.batch_target_bytes = std::stoull(batch_bytes);
        }
        load_config::validate(config);

        MyLogger::init(config.log_level, config.log_file);
        MyLogger::debug("Effective configuration: " + load_config::toJson(config).dump());

        file_manager::FileManager manager(byte_stream::fileSource(file_path, config.read_fragment_bytes), config);

        auto started = std::chrono::steady_clock::now();
        hashing::H256 fingerprint = manager.getFingerprint();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);

        std::cout << "File:        " << file_path << "\n"
                  << "Size:        " << manager.getFileSize() << " bytes\n"
                  << "Reassembler: " << reassembler::toString(config.reassembler) << "\n"
                  << "Fingerprint: 0x" << hashing::toHex(fingerprint) << "\n"
                  << "Elapsed:     " << elapsed.count() << " ms\n";

        if (!owner_hex.empty() || !bucket_hex.empty() || !location.empty())
        {
            if (owner_hex.empty() || bucket_hex.empty() || location.empty())
            {
                std::cerr << "--owner, --bucket and --location must be given together\n";
                return 1;
            }
            hashing::H256 file_key = manager.computeFileKey(hashing::fromHex(owner_hex),
                                                            hashing::fromHex(bucket_hex),
                                                            location);
            std::cout << "File key:    0x" << hashing::toHex(file_key) << "\n";
        }
    }
    catch (const errors::FileTooLarge &ex)
    {
        std::cerr << "Error: " << ex.what() << "\n";
        return 2;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
