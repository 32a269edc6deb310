#ifndef LOAD_CONFIG_HPP
#define LOAD_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "../constants/constants.hpp"
#include "../reassembler/reassembler.hpp"

using json = nlohmann::json;

namespace ConfigReader
{
    // Throws errors::ConfigError if the file is missing or is not valid JSON.
    json load(const std::string &filepath);
    bool save(const std::string &filepath, const json &j);

    // Typed getters. A missing key yields the fallback; a key of the wrong type throws errors::ConfigError.
    uint64_t get_config_u64(const std::string &key, const json &j, uint64_t fallback);
    std::string get_config_string(const std::string &key, const json &j, const std::string &fallback);
    bool get_config_bool(const std::string &key, const json &j, bool fallback);
};

namespace load_config
{
    struct FingerprintConfig
    {
        std::size_t chunk_size_bytes = constants::CHUNK_SIZE;
        std::size_t batch_target_bytes = constants::DEFAULT_BATCH_TARGET_BYTES;
        uint64_t max_fingerprintable_bytes = constants::MAX_FINGERPRINTABLE_BYTES;
        reassembler::ReassemblerKind reassembler = reassembler::ReassemblerKind::ZeroCopy;
        std::size_t read_fragment_bytes = constants::DEFAULT_READ_FRAGMENT_BYTES;
        bool retain_file_contents = false;
        std::string log_level = "info";
        std::string log_file;
    };

    // Throws errors::ConfigError on invalid values.
    void validate(const FingerprintConfig &config);

    reassembler::ReassemblerKind parseReassemblerKind(const std::string &name);

    FingerprintConfig fromJson(const json &j);
    json toJson(const FingerprintConfig &config);

    FingerprintConfig loadFingerprintConfig(const std::string &filepath);
}

#endif // LOAD_CONFIG_HPP
