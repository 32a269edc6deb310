#include "load_config.hpp"
#include "../errors/errors.hpp"
#include "../logger/Mylogger.hpp"
#include <fstream>

namespace ConfigReader
{
    json load(const std::string &filepath)
    {
        std::ifstream config_file(filepath);
        if (!config_file.is_open())
        {
            MyLogger::error("Unable to open configuration file: " + filepath);
            throw errors::ConfigError("Could not open config file: " + filepath);
        }

        try
        {
            json j;
            config_file >> j;
            MyLogger::info("Configuration file loaded successfully: " + filepath);
            MyLogger::debug("Loaded JSON: " + j.dump(4));
            return j;
        }
        catch (const json::parse_error &e)
        {
            MyLogger::error("JSON parse error in file " + filepath + ": " + e.what());
            throw errors::ConfigError("Invalid JSON in config file " + filepath + ": " + e.what());
        }
    }

    bool save(const std::string &filepath, const json &j)
    {
        std::ofstream config_file(filepath);
        if (!config_file.is_open())
        {
            MyLogger::error("Unable to open configuration file for writing: " + filepath);
            throw errors::ConfigError("Could not open config file for writing: " + filepath);
        }

        config_file << j.dump(4);
        if (!config_file)
        {
            MyLogger::error("Error saving JSON to file " + filepath);
            return false;
        }
        MyLogger::info("Configuration file saved successfully: " + filepath);
        return true;
    }

    uint64_t get_config_u64(const std::string &key, const json &j, uint64_t fallback)
    {
        if (!j.contains(key))
        {
            MyLogger::debug("Key not found in JSON, using default: " + key);
            return fallback;
        }
        const json &value = j[key];
        if (!value.is_number_integer() || (!value.is_number_unsigned() && value.get<int64_t>() < 0))
        {
            MyLogger::error("Key is not an unsigned integer: " + key);
            throw errors::ConfigError("Config key is not an unsigned integer: " + key);
        }
        return value.get<uint64_t>();
    }

    std::string get_config_string(const std::string &key, const json &j, const std::string &fallback)
    {
        if (!j.contains(key))
        {
            MyLogger::debug("Key not found in JSON, using default: " + key);
            return fallback;
        }
        if (!j[key].is_string())
        {
            MyLogger::error("Key is not a string: " + key);
            throw errors::ConfigError("Config key is not a string: " + key);
        }
        return j[key].get<std::string>();
    }

    bool get_config_bool(const std::string &key, const json &j, bool fallback)
    {
        if (!j.contains(key))
        {
            MyLogger::debug("Key not found in JSON, using default: " + key);
            return fallback;
        }
        if (!j[key].is_boolean())
        {
            MyLogger::error("Key is not a boolean: " + key);
            throw errors::ConfigError("Config key is not a boolean: " + key);
        }
        return j[key].get<bool>();
    }
}

namespace load_config
{
    void validate(const FingerprintConfig &config)
    {
        if (config.chunk_size_bytes != constants::CHUNK_SIZE)
        {
            throw errors::ConfigError("chunk_size_bytes must be " + std::to_string(constants::CHUNK_SIZE) +
                                      ", got " + std::to_string(config.chunk_size_bytes));
        }
        if (config.batch_target_bytes == 0)
        {
            throw errors::ConfigError("batch_target_bytes must be positive");
        }
        if (config.read_fragment_bytes == 0)
        {
            throw errors::ConfigError("read_fragment_bytes must be positive");
        }
    }

    reassembler::ReassemblerKind parseReassemblerKind(const std::string &name)
    {
        if (name == "general")
            return reassembler::ReassemblerKind::General;
        if (name == "zero_copy")
            return reassembler::ReassemblerKind::ZeroCopy;
        throw errors::ConfigError("Unknown reassembler: " + name + " (expected \"general\" or \"zero_copy\")");
    }

    FingerprintConfig fromJson(const json &j)
    {
        if (!j.is_object())
        {
            throw errors::ConfigError("Fingerprint configuration must be a JSON object");
        }

        FingerprintConfig config;
        config.chunk_size_bytes = ConfigReader::get_config_u64("chunk_size_bytes", j, config.chunk_size_bytes);
        config.batch_target_bytes = ConfigReader::get_config_u64("batch_target_bytes", j, config.batch_target_bytes);
        config.max_fingerprintable_bytes =
            ConfigReader::get_config_u64("max_fingerprintable_bytes", j, config.max_fingerprintable_bytes);
        config.reassembler = parseReassemblerKind(
            ConfigReader::get_config_string("reassembler", j, reassembler::toString(config.reassembler)));
        config.read_fragment_bytes = ConfigReader::get_config_u64("read_fragment_bytes", j, config.read_fragment_bytes);
        config.retain_file_contents = ConfigReader::get_config_bool("retain_file_contents", j, config.retain_file_contents);
        config.log_level = ConfigReader::get_config_string("log_level", j, config.log_level);
        config.log_file = ConfigReader::get_config_string("log_file", j, config.log_file);

        validate(config);
        return config;
    }

    json toJson(const FingerprintConfig &config)
    {
        return json{
            {"chunk_size_bytes", config.chunk_size_bytes},
            {"batch_target_bytes", config.batch_target_bytes},
            {"max_fingerprintable_bytes", config.max_fingerprintable_bytes},
            {"reassembler", reassembler::toString(config.reassembler)},
            {"read_fragment_bytes", config.read_fragment_bytes},
            {"retain_file_contents", config.retain_file_contents},
            {"log_level", config.log_level},
            {"log_file", config.log_file}};
    }

    FingerprintConfig loadFingerprintConfig(const std::string &filepath)
    {
        return fromJson(ConfigReader::load(filepath));
    }
}
