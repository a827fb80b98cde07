#pragma once

#include "zipmaker/Encoder.hpp"

#include <protocolCraft/Utilities/Json.hpp>

#include <ctime>
#include <shared_mutex>
#include <string>

class Conf
{
public:
    static const std::string compression_method_key;
    static const std::string output_path_key;
    static const std::string normalize_text_key;
    static const std::string verify_archive_key;
    static const std::string console_log_key;
    static const std::string text_file_log_key;
    static const std::string sample_size_key;
    static const std::string small_file_threshold_key;
    static const std::string high_entropy_threshold_key;
    static const std::string medium_entropy_threshold_key;

    static bool headless;
    static std::string conf_path;
    static std::shared_mutex conf_mutex;

public:
    /// @brief Load the conf file, creating it if needed, with default values for missing keys
    static ProtocolCraft::Json::Value LoadConf();
    static void SaveConf(const ProtocolCraft::Json::Value& conf);
    static std::time_t GetModifiedTimestamp();

    /// @brief Extract encoder settings from a loaded conf, invalid values are replaced by defaults
    static EncoderSettings GetEncoderSettings(const ProtocolCraft::Json::Value& conf);
    /// @brief Get a boolean value, false if missing or not a boolean
    static bool GetBool(const ProtocolCraft::Json::Value& conf, const std::string& key);

private:
    static ProtocolCraft::Json::Value LoadConfFile();
};
