#include "zipmaker/conf.hpp"
#include "zipmaker/FileUtilities.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>

const std::string Conf::compression_method_key = "CompressionMethod";
const std::string Conf::output_path_key = "OutputPath";
const std::string Conf::normalize_text_key = "NormalizeText";
const std::string Conf::verify_archive_key = "VerifyArchive";
const std::string Conf::console_log_key = "LogToConsole";
const std::string Conf::text_file_log_key = "LogToTxtFile";
const std::string Conf::sample_size_key = "SampleSize";
const std::string Conf::small_file_threshold_key = "SmallFileThreshold";
const std::string Conf::high_entropy_threshold_key = "HighEntropyThreshold";
const std::string Conf::medium_entropy_threshold_key = "MediumEntropyThreshold";

#ifdef WITH_GUI
bool Conf::headless = false;
#else
bool Conf::headless = true;
#endif

std::string Conf::conf_path = "";

std::shared_mutex Conf::conf_mutex;

ProtocolCraft::Json::Value Conf::LoadConf()
{
    ProtocolCraft::Json::Value json = LoadConfFile();

    const ClassifierSettings default_classifier;

    // Set default values if missing
    if (!json.contains(compression_method_key))
        json[compression_method_key] = "auto";
    if (!json.contains(output_path_key))
        json[output_path_key] = "";
    if (!json.contains(normalize_text_key))
        json[normalize_text_key] = false;
    if (!json.contains(verify_archive_key))
        json[verify_archive_key] = false;
    if (!json.contains(console_log_key))
        json[console_log_key] = true;
    if (!json.contains(text_file_log_key))
        json[text_file_log_key] = false;
    if (!json.contains(sample_size_key))
        json[sample_size_key] = default_classifier.sample_size;
    if (!json.contains(small_file_threshold_key))
        json[small_file_threshold_key] = default_classifier.small_file_threshold;
    if (!json.contains(high_entropy_threshold_key))
        json[high_entropy_threshold_key] = default_classifier.high_entropy_threshold;
    if (!json.contains(medium_entropy_threshold_key))
        json[medium_entropy_threshold_key] = default_classifier.medium_entropy_threshold;

    return json;
}

void Conf::SaveConf(const ProtocolCraft::Json::Value& conf)
{
    if (conf_path.empty())
    {
        conf_path = "conf.json";
    }

    std::ofstream file = std::ofstream(conf_path, std::ios::out);
    if (!file.is_open())
    {
        throw std::runtime_error("Error trying to open conf file at: " + conf_path);
    }

    file << conf.Dump(4);
    file.close();
}

std::time_t Conf::GetModifiedTimestamp()
{
    return ::GetModifiedTimestamp(conf_path);
}

EncoderSettings Conf::GetEncoderSettings(const ProtocolCraft::Json::Value& conf)
{
    EncoderSettings settings;
    settings.normalize_text = GetBool(conf, normalize_text_key);

    if (conf.contains(sample_size_key) && conf[sample_size_key].is_number() && conf[sample_size_key].get_number<double>() > 0)
    {
        settings.classifier.sample_size = conf[sample_size_key].get_number<size_t>();
    }
    if (conf.contains(small_file_threshold_key) && conf[small_file_threshold_key].is_number() && conf[small_file_threshold_key].get_number<double>() >= 0)
    {
        settings.classifier.small_file_threshold = conf[small_file_threshold_key].get_number<size_t>();
    }
    if (conf.contains(high_entropy_threshold_key) && conf[high_entropy_threshold_key].is_number())
    {
        settings.classifier.high_entropy_threshold = conf[high_entropy_threshold_key].get_number<double>();
    }
    if (conf.contains(medium_entropy_threshold_key) && conf[medium_entropy_threshold_key].is_number())
    {
        settings.classifier.medium_entropy_threshold = conf[medium_entropy_threshold_key].get_number<double>();
    }

    return settings;
}

bool Conf::GetBool(const ProtocolCraft::Json::Value& conf, const std::string& key)
{
    return conf.contains(key) && conf[key].is_bool() && conf[key].get<bool>();
}

ProtocolCraft::Json::Value Conf::LoadConfFile()
{
    if (conf_path.empty())
    {
        conf_path = "conf.json";
    }

    // Create file if it doesn't exist
    if (!std::filesystem::exists(conf_path))
    {
        std::ofstream outfile(conf_path, std::ios::out);
        if (!outfile.is_open())
        {
            throw std::runtime_error("Error trying to create conf file at: " + conf_path);
        }
        outfile << ProtocolCraft::Json::Value(ProtocolCraft::Json::Object()).Dump(4);
    }

    std::ifstream file = std::ifstream(conf_path, std::ios::in);
    if (!file.is_open())
    {
        throw std::runtime_error("Error trying to open conf file at: " + conf_path);
    }
    ProtocolCraft::Json::Value json;
    file >> json;
    file.close();

    if (!json.is_object())
    {
        json = ProtocolCraft::Json::Object();
    }

    return json;
}
