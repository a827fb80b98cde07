#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "zipmaker/ArchiveJob.hpp"
#include "zipmaker/conf.hpp"
#include "zipmaker/FileList.hpp"
#include "zipmaker/Logger.hpp"
#ifdef WITH_GUI
#include "zipmaker/Window.hpp"
#endif

void PrintUsage()
{
    std::cerr << "usage: zipmaker <optional:--headless> <optional:--method auto|deflate|bzip2|lzma|store> "
        "<optional:--output archive.zip> <optional:--conf conf_path> <files...>" << std::endl;
}

int RunHeadless(const std::shared_ptr<Logger>& logger, const std::vector<std::string>& inputs, const std::string& method, const std::string& output)
{
    FileList files;
    for (const std::string& input : inputs)
    {
        std::string error;
        if (!files.Add(input, error))
        {
            logger->Warning("Skipping file: " + error);
        }
    }

    ArchiveRequest request;
    request.files = files.Items();
    {
        std::shared_lock<std::shared_mutex> lock(Conf::conf_mutex);
        const ProtocolCraft::Json::Value conf = Conf::LoadConf();
        request.choice = ChoiceFromString(method.empty() ? conf[Conf::compression_method_key].get_string() : method);
        request.output_path = output.empty() ? conf[Conf::output_path_key].get_string() : output;
        request.settings = Conf::GetEncoderSettings(conf);
        request.verify = Conf::GetBool(conf, Conf::verify_archive_key);
    }
    if (!request.output_path.empty() && !request.output_path.has_extension())
    {
        request.output_path.replace_extension(".zip");
    }

    ArchiveJob job(logger);
    std::string error;
    if (!job.Run(request, error))
    {
        std::cerr << error << std::endl;
        return 1;
    }

    std::cout << job.GetStatus() << std::endl;
    return 0;
}

int main(int argc, char* argv[])
{
    std::vector<std::string> inputs;
    std::string method;
    std::string output;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg(argv[i]);
        if (arg == "--headless")
        {
            Conf::headless = true;
        }
        else if (arg == "--method" || arg == "--output" || arg == "--conf")
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value after " << arg << std::endl;
                PrintUsage();
                return 1;
            }
            const std::string value = argv[++i];
            if (arg == "--method")
            {
                method = value;
            }
            else if (arg == "--output")
            {
                output = value;
            }
            else
            {
                Conf::conf_path = value;
            }
        }
        else if (arg == "--help" || arg == "-h")
        {
            PrintUsage();
            return 0;
        }
        else
        {
            inputs.push_back(argv[i]);
        }
    }

    try
    {
        std::shared_ptr<Logger> logger = std::make_shared<Logger>();
        int result = 0;
#ifdef WITH_GUI
        if (!Conf::headless)
        {
            Window window(logger, inputs);
            window.Render();
        }
        else
        {
            result = RunHeadless(logger, inputs, method, output);
        }
#else
        result = RunHeadless(logger, inputs, method, output);
#endif
        logger->Stop();
        return result;
    }
    catch (std::exception& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
