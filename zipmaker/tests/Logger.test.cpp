#include "zipmaker/conf.hpp"
#include "zipmaker/Logger.hpp"

#include "TestUtilities.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <fstream>
#include <string>
#include <vector>

using Catch::Matchers::Matches;

namespace
{
    std::vector<std::string> ReadLines(const std::filesystem::path& path)
    {
        std::ifstream file(path);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(file, line))
        {
            lines.push_back(line);
        }
        return lines;
    }
}

SCENARIO("Logging to a text file")
{
    TemporaryDirectory dir;
    const std::string previous_conf_path = Conf::conf_path;
    Conf::conf_path = (dir / "conf.json").string();

    GIVEN("a conf with text file output enabled")
    {
        WriteFile(Conf::conf_path, ToBytes("{\"LogToTxtFile\": true, \"LogToConsole\": false}"));

        Logger logger;
        const std::filesystem::path log_path = logger.GetBaseFilename() + "_zipmaker.txt";

        WHEN("messages are logged then the logger is stopped")
        {
            constexpr int num_messages = 200;
            for (int i = 0; i < num_messages; ++i)
            {
                logger.Info("message " + std::to_string(i));
            }
            logger.Warning("almost done");
            logger.Error("done");
            logger.Stop();
            logger.Info("too late");

            const std::vector<std::string> lines = ReadLines(log_path);
            std::filesystem::remove(log_path);

            THEN("every queued message is in the file with its elapsed time")
            {
                REQUIRE(lines.size() == num_messages + 2);
                for (int i = 0; i < num_messages; ++i)
                {
                    CHECK_THAT(lines[i], Matches("\\[\\d+:\\d{2}:\\d{2}:\\d{3}\\] \\[INFO\\] message " + std::to_string(i)));
                }
                CHECK_THAT(lines[num_messages], Matches("\\[\\d+:\\d{2}:\\d{2}:\\d{3}\\] \\[WARNING\\] almost done"));
                CHECK_THAT(lines[num_messages + 1], Matches("\\[\\d+:\\d{2}:\\d{2}:\\d{3}\\] \\[ERROR\\] done"));
            }
        }

        WHEN("the logger is stopped twice")
        {
            logger.Info("only one");
            logger.Stop();
            logger.Stop();

            const std::vector<std::string> lines = ReadLines(log_path);
            std::filesystem::remove(log_path);

            THEN("nothing is lost")
            {
                REQUIRE(lines.size() == 1);
                CHECK_THAT(lines[0], Matches("\\[0:00:\\d{2}:\\d{3}\\] \\[INFO\\] only one"));
            }
        }
    }

    GIVEN("a conf with text file output disabled")
    {
        WriteFile(Conf::conf_path, ToBytes("{\"LogToTxtFile\": false, \"LogToConsole\": false}"));

        Logger logger;
        logger.Info("not written");
        logger.Stop();

        THEN("no file is created")
        {
            CHECK_FALSE(std::filesystem::exists(logger.GetBaseFilename() + "_zipmaker.txt"));
        }
    }

    Conf::conf_path = previous_conf_path;
}
