//
// Created by moinshaikh on 3/2/26.
//

#include<vector>

#include<spdlog/sinks/basic_file_sink.h>
#include<spdlog/sinks/stdout_color_sinks.h>

#include"../include/Logging.hpp"

#include<doctest/doctest.h>

namespace PolicyHub
{
    std::shared_ptr<spdlog::logger> makeLogger(const std::string &tag, const std::filesystem::path &logDir)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (!logDir.empty())
        {
            std::filesystem::create_directories(logDir);
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>((logDir / (tag + ".log")).string()));
        }

        auto logger = std::make_shared<spdlog::logger>(tag, sinks.begin(), sinks.end());
        logger->set_pattern("%^[%T %7l] [%n] %v%$");
        logger->set_level(spdlog::get_level());
        return logger;
    }

    TEST_CASE("makeLogger")
    {
        SUBCASE("Console only when no directory is given")
        {
            auto logger = makeLogger("CONSOLE_ONLY");
            CHECK(logger->name() == "CONSOLE_ONLY");
            CHECK(logger->sinks().size() == 1);
        }

        SUBCASE("Writes a file named after the tag")
        {
            auto dir = std::filesystem::temp_directory_path() / "policyhub_logging_test";
            std::filesystem::remove_all(dir);
            {
                auto logger = makeLogger("FILE_LOGGER", dir);
                CHECK(logger->sinks().size() == 2);
                logger->warn("hello");
                logger->flush();
            }
            CHECK(std::filesystem::exists(dir / "FILE_LOGGER.log"));
            CHECK(std::filesystem::file_size(dir / "FILE_LOGGER.log") > 0);
            std::filesystem::remove_all(dir);
        }
    }
}
