//
// Created by moinshaikh on 3/10/26.
//

#include<fmt/format.h>

#include"../../include/Manager/ManagerFactory.hpp"

#include<doctest/doctest.h>

namespace PolicyHub
{
    ManagerMode parseManagerMode(const std::string &name)
    {
        if (name == "simple" || name == "local")
        {
            return ManagerMode::Local;
        }
        if (name == "multi-process")
        {
            return ManagerMode::MultiProcess;
        }
        if (name == "distributed")
        {
            return ManagerMode::Distributed;
        }
        throw ConfigurationError(fmt::format("Unsupported policy manager type: {}. "
                                             "Supported modes: simple, multi-process, distributed", name));
    }

    std::unique_ptr<PolicyManager> makePolicyManager(const ManagerConfig &config,
                                                     const std::map<std::string, std::shared_ptr<Policy>> &policies,
                                                     const std::map<std::string, PolicyFactory> &factories)
    {
        switch (config.mode)
        {
            case ManagerMode::Local:
                return std::make_unique<LocalPolicyManager>(policies, config.options);
            case ManagerMode::MultiProcess:
                return std::make_unique<MultiProcessPolicyManager>(policies, config.numTrainers, factories,
                                                                   config.options, config.process);
            case ManagerMode::Distributed:
            {
                if (config.group.empty() || config.address.empty())
                {
                    throw ConfigurationError("A distributed policy manager needs a group and an address");
                }
                auto context = config.context ? config.context : std::make_shared<zmq::context_t>(1);
                auto endpoint = std::make_unique<ZmqManagerEndpoint>(std::move(context), config.group, config.address,
                                                                     config.numTrainers, config.endpoint);
                return std::make_unique<DistributedPolicyManager>(policies, std::move(endpoint), config.options);
            }
        }
        throw ConfigurationError("Unknown policy manager mode");
    }

    TEST_CASE("parseManagerMode")
    {
        CHECK(parseManagerMode("simple") == ManagerMode::Local);
        CHECK(parseManagerMode("local") == ManagerMode::Local);
        CHECK(parseManagerMode("multi-process") == ManagerMode::MultiProcess);
        CHECK(parseManagerMode("distributed") == ManagerMode::Distributed);

        SUBCASE("Unknown names list the supported modes")
        {
            try
            {
                parseManagerMode("threaded");
                FAIL("no exception thrown");
            }
            catch (const ConfigurationError &e)
            {
                std::string message = e.what();
                CHECK(message.find("threaded") != std::string::npos);
                CHECK(message.find("simple, multi-process, distributed") != std::string::npos);
            }
        }
    }

    TEST_CASE("makePolicyManager rejects distributed configurations without an address")
    {
        ManagerConfig config;
        config.mode = ManagerMode::Distributed;
        config.group = "GROUP";
        CHECK_THROWS_AS(makePolicyManager(config, {}), ConfigurationError);
    }
}
