/**
 * @file Trainer.cpp
 * @brief Trainer unit protocol and its process and node hosts
 * @author moinshaikh
 * @date 3/6/26
 */

#include<chrono>
#include<stdexcept>

#include<unistd.h>

#include<fmt/format.h>
#include<fmt/ranges.h>

#include"../../include/Communication/Endpoint.hpp"
#include"../../include/Logging.hpp"
#include"../../include/Trainer/Trainer.hpp"

namespace PolicyHub
{
    Trainer::Trainer(std::string trainerId,
                     std::map<std::string, PolicyFactory> factories,
                     std::shared_ptr<spdlog::logger> logger) :
        trainerId(std::move(trainerId)),
        factories(std::move(factories)),
        logger(logger ? std::move(logger) : makeLogger(this->trainerId))
    {

    }

    Message Trainer::initialize(const Message &request)
    {
        for (const auto &entry : request.policyState)
        {
            const auto &name = entry.first;
            auto policy = policies.find(name);
            if (policy == policies.end())
            {
                auto factory = factories.find(name);
                if (factory == factories.end() || !factory->second)
                {
                    throw ConfigurationError(fmt::format("{} has no factory for policy {}", trainerId, name));
                }
                auto created = factory->second(name);
                if (!created)
                {
                    throw ConfigurationError(fmt::format("Factory of policy {} returned no policy", name));
                }
                policy = policies.emplace(name, std::move(created)).first;
            }
            policy->second->setState(entry.second);
        }

        std::vector<std::string> names;
        for (const auto &entry : policies)
        {
            names.push_back(entry.first);
        }
        logger->info("{} initialized policies [{}]", trainerId, fmt::join(names, ", "));

        Message reply;
        reply.type = MessageTag::InitDone;
        reply.sender = trainerId;
        return reply;
    }

    Message Trainer::train(Message &&request)
    {
        Message reply;
        reply.type = MessageTag::LearnDone;
        reply.sender = trainerId;

        for (auto &entry : request.experiences)
        {
            if (entry.second.empty())
            {
                continue;
            }
            auto policy = policies.find(entry.first);
            if (policy == policies.end())
            {
                throw ProtocolError(fmt::format("{} does not own policy {}", trainerId, entry.first));
            }

            auto start = std::chrono::steady_clock::now();
            policy->second->experienceStore().put(std::move(entry.second));
            policy->second->learn();
            reply.policyState[entry.first] = policy->second->getState();
            reply.tracker[entry.first] = policy->second->tracker();
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
            logger->debug("{} learned {} in {} ms", trainerId, entry.first, elapsed.count());
        }
        return reply;
    }

    std::optional<Message> Trainer::handle(Message &&request)
    {
        try
        {
            switch (request.type)
            {
                case MessageTag::InitPolicyState:
                    return initialize(request);
                case MessageTag::Learn:
                    return train(std::move(request));
                case MessageTag::Exit:
                    logger->info("{} exiting", trainerId);
                    return std::nullopt;
                default:
                    throw ProtocolError(fmt::format("{} cannot handle {}", trainerId, tagName(request.type)));
            }
        }
        catch (const std::exception &e)
        {
            logger->error("{} failed to handle {}: {}", trainerId, tagName(request.type), e.what());
            Message reply;
            reply.type = MessageTag::Error;
            reply.sender = trainerId;
            reply.error = e.what();
            return reply;
        }
    }

    void serve(Trainer &trainer, Connection &connection)
    {
        while (true)
        {
            auto reply = trainer.handle(connection.receive());
            if (!reply)
            {
                return;
            }
            connection.send(*reply);
        }
    }

    void runTrainerProcess(const std::string &trainerId,
                           const std::string &url,
                           std::map<std::string, PolicyFactory> factories,
                           const std::filesystem::path &logDir)
    {
        auto logger = makeLogger(trainerId, logDir);
        zmq::context_t context(1);
        Channel channel(context, url, Channel::Mode::Connect);
        Trainer trainer(trainerId, std::move(factories), logger);
        logger->info("{} started in process {}", trainerId, ::getpid());
        serve(trainer, channel);
    }

    TrainerNode::TrainerNode(std::shared_ptr<zmq::context_t> context,
                             const std::string &group,
                             const std::string &address,
                             const std::string &trainerId,
                             std::map<std::string, PolicyFactory> factories,
                             const std::filesystem::path &logDir) :
        endpoint(std::make_unique<ZmqWorkerEndpoint>(std::move(context), group, address, trainerId)),
        trainer(trainerId, std::move(factories), makeLogger(trainerId, logDir))
    {

    }

    void TrainerNode::run()
    {
        serve(trainer, *endpoint);
    }
}
