//
// Created by moinshaikh on 3/9/26.
//

#include<chrono>

#include<fmt/format.h>
#include<fmt/ranges.h>

#include"../../include/Manager/DistributedPolicyManager.hpp"

namespace PolicyHub
{
    DistributedPolicyManager::DistributedPolicyManager(const std::map<std::string, std::shared_ptr<Policy>> &policies,
                                                       std::unique_ptr<ManagerEndpoint> endpoint,
                                                       PolicyManagerOptions options) :
        PolicyManager(policies, std::move(options)),
        endpoint(std::move(endpoint)),
        faulted(false)
    {
        if (!this->endpoint)
        {
            throw ConfigurationError("A distributed policy manager needs an endpoint");
        }
        if (this->endpoint->workers().empty())
        {
            throw ConfigurationError("The endpoint did not discover any trainer");
        }
        assignment = assignRoundRobin(get_policy_names(), this->endpoint->workers());
        logger->info("Discovered trainers [{}]", fmt::join(this->endpoint->workers(), ", "));

        try
        {
            for (const auto &trainer : assignment.trainers)
            {
                Message request;
                request.type = MessageTag::InitPolicyState;
                request.policyState = cachedStates(assignment.trainerToPolicies.at(trainer));
                this->endpoint->send(trainer, request);
            }
            auto replies = collectReplies({assignment.trainers.begin(), assignment.trainers.end()}, MessageTag::InitDone);
            if (!replies.failures.empty())
            {
                throw TrainerError(fmt::format("Trainer initialization failed: {}", fmt::join(replies.failures, "; ")));
            }
        }
        catch (const std::exception &e)
        {
            logger->error("Releasing trainer nodes: {}", e.what());
            releaseTrainers();
            throw;
        }
        for (const auto &trainer : assignment.trainers)
        {
            logger->info("{} initialized policies [{}]", trainer, fmt::join(assignment.trainerToPolicies.at(trainer), ", "));
        }
    }

    DistributedPolicyManager::~DistributedPolicyManager()
    {
        if (!is_closed())
        {
            try
            {
                exit();
            }
            catch (const std::exception &e)
            {
                logger->error("Failed to shut down trainer nodes: {}", e.what());
            }
        }
    }

    PolicyManager::RoundReplies DistributedPolicyManager::collectReplies(std::set<std::string> pending, MessageTag expected)
    {
        RoundReplies replies;
        std::set<std::string> answered;
        while (!pending.empty())
        {
            auto received = endpoint->receive();
            const auto &sender = received.second;
            if (answered.count(sender))
            {
                throw ProtocolError(fmt::format("Duplicate {} reply from {}", tagName(received.first.type), sender));
            }
            if (!pending.count(sender))
            {
                throw ProtocolError(fmt::format("Unexpected {} reply from '{}'", tagName(received.first.type), sender));
            }
            absorbReply(sender, std::move(received.first), expected, replies);
            pending.erase(sender);
            answered.insert(sender);
        }
        return replies;
    }

    void DistributedPolicyManager::releaseTrainers()
    {
        Message quit;
        quit.type = MessageTag::Exit;
        for (const auto &trainer : assignment.trainers)
        {
            try
            {
                endpoint->send(trainer, quit);
            }
            catch (const TrainerError &e)
            {
                logger->error("Cannot tell {} to exit: {}", trainer, e.what());
            }
        }
        endpoint->close();
    }

    void DistributedPolicyManager::checkOpen() const
    {
        PolicyManager::checkOpen();
        if (faulted)
        {
            throw ManagerClosedError("update() called after a trainer transport failure; the policy manager must be exited");
        }
    }

    void DistributedPolicyManager::update(std::map<std::string, ExperienceSet> experienceByPolicy)
    {
        checkOpen();
        checkPolicyNames(experienceByPolicy);
        auto start = std::chrono::steady_clock::now();

        std::set<std::string> updated;
        auto due = stageExperiences(std::move(experienceByPolicy), updated);

        RoundReplies replies;
        try
        {
            for (const auto &trainer : assignment.trainers)
            {
                Message request;
                request.type = MessageTag::Learn;
                for (const auto &name : assignment.trainerToPolicies.at(trainer))
                {
                    auto batch = due.find(name);
                    if (batch != due.end())
                    {
                        request.experiences[name] = std::move(batch->second);
                    }
                }
                endpoint->send(trainer, request);
            }
            replies = collectReplies({assignment.trainers.begin(), assignment.trainers.end()}, MessageTag::LearnDone);
        }
        catch (const TrainerError &)
        {
            faulted = true;
            throw;
        }
        catch (const ProtocolError &)
        {
            faulted = true;
            throw;
        }

        if (!replies.failures.empty())
        {
            throw TrainerError(fmt::format("Update round failed: {}", fmt::join(replies.failures, "; ")));
        }
        commitRound(updated, std::move(replies.states), replies.trackers);

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        logger->debug("policy update time: {} ms", elapsed.count());
    }

    void DistributedPolicyManager::exit()
    {
        PolicyManager::exit();

        releaseTrainers();
        logger->info("Exiting...");
    }
}
