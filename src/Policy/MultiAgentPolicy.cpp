//
// Created by moinshaikh on 3/12/26.
//

#include<fmt/format.h>
#include<spdlog/spdlog.h>

#include"../../include/Errors.hpp"
#include"../../include/Policy/MultiAgentPolicy.hpp"

namespace PolicyHub
{
    MultiAgentPolicy::MultiAgentPolicy(std::map<std::string, std::shared_ptr<Policy>> policies,
                                       std::map<std::string, std::string> agentToPolicy) :
        policies(std::move(policies)),
        agentToPolicy(std::move(agentToPolicy))
    {
        for (const auto &entry : this->policies)
        {
            if (!entry.second)
            {
                throw ConfigurationError(fmt::format("Policy '{}' is null", entry.first));
            }
        }
        for (const auto &entry : this->agentToPolicy)
        {
            if (!this->policies.count(entry.second))
            {
                throw ConfigurationError(fmt::format("Agent '{}' is mapped to unknown policy '{}'", entry.first, entry.second));
            }
        }
    }

    std::map<std::string, std::vector<float>> MultiAgentPolicy::chooseAction(const std::map<std::string, std::vector<float>> &stateByAgent)
    {
        std::map<std::string, std::vector<float>> actions;
        for (const auto &entry : stateByAgent)
        {
            auto agent = agentToPolicy.find(entry.first);
            if (agent == agentToPolicy.end())
            {
                throw ConfigurationError(fmt::format("Unknown agent '{}'", entry.first));
            }
            actions[entry.first] = policies.at(agent->second)->chooseAction(entry.second);
        }
        return actions;
    }

    std::vector<std::string> MultiAgentPolicy::onNewExperiences(std::map<std::string, ExperienceSet> experienceByAgent)
    {
        for (const auto &entry : experienceByAgent)
        {
            if (!agentToPolicy.count(entry.first))
            {
                throw ConfigurationError(fmt::format("Experience received for unknown agent '{}'", entry.first));
            }
        }
        for (auto &entry : experienceByAgent)
        {
            auto trainable = std::dynamic_pointer_cast<CorePolicy>(policies.at(agentToPolicy.at(entry.first)));
            if (trainable)
            {
                trainable->experienceStore().put(std::move(entry.second));
            }
        }

        std::vector<std::string> learned;
        for (const auto &entry : policies)
        {
            auto trainable = std::dynamic_pointer_cast<CorePolicy>(entry.second);
            if (trainable && trainable->learn())
            {
                learned.push_back(entry.first);
            }
        }
        return learned;
    }

    void MultiAgentPolicy::update(const std::map<std::string, PolicyState> &states)
    {
        std::map<std::string, std::shared_ptr<CorePolicy>> targets;
        for (const auto &entry : states)
        {
            auto policy = policies.find(entry.first);
            if (policy == policies.end())
            {
                throw ConfigurationError(fmt::format("State received for unknown policy '{}'", entry.first));
            }
            auto trainable = std::dynamic_pointer_cast<CorePolicy>(policy->second);
            if (!trainable)
            {
                throw ConfigurationError(fmt::format("Policy '{}' is rule-based and cannot load a state", entry.first));
            }
            targets[entry.first] = std::move(trainable);
        }
        for (const auto &entry : states)
        {
            targets.at(entry.first)->setState(entry.second);
        }
    }

    void MultiAgentPolicy::save(const std::filesystem::path &dir) const
    {
        std::filesystem::create_directories(dir);
        for (const auto &entry : policies)
        {
            auto trainable = std::dynamic_pointer_cast<CorePolicy>(entry.second);
            if (trainable)
            {
                trainable->save(dir / entry.first);
            }
        }
    }

    std::vector<std::string> MultiAgentPolicy::load(const std::filesystem::path &dir)
    {
        std::vector<std::string> loaded;
        for (const auto &entry : policies)
        {
            auto trainable = std::dynamic_pointer_cast<CorePolicy>(entry.second);
            if (!trainable)
            {
                continue;
            }
            if (trainable->load(dir / entry.first))
            {
                loaded.push_back(entry.first);
            }
            else
            {
                spdlog::warn("Policy {} is skipped because no file is found", entry.first);
            }
        }
        return loaded;
    }

    std::shared_ptr<Policy> MultiAgentPolicy::get_policy(const std::string &name) const
    {
        auto policy = policies.find(name);
        if (policy == policies.end())
        {
            throw ConfigurationError(fmt::format("Unknown policy '{}'", name));
        }
        return policy->second;
    }
}
