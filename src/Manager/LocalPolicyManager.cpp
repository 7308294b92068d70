//
// Created by moinshaikh on 3/7/26.
//

#include<chrono>

#include"../../include/Manager/LocalPolicyManager.hpp"

namespace PolicyHub
{
    LocalPolicyManager::LocalPolicyManager(const std::map<std::string, std::shared_ptr<Policy>> &policies,
                                           PolicyManagerOptions options) :
        PolicyManager(policies, std::move(options))
    {

    }

    void LocalPolicyManager::update(std::map<std::string, ExperienceSet> experienceByPolicy)
    {
        checkOpen();
        checkPolicyNames(experienceByPolicy);
        auto start = std::chrono::steady_clock::now();

        // Counters are only published once the round completed
        auto counters = newExperienceCount;
        std::set<std::string> updated;
        std::map<std::string, PolicyState> states;
        for (auto &entry : experienceByPolicy)
        {
            const auto &name = entry.first;
            auto &policy = policies.at(name);
            counters[name] += entry.second.size();
            policy->experienceStore().put(std::move(entry.second));
            if (counters[name] >= static_cast<std::size_t>(updateTrigger.at(name)) &&
                policy->experienceStore().size() >= static_cast<std::size_t>(warmup.at(name)))
            {
                policy->learn();
                updated.insert(name);
                counters[name] = 0;
                states[name] = policy->getState();
            }
        }
        newExperienceCount = std::move(counters);

        Tracker tracker;
        for (const auto &entry : policies)
        {
            tracker[entry.first] = entry.second->tracker();
        }
        commitRound(updated, std::move(states), {tracker});

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        logger->debug("policy update time: {} ms", elapsed.count());
    }
}
