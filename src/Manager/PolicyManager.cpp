/**
 * @file PolicyManager.cpp
 * @brief Shared bookkeeping of the policy managers: thresholds, version history and state cache
 * @author moinshaikh
 * @date 3/7/26
 */

#include<algorithm>

#include<fmt/format.h>
#include<fmt/ranges.h>

#include"../../include/Logging.hpp"
#include"../../include/Manager/PolicyManager.hpp"

#include<doctest/doctest.h>

namespace PolicyHub
{
    Assignment assignRoundRobin(const std::vector<std::string> &policyNames, const std::vector<std::string> &pool)
    {
        if (pool.empty())
        {
            throw ConfigurationError("Cannot assign policies to an empty trainer pool");
        }

        Assignment assignment;
        for (std::size_t i = 0; i < policyNames.size(); ++i)
        {
            const auto &trainer = pool[i % pool.size()];
            assignment.policyToTrainer[policyNames[i]] = trainer;
            assignment.trainerToPolicies[trainer].push_back(policyNames[i]);
        }
        for (const auto &trainer : pool)
        {
            if (assignment.trainerToPolicies.count(trainer) &&
                std::find(assignment.trainers.begin(), assignment.trainers.end(), trainer) == assignment.trainers.end())
            {
                assignment.trainers.push_back(trainer);
            }
        }
        return assignment;
    }

    static std::map<std::string, int> resolveThresholds(const std::map<std::string, int> &configured,
                                                        const std::map<std::string, std::shared_ptr<CorePolicy>> &policies,
                                                        const char *kind)
    {
        std::map<std::string, int> thresholds;
        for (const auto &entry : configured)
        {
            if (!policies.count(entry.first))
            {
                throw ConfigurationError(fmt::format("{} given for unknown policy '{}'", kind, entry.first));
            }
            if (entry.second < 1)
            {
                throw ConfigurationError(fmt::format("{} of policy '{}' must be at least 1, got {}",
                                                     kind, entry.first, entry.second));
            }
        }
        for (const auto &entry : policies)
        {
            auto found = configured.find(entry.first);
            thresholds[entry.first] = found == configured.end() ? 1 : found->second;
        }
        return thresholds;
    }

    PolicyManager::PolicyManager(const std::map<std::string, std::shared_ptr<Policy>> &policies,
                                 PolicyManagerOptions options) :
        checkpointDir(options.checkpointDir),
        checkpointEvery(options.checkpointEvery),
        postUpdate(std::move(options.postUpdate)),
        closed(false)
    {
        logger = makeLogger("POLICY_MANAGER", options.logDir);

        if (policies.empty())
        {
            throw ConfigurationError("A policy manager needs at least one policy");
        }
        for (const auto &entry : policies)
        {
            auto trainable = std::dynamic_pointer_cast<CorePolicy>(entry.second);
            if (!trainable)
            {
                throw ConfigurationError(fmt::format("Policy '{}' is not trainable; only CorePolicy instances "
                                                     "can be managed by a policy manager", entry.first));
            }
            this->policies[entry.first] = std::move(trainable);
        }

        updateTrigger = resolveThresholds(options.updateTrigger, this->policies, "Update trigger");
        warmup = resolveThresholds(options.warmup, this->policies, "Warm-up size");

        if (checkpointEvery < 0)
        {
            throw ConfigurationError(fmt::format("checkpointEvery must not be negative, got {}", checkpointEvery));
        }
        if (checkpointEvery > 0 && checkpointDir.empty())
        {
            throw ConfigurationError("checkpointEvery is set but no checkpoint directory is given");
        }

        for (const auto &entry : options.loadPaths)
        {
            auto policy = this->policies.find(entry.first);
            if (policy == this->policies.end())
            {
                throw ConfigurationError(fmt::format("Load path given for unknown policy '{}'", entry.first));
            }
            auto state = readPolicyState(entry.second);
            if (!state)
            {
                logger->warn("Policy {} is skipped because no file is found at {}", entry.first, entry.second.string());
                continue;
            }
            policy->second->setState(*state);
            logger->info("Loaded policy {} from {}", entry.first, entry.second.string());
        }

        std::set<std::string> all;
        for (const auto &entry : this->policies)
        {
            stateCache[entry.first] = entry.second->getState();
            all.insert(entry.first);
        }
        updateHistory.push_back(std::move(all));
    }

    void PolicyManager::checkOpen() const
    {
        if (closed)
        {
            throw ManagerClosedError("update() called after the policy manager exited");
        }
    }

    void PolicyManager::checkPolicyNames(const std::map<std::string, ExperienceSet> &experienceByPolicy) const
    {
        for (const auto &entry : experienceByPolicy)
        {
            if (!policies.count(entry.first))
            {
                throw ConfigurationError(fmt::format("Experience received for unknown policy '{}'", entry.first));
            }
        }
    }

    std::map<std::string, ExperienceSet> PolicyManager::stageExperiences(std::map<std::string, ExperienceSet> &&experienceByPolicy,
                                                                         std::set<std::string> &updated)
    {
        std::map<std::string, ExperienceSet> due;
        for (auto &entry : experienceByPolicy)
        {
            const auto &name = entry.first;
            experienceCount[name] += entry.second.size();
            auto &pending = experienceCache[name];
            pending.extend(std::move(entry.second));
            if (pending.size() >= static_cast<std::size_t>(updateTrigger.at(name)) &&
                experienceCount[name] >= static_cast<std::size_t>(warmup.at(name)))
            {
                due[name] = std::move(pending);
                experienceCache.erase(name);
                updated.insert(name);
            }
        }
        return due;
    }

    std::map<std::string, PolicyState> PolicyManager::cachedStates(const std::vector<std::string> &names) const
    {
        std::lock_guard<std::mutex> lock(mutex);
        std::map<std::string, PolicyState> states;
        for (const auto &name : names)
        {
            states[name] = stateCache.at(name);
        }
        return states;
    }

    void PolicyManager::absorbReply(const std::string &trainer, Message &&reply, MessageTag expected, RoundReplies &replies) const
    {
        if (reply.sender != trainer)
        {
            throw ProtocolError(fmt::format("Expected a reply from {} but got one from '{}'", trainer, reply.sender));
        }
        if (reply.type == MessageTag::Error)
        {
            logger->error("{} failed: {}", trainer, reply.error);
            replies.failures.push_back(fmt::format("{}: {}", trainer, reply.error));
            return;
        }
        if (reply.type != expected)
        {
            throw ProtocolError(fmt::format("Expected {} from {} but got {}", tagName(expected), trainer, tagName(reply.type)));
        }
        for (auto &entry : reply.policyState)
        {
            if (!policies.count(entry.first))
            {
                throw ProtocolError(fmt::format("{} reported state of unknown policy '{}'", trainer, entry.first));
            }
            replies.states[entry.first] = std::move(entry.second);
        }
        if (expected == MessageTag::LearnDone)
        {
            replies.trackers.push_back(std::move(reply.tracker));
        }
    }

    void PolicyManager::commitRound(const std::set<std::string> &updated,
                                    std::map<std::string, PolicyState> &&states,
                                    const std::vector<Tracker> &trackers)
    {
        std::map<std::string, PolicyState> checkpoints;
        {
            std::lock_guard<std::mutex> lock(mutex);
            for (auto &entry : states)
            {
                stateCache[entry.first] = std::move(entry.second);
            }
            updateHistory.push_back(updated);
            for (const auto &name : updated)
            {
                int count = ++updateCount[name];
                if (checkpointEvery > 0 && count % checkpointEvery == 0)
                {
                    checkpoints[name] = stateCache.at(name);
                }
            }
        }

        if (!updated.empty())
        {
            logger->info("Updated policies [{}]", fmt::join(updated, ", "));
        }
        // The round is already published at this point
        for (const auto &entry : checkpoints)
        {
            auto path = checkpointDir / entry.first;
            try
            {
                writePolicyState(path, entry.second);
                logger->info("Saved checkpoint of policy {} to {}", entry.first, path.string());
            }
            catch (const std::exception &e)
            {
                logger->error("Failed to save checkpoint of policy {} to {}: {}", entry.first, path.string(), e.what());
            }
        }

        if (postUpdate)
        {
            postUpdate(trackers);
        }
    }

    std::map<std::string, PolicyState> PolicyManager::getState(std::optional<int> sinceVersion) const
    {
        std::lock_guard<std::mutex> lock(mutex);
        int current = static_cast<int>(updateHistory.size()) - 1;
        int since = sinceVersion.value_or(current - 1);

        std::set<std::string> updated;
        for (int round = std::max(since + 1, 0); round <= current; ++round)
        {
            updated.insert(updateHistory[round].begin(), updateHistory[round].end());
        }

        std::map<std::string, PolicyState> states;
        for (const auto &name : updated)
        {
            states[name] = stateCache.at(name);
        }
        return states;
    }

    int PolicyManager::version() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return static_cast<int>(updateHistory.size()) - 1;
    }

    void PolicyManager::exit()
    {
        if (closed)
        {
            throw ManagerClosedError("exit() called on a policy manager that already exited");
        }
        closed = true;
    }

    std::vector<std::string> PolicyManager::get_policy_names() const
    {
        std::vector<std::string> names;
        for (const auto &entry : policies)
        {
            names.push_back(entry.first);
        }
        return names;
    }

    TEST_CASE("assignRoundRobin")
    {
        SUBCASE("Policy i goes to pool[i mod K]")
        {
            auto assignment = assignRoundRobin({"a", "b", "c", "d", "e"}, {"T0", "T1"});
            CHECK(assignment.trainers == std::vector<std::string>{"T0", "T1"});
            CHECK(assignment.trainerToPolicies["T0"] == std::vector<std::string>{"a", "c", "e"});
            CHECK(assignment.trainerToPolicies["T1"] == std::vector<std::string>{"b", "d"});
            CHECK(assignment.policyToTrainer["d"] == "T1");
        }

        SUBCASE("Identical inputs give identical assignments")
        {
            auto first = assignRoundRobin({"x", "y", "z"}, {"T0", "T1"});
            auto second = assignRoundRobin({"x", "y", "z"}, {"T0", "T1"});
            CHECK(first.policyToTrainer == second.policyToTrainer);
        }

        SUBCASE("Idle trainers are left out")
        {
            auto assignment = assignRoundRobin({"a", "b"}, {"T0", "T1", "T2"});
            CHECK(assignment.trainers == std::vector<std::string>{"T0", "T1"});
            CHECK_FALSE(assignment.trainerToPolicies.count("T2"));
        }

        SUBCASE("An empty pool is rejected")
        {
            CHECK_THROWS_AS(assignRoundRobin({"a"}, {}), ConfigurationError);
        }
    }
}
