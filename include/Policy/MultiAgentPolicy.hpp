#pragma once
//
// Created by moinshaikh on 3/12/26.
//

#ifndef POLICYHUB_MULTIAGENTPOLICY_HPP
#define POLICYHUB_MULTIAGENTPOLICY_HPP

#include<filesystem>
#include<map>
#include<memory>
#include<string>
#include<vector>

#include"../Experience/ExperienceSet.hpp"
#include"Policy.hpp"

namespace PolicyHub
{
    /**
     * @class MultiAgentPolicy
     * @brief Rollout-side view of a set of policies shared by several agents
     *
     * Each agent acts through the policy it is mapped to; several agents may share one policy.
     * Rule-based policies are allowed here, only trainable ones can receive states.
     *
     * Usage pattern on a rollout worker:
     * 1. Build one instance with local copies of every policy
     * 2. chooseAction() for every agent at each step
     * 3. update() with PolicyManager::getState(lastVersion) to pick up new weights
     */
    class MultiAgentPolicy
    {
    private:
        std::map<std::string, std::shared_ptr<Policy>> policies; ///< Policies by name
        std::map<std::string, std::string> agentToPolicy;        ///< Policy name of each agent
    public:
        /**
         * @throws ConfigurationError if a policy is null or an agent maps to an unknown policy
         */
        MultiAgentPolicy(std::map<std::string, std::shared_ptr<Policy>> policies,
                         std::map<std::string, std::string> agentToPolicy);

        /**
         * @brief Asks the policy of every agent in @p stateByAgent for an action
         * @throws ConfigurationError if an agent is unknown
         */
        std::map<std::string, std::vector<float>> chooseAction(const std::map<std::string, std::vector<float>> &stateByAgent);

        /**
         * @brief Stores each agent's experience in its policy and lets every trainable policy learn
         *
         * Experience of agents mapped to rule-based policies is dropped.
         *
         * @return Names of the policies whose learn() returned true
         * @throws ConfigurationError if an agent is unknown
         */
        std::vector<std::string> onNewExperiences(std::map<std::string, ExperienceSet> experienceByAgent);

        /**
         * @brief Loads policy states, typically the result of PolicyManager::getState()
         *
         * Every name is checked before any state is applied.
         *
         * @throws ConfigurationError if a name is unknown or names a rule-based policy
         */
        void update(const std::map<std::string, PolicyState> &states);

        /**
         * @brief Writes every trainable policy to `dir/<policy name>`
         */
        void save(const std::filesystem::path &dir) const;

        /**
         * @brief Loads every trainable policy from `dir/<policy name>`
         *
         * Policies without a file keep their state; a warning is logged for each.
         *
         * @return Names of the policies that were loaded
         */
        std::vector<std::string> load(const std::filesystem::path &dir);

        inline const std::map<std::string, std::string> &get_agent_to_policy() const
        {
            return agentToPolicy;
        }

        std::shared_ptr<Policy> get_policy(const std::string &name) const;
    };
}

#endif //POLICYHUB_MULTIAGENTPOLICY_HPP
