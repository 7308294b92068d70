#pragma once
//
// Created by moinshaikh on 3/9/26.
//

#ifndef POLICYHUB_DISTRIBUTEDPOLICYMANAGER_HPP
#define POLICYHUB_DISTRIBUTEDPOLICYMANAGER_HPP

#include<map>
#include<memory>
#include<set>
#include<string>

#include"../Communication/Endpoint.hpp"
#include"PolicyManager.hpp"

namespace PolicyHub
{
    /**
     * @class DistributedPolicyManager
     * @brief Policy manager whose trainers run on remote nodes
     *
     * The trainer pool is whatever the endpoint discovered; policies are assigned round-robin
     * over ManagerEndpoint::workers(). Construction pushes the initial state of every policy to
     * its trainer and waits until all of them acknowledged with InitDone.
     *
     * Replies of a round may arrive in any order and are matched to trainers by sender id. A
     * reply from a trainer that was not asked, or a second reply from the same trainer, is a
     * ProtocolError.
     */
    class DistributedPolicyManager : public PolicyManager
    {
    private:
        std::unique_ptr<ManagerEndpoint> endpoint; ///< Transport to the trainer nodes
        Assignment assignment;                     ///< Round-robin policy partition
        bool faulted;                              ///< A transport failure desynchronized the round

        /**
         * @brief Waits for one reply of type @p expected from every trainer in @p pending
         */
        RoundReplies collectReplies(std::set<std::string> pending, MessageTag expected);

        /**
         * @brief Sends Exit to every assigned trainer and closes the endpoint
         */
        void releaseTrainers();
    protected:
        void checkOpen() const override;
    public:
        /**
         * @throws ConfigurationError if the endpoint is null or has no workers
         * @throws TrainerError if a trainer fails to initialize
         * @throws ProtocolError if a trainer replies out of turn
         */
        DistributedPolicyManager(const std::map<std::string, std::shared_ptr<Policy>> &policies,
                                 std::unique_ptr<ManagerEndpoint> endpoint,
                                 PolicyManagerOptions options = {});

        ~DistributedPolicyManager() override;

        void update(std::map<std::string, ExperienceSet> experienceByPolicy) override;

        void exit() override;

        inline const Assignment &get_assignment() const
        {
            return assignment;
        }
    };
}

#endif //POLICYHUB_DISTRIBUTEDPOLICYMANAGER_HPP
