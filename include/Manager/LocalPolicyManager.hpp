#pragma once
//
// Created by moinshaikh on 3/7/26.
//

#ifndef POLICYHUB_LOCALPOLICYMANAGER_HPP
#define POLICYHUB_LOCALPOLICYMANAGER_HPP

#include"PolicyManager.hpp"

namespace PolicyHub
{
    /**
     * @class LocalPolicyManager
     * @brief Policy manager holding the live policy instances in its own thread
     *
     * Incoming batches go straight into each policy's experience store. A policy learns when
     * the experience received since its last update reaches its trigger and its store holds at
     * least its warm-up size. Exceptions thrown by learn() propagate to the caller of update()
     * and the round is not recorded.
     */
    class LocalPolicyManager : public PolicyManager
    {
    private:
        std::map<std::string, std::size_t> newExperienceCount; ///< Experience received since each policy last learned
    public:
        explicit LocalPolicyManager(const std::map<std::string, std::shared_ptr<Policy>> &policies,
                                    PolicyManagerOptions options = {});

        void update(std::map<std::string, ExperienceSet> experienceByPolicy) override;
    };
}

#endif //POLICYHUB_LOCALPOLICYMANAGER_HPP
