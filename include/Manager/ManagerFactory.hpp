#pragma once
//
// Created by moinshaikh on 3/10/26.
//

#ifndef POLICYHUB_MANAGERFACTORY_HPP
#define POLICYHUB_MANAGERFACTORY_HPP

#include<map>
#include<memory>
#include<string>

#include<zmq.hpp>

#include"../Communication/Endpoint.hpp"
#include"DistributedPolicyManager.hpp"
#include"LocalPolicyManager.hpp"
#include"MultiProcessPolicyManager.hpp"

namespace PolicyHub
{
    enum class ManagerMode
    {
        Local,
        MultiProcess,
        Distributed
    };

    /**
     * @brief Parses a manager mode name: "simple" (or "local"), "multi-process", "distributed"
     * @throws ConfigurationError for any other name
     */
    ManagerMode parseManagerMode(const std::string &name);

    /**
     * @brief Everything needed to build a policy manager of any mode
     */
    struct ManagerConfig
    {
        ManagerMode mode = ManagerMode::Local;
        PolicyManagerOptions options;        ///< Common manager options

        // MultiProcess
        int numTrainers = 1;                 ///< Trainer processes to fork
        ProcessOptions process;              ///< ipc directory and reply deadline

        // Distributed
        std::string group;                   ///< Training group the trainer nodes register with
        std::string address;                 ///< Address the manager endpoint binds
        EndpointOptions endpoint;            ///< Discovery and reply deadlines
        std::shared_ptr<zmq::context_t> context; ///< Context for the endpoint, a new one if null
    };

    /**
     * @brief Builds the policy manager selected by @p config
     *
     * In distributed mode the call blocks until `numTrainers` trainer nodes of `group` have
     * registered at `address`.
     *
     * @param factories Policy factories, required by the multi-process mode only
     * @throws ConfigurationError if the configuration is incomplete for the selected mode
     */
    std::unique_ptr<PolicyManager> makePolicyManager(const ManagerConfig &config,
                                                     const std::map<std::string, std::shared_ptr<Policy>> &policies,
                                                     const std::map<std::string, PolicyFactory> &factories = {});
}

#endif //POLICYHUB_MANAGERFACTORY_HPP
