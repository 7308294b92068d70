#pragma once
//
// Created by moinshaikh on 3/8/26.
//

#ifndef POLICYHUB_MULTIPROCESSPOLICYMANAGER_HPP
#define POLICYHUB_MULTIPROCESSPOLICYMANAGER_HPP

#include<filesystem>
#include<map>
#include<memory>
#include<string>

#include<sys/types.h>

#include<zmq.hpp>

#include"../Communication/Channel.hpp"
#include"PolicyManager.hpp"

namespace PolicyHub
{
    /**
     * @brief Where and how the trainer processes are reached
     */
    struct ProcessOptions
    {
        std::filesystem::path runtimeDir = std::filesystem::temp_directory_path(); ///< Directory of the ipc sockets
        int receiveTimeoutMs = -1; ///< Deadline for each send to and reply from a trainer, -1 waits forever
    };

    /**
     * @class MultiProcessPolicyManager
     * @brief Policy manager that forks one trainer process per group of policies
     *
     * Policies are assigned round-robin to `numTrainers` trainers ("TRAINER.0", ...), computed
     * once here. Each trainer that owns a policy runs in its own forked process, builds its
     * policies with the given factories and talks to the manager over a Channel. Every round
     * sends one Learn request to each trainer and then blocks on the replies in trainer order.
     *
     * Every round first checks that no trainer process has terminated; a dead trainer fails the
     * round with TrainerError. A trainer that is alive but stuck blocks update() unless a deadline
     * is set, in which case TrainerTimeoutError is raised. Either failure leaves the manager
     * faulted: later update() calls throw ManagerClosedError and exit() kills the trainer processes.
     */
    class MultiProcessPolicyManager : public PolicyManager
    {
    private:
        Assignment assignment;                                   ///< Round-robin policy partition
        ProcessOptions processOptions;                           ///< Socket directory and deadline
        std::unique_ptr<zmq::context_t> context;                 ///< Created after the trainers are forked
        std::map<std::string, std::unique_ptr<Channel>> channels; ///< Channel per trainer
        std::map<std::string, std::filesystem::path> socketPaths; ///< ipc socket file per trainer
        std::map<std::string, pid_t> processes;                  ///< Process id per trainer
        bool faulted;                                            ///< A transport failure desynchronized a channel

        void spawnTrainers(const std::map<std::string, PolicyFactory> &factories, const std::filesystem::path &logDir);

        void initializeTrainers();

        /**
         * @brief Reaps trainer processes that already terminated
         * @throws TrainerError naming them if any did
         */
        void checkTrainersAlive();

        void reapTrainers(bool kill);

        void releaseTransport();

        template<class Operation>
        auto guardTransport(Operation &&operation) -> decltype(operation());
    protected:
        void checkOpen() const override;
    public:
        /**
         * @param policies Policies to manage; their current states initialize the trainers
         * @param numTrainers Size of the trainer pool
         * @param factories Factory for every policy, run inside the trainer processes
         * @param options Thresholds, hooks, logging and checkpointing
         * @param processOptions ipc directory and reply deadline
         *
         * @throws ConfigurationError if numTrainers is not positive or a policy has no factory
         * @throws TrainerError if a trainer cannot be started or initialized
         */
        MultiProcessPolicyManager(const std::map<std::string, std::shared_ptr<Policy>> &policies,
                                  int numTrainers,
                                  const std::map<std::string, PolicyFactory> &factories,
                                  PolicyManagerOptions options = {},
                                  ProcessOptions processOptions = {});

        ~MultiProcessPolicyManager() override;

        void update(std::map<std::string, ExperienceSet> experienceByPolicy) override;

        /**
         * @brief Tells every trainer process to exit and waits for it
         */
        void exit() override;

        inline const Assignment &get_assignment() const
        {
            return assignment;
        }

        /**
         * @brief Process id of every trainer that has not been reaped yet
         */
        inline const std::map<std::string, pid_t> &get_trainer_processes() const
        {
            return processes;
        }
    };
}

#endif //POLICYHUB_MULTIPROCESSPOLICYMANAGER_HPP
