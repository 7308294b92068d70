#pragma once
//
// Created by moinshaikh on 3/6/26.
//

#ifndef POLICYHUB_TRAINER_HPP
#define POLICYHUB_TRAINER_HPP

#include<filesystem>
#include<map>
#include<memory>
#include<optional>
#include<string>

#include<spdlog/spdlog.h>
#include<zmq.hpp>

#include"../Communication/Channel.hpp"
#include"../Communication/Message.hpp"
#include"../Policy/Policy.hpp"

namespace PolicyHub
{
    /**
     * @class Trainer
     * @brief Trainer unit: owns a disjoint subset of policies and applies Learn requests to them
     *
     * A trainer is transport agnostic. It turns one request into at most one reply:
     * - InitPolicyState: creates every named policy through its factory (once) and loads the
     *   given state, replies InitDone with the trainer id
     * - Learn: for every policy with a non-empty batch, puts the batch into the policy's
     *   experience store, calls learn() and captures the new state; replies LearnDone with the
     *   states and trackers of those policies only
     * - Exit: no reply
     *
     * Failures while handling a request are turned into an Error reply so that the manager can
     * fail the round instead of waiting forever.
     */
    class Trainer
    {
    private:
        std::string trainerId;                                     ///< Id reported in every reply
        std::map<std::string, PolicyFactory> factories;            ///< How to build each policy this trainer may own
        std::map<std::string, std::shared_ptr<CorePolicy>> policies; ///< Live policies, created on InitPolicyState
        std::shared_ptr<spdlog::logger> logger;                    ///< Trainer logger
    public:
        /**
         * @param trainerId Id of this unit (e.g., "TRAINER.0")
         * @param factories Factory per policy name this unit may be asked to own
         * @param logger Logger to use, a console logger tagged with the trainer id if null
         */
        Trainer(std::string trainerId,
                std::map<std::string, PolicyFactory> factories,
                std::shared_ptr<spdlog::logger> logger = nullptr);

        /**
         * @brief Creates (if needed) and loads the policies named in @p request
         *
         * @throws ConfigurationError if a policy has no factory or its factory returns null
         */
        Message initialize(const Message &request);

        /**
         * @brief Learns from every non-empty batch in @p request
         *
         * @throws ProtocolError if a batch names a policy this trainer does not own
         */
        Message train(Message &&request);

        /**
         * @brief Dispatches @p request by tag
         *
         * @return The reply, or std::nullopt for Exit
         */
        std::optional<Message> handle(Message &&request);

        inline const std::string &get_id() const
        {
            return trainerId;
        }

        inline const std::map<std::string, std::shared_ptr<CorePolicy>> &get_policies() const
        {
            return policies;
        }
    };

    /**
     * @brief Serves requests arriving on @p connection one at a time until Exit
     */
    void serve(Trainer &trainer, Connection &connection);

    /**
     * @brief Body of a forked trainer process
     *
     * Creates a fresh ZeroMQ context, connects a PAIR channel to @p url and serves until Exit.
     */
    void runTrainerProcess(const std::string &trainerId,
                           const std::string &url,
                           std::map<std::string, PolicyFactory> factories,
                           const std::filesystem::path &logDir);

    /**
     * @class TrainerNode
     * @brief Trainer hosted on a remote node, reached through a ZmqManagerEndpoint
     *
     * Registers with the manager of @p group on construction; run() serves until Exit.
     */
    class TrainerNode
    {
    private:
        std::unique_ptr<Connection> endpoint; ///< DEALER endpoint registered with the manager
        Trainer trainer;                      ///< Policies hosted on this node
    public:
        TrainerNode(std::shared_ptr<zmq::context_t> context,
                    const std::string &group,
                    const std::string &address,
                    const std::string &trainerId,
                    std::map<std::string, PolicyFactory> factories,
                    const std::filesystem::path &logDir = {});

        void run();
    };
}

#endif //POLICYHUB_TRAINER_HPP
