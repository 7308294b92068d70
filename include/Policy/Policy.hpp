#pragma once
//
// Created by moinshaikh on 3/3/26.
//

#ifndef POLICYHUB_POLICY_HPP
#define POLICYHUB_POLICY_HPP

#include<filesystem>
#include<functional>
#include<map>
#include<memory>
#include<optional>
#include<string>
#include<vector>

#include<msgpack.hpp>

#include"../Experience/ExperienceMemory.hpp"

namespace PolicyHub
{
    /**
     * @brief Opaque serialized snapshot of a policy (weights and optimizer state)
     *
     * Produced by CorePolicy::getState() and consumed by CorePolicy::setState(). The manager
     * never looks inside; it only caches, ships and persists the bytes.
     */
    using PolicyState = std::string;

    /**
     * @brief Single scalar diagnostic produced by a learn step
     *
     * Typical entries are "loss" or "experiences". A list of these forms the
     * tracker a policy exposes after learning.
     */
    struct UpdateDatum
    {
        std::string name; /**< Identifier for this metric (e.g., "loss") */
        float value;      /**< Scalar metric value */

        MSGPACK_DEFINE_MAP(name, value);
    };

    /**
     * @brief Diagnostics collected in one round, keyed by policy name
     */
    using Tracker = std::map<std::string, std::vector<UpdateDatum>>;

    /**
     * @brief Anything that can map a state to an action
     */
    class Policy
    {
    public:
        virtual ~Policy() = 0;

        /**
         * @brief Selects an action for a single state
         */
        virtual std::vector<float> chooseAction(const std::vector<float> &state) = 0;
    };
    inline Policy::~Policy() {}

    /**
     * @brief Trainable policy, the only kind of policy a PolicyManager accepts
     *
     * `CorePolicy` is the capability set the orchestration core consumes from the learning
     * library: an experience store that batches are put into, a learn() step, and state
     * snapshots that can be moved between processes and nodes. Exactly one execution context
     * (manager thread, forked trainer process or remote trainer node) owns a live instance at
     * any time; everybody else only sees its PolicyState.
     */
    class CorePolicy : public Policy
    {
    public:
        /**
         * @brief Runs one update on the stored experience
         *
         * @return true if the policy parameters actually changed
         */
        virtual bool learn() = 0;

        /**
         * @brief Serializes the current parameters and optimizer state
         */
        virtual PolicyState getState() const = 0;

        /**
         * @brief Replaces the current parameters and optimizer state
         */
        virtual void setState(const PolicyState &state) = 0;

        /**
         * @brief Experience accumulated since the policy was created
         */
        virtual ExperienceMemory &experienceStore() = 0;

        /**
         * @brief Diagnostics of the most recent learn() call
         */
        virtual std::vector<UpdateDatum> tracker() const
        {
            return {};
        }

        /**
         * @brief Writes getState() to @p path, creating parent directories
         */
        virtual void save(const std::filesystem::path &path) const;

        /**
         * @brief Restores the state stored at @p path
         *
         * A missing file is not an error: a warning is logged and the current state is kept.
         *
         * @return true if a state was loaded
         */
        virtual bool load(const std::filesystem::path &path);
    };

    /**
     * @brief Creates the policy with the given name inside a trainer process or node
     */
    using PolicyFactory = std::function<std::shared_ptr<CorePolicy>(const std::string &)>;

    /**
     * @brief Writes raw state bytes to disk, creating parent directories
     *
     * @throws std::runtime_error if the file cannot be written
     */
    void writePolicyState(const std::filesystem::path &path, const PolicyState &state);

    /**
     * @brief Reads raw state bytes written by writePolicyState()
     *
     * @return The stored state, or std::nullopt if no file exists at @p path
     * @throws std::runtime_error if the file exists but cannot be read
     */
    std::optional<PolicyState> readPolicyState(const std::filesystem::path &path);
}

#endif //POLICYHUB_POLICY_HPP
