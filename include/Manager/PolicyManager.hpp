#pragma once
//
// Created by moinshaikh on 3/7/26.
//

#ifndef POLICYHUB_POLICYMANAGER_HPP
#define POLICYHUB_POLICYMANAGER_HPP

#include<cstddef>
#include<filesystem>
#include<functional>
#include<map>
#include<memory>
#include<mutex>
#include<optional>
#include<set>
#include<string>
#include<vector>

#include<spdlog/spdlog.h>

#include"../Communication/Message.hpp"
#include"../Experience/ExperienceSet.hpp"
#include"../Policy/Policy.hpp"

namespace PolicyHub
{
    /**
     * @brief Receives the trackers collected from every trainer at the end of update()
     */
    using PostUpdate = std::function<void(const std::vector<Tracker> &)>;

    /**
     * @brief Settings shared by every policy manager variant
     *
     * Supplied at construction and never changed by the manager afterwards.
     */
    struct PolicyManagerOptions
    {
        std::map<std::string, int> updateTrigger;   ///< New experiences needed before a policy learns (default 1)
        std::map<std::string, int> warmup;          ///< Total experiences needed before the first learn (default 1)
        PostUpdate postUpdate;                      ///< Optional hook run after every round
        std::filesystem::path logDir;               ///< Log file directory, console only if empty
        std::map<std::string, std::filesystem::path> loadPaths; ///< Checkpoint to load per policy at start-up
        std::filesystem::path checkpointDir;        ///< Where checkpoints are written
        int checkpointEvery = 0;                    ///< Write a policy's state every N updates of it, 0 disables
    };

    /**
     * @brief Static partition of policies over trainers
     */
    struct Assignment
    {
        std::vector<std::string> trainers;                                 ///< Trainers owning at least one policy, pool order
        std::map<std::string, std::string> policyToTrainer;                ///< Owner of each policy
        std::map<std::string, std::vector<std::string>> trainerToPolicies; ///< Policies of each trainer
    };

    /**
     * @brief Assigns policy i to pool[i mod pool.size()]
     *
     * Deterministic for identical inputs. Trainers that receive no policy are left out of
     * Assignment::trainers.
     *
     * @throws ConfigurationError if the pool is empty
     */
    Assignment assignRoundRobin(const std::vector<std::string> &policyNames, const std::vector<std::string> &pool);

    /**
     * @class PolicyManager
     * @brief Decides when policies learn, routes their experience and versions their state
     *
     * The manager accumulates experience per policy and, every update() round, flushes the
     * batches of the policies whose trigger and warm-up thresholds are met to whichever execution
     * context owns them. Each round appends exactly one entry to the update history holding the
     * names of the policies that learned in it (possibly none), so version() grows by one per call.
     * getState() answers "what changed since version V" from states cached in the manager and
     * never waits on a trainer.
     *
     * update() is single-writer: one round at a time per manager. getState() and version() may
     * be called from other threads and always observe a whole round.
     *
     * Variants differ only in where learn() runs:
     * - LocalPolicyManager: in the caller's thread
     * - MultiProcessPolicyManager: in forked trainer processes
     * - DistributedPolicyManager: in trainer nodes behind a ManagerEndpoint
     */
    class PolicyManager
    {
    private:
        mutable std::mutex mutex;                          ///< Guards updateHistory and stateCache
        std::vector<std::set<std::string>> updateHistory;  ///< Policies updated per round, index 0 = all
        std::map<std::string, PolicyState> stateCache;     ///< Latest known state per policy
        std::map<std::string, int> updateCount;            ///< Rounds in which each policy learned
        std::filesystem::path checkpointDir;               ///< Checkpoint directory
        int checkpointEvery;                               ///< Checkpoint period, 0 disables
        PostUpdate postUpdate;                             ///< Post-round hook
        bool closed;                                       ///< Set by exit()
    protected:
        std::map<std::string, std::shared_ptr<CorePolicy>> policies; ///< Managed policies by name
        std::map<std::string, int> updateTrigger;                    ///< Trigger per policy
        std::map<std::string, int> warmup;                           ///< Warm-up size per policy
        std::shared_ptr<spdlog::logger> logger;                      ///< "POLICY_MANAGER" logger
        std::map<std::string, ExperienceSet> experienceCache;        ///< Pending batches (remote variants)
        std::map<std::string, std::size_t> experienceCount;          ///< Total experiences seen (remote variants)

        /**
         * @brief Replies gathered from the trainers of one round
         */
        struct RoundReplies
        {
            std::map<std::string, PolicyState> states; ///< Updated states by policy
            std::vector<Tracker> trackers;             ///< One tracker per trainer
            std::vector<std::string> failures;         ///< "<trainer>: <error>" for each Error reply
        };

        /**
         * @brief Throws ManagerClosedError if the manager can no longer run rounds
         */
        virtual void checkOpen() const;

        /**
         * @brief Throws ConfigurationError if a batch names an unknown policy
         */
        void checkPolicyNames(const std::map<std::string, ExperienceSet> &experienceByPolicy) const;

        /**
         * @brief Caches incoming batches and pops the ones that are due
         *
         * A policy is due when its pending batch holds at least `updateTrigger` experiences and
         * at least `warmup` experiences have been received for it in total.
         *
         * @param updated Receives the names of the due policies
         * @return Due batches, moved out of the cache
         */
        std::map<std::string, ExperienceSet> stageExperiences(std::map<std::string, ExperienceSet> &&experienceByPolicy,
                                                              std::set<std::string> &updated);

        /**
         * @brief Cached states of @p names, used to initialize trainers
         */
        std::map<std::string, PolicyState> cachedStates(const std::vector<std::string> &names) const;

        /**
         * @brief Folds one trainer reply into @p replies
         *
         * @throws ProtocolError if the reply is neither @p expected nor Error, or comes from
         *         another trainer than @p trainer
         */
        void absorbReply(const std::string &trainer, Message &&reply, MessageTag expected, RoundReplies &replies) const;

        /**
         * @brief Publishes a completed round
         *
         * Stores @p states, appends @p updated to the history, writes due checkpoints and runs the
         * post-update hook.
         */
        void commitRound(const std::set<std::string> &updated,
                         std::map<std::string, PolicyState> &&states,
                         const std::vector<Tracker> &trackers);

        inline bool is_closed() const
        {
            return closed;
        }
    public:
        /**
         * @brief Validates the policies and options and snapshots the initial states
         *
         * Checkpoints listed in PolicyManagerOptions::loadPaths are loaded first; a missing file
         * is logged as a warning and the policy keeps its current state.
         *
         * @throws ConfigurationError if a policy is null or not trainable, a threshold is not
         *         positive or names an unknown policy, or checkpointing is enabled without a directory
         */
        PolicyManager(const std::map<std::string, std::shared_ptr<Policy>> &policies, PolicyManagerOptions options);

        virtual ~PolicyManager() = 0;

        /**
         * @brief Runs one update round
         *
         * @param experienceByPolicy New experience of this round, one batch per policy. Policies
         *        that are absent are untouched.
         *
         * @throws ConfigurationError if a batch names an unknown policy (nothing is changed)
         * @throws ManagerClosedError after exit()
         */
        virtual void update(std::map<std::string, ExperienceSet> experienceByPolicy) = 0;

        /**
         * @brief States of the policies updated after @p sinceVersion
         *
         * @param sinceVersion Defaults to version() - 1, i.e. the latest round only; -1 returns every policy
         * @return Latest cached state of each policy updated in rounds sinceVersion+1 .. version()
         */
        std::map<std::string, PolicyState> getState(std::optional<int> sinceVersion = std::nullopt) const;

        /**
         * @brief Number of completed rounds
         */
        int version() const;

        /**
         * @brief Shuts the manager down; a second call throws ManagerClosedError
         */
        virtual void exit();

        std::vector<std::string> get_policy_names() const;
    };
    inline PolicyManager::~PolicyManager() {}
}

#endif //POLICYHUB_POLICYMANAGER_HPP
