#pragma once
//
// Created by moinshaikh on 3/2/26.
//

#ifndef POLICYHUB_EXPERIENCESET_HPP
#define POLICYHUB_EXPERIENCESET_HPP

#include<cstddef>
#include<vector>

#include<msgpack.hpp>
#include<torch/torch.h>

namespace PolicyHub
{
    /**
     * @brief Tensor view of an ExperienceSet, ready for a loss computation
     *
     * All tensors share the leading dimension N (number of transitions).
     */
    struct ExperienceTensors
    {
        torch::Tensor states;     /**< [N, state_size] */
        torch::Tensor actions;    /**< [N, action_size] */
        torch::Tensor rewards;    /**< [N, 1] */
        torch::Tensor nextStates; /**< [N, state_size] */
    };

    /**
     * @brief Ordered batch of transitions produced by a rollout for one policy
     *
     * `ExperienceSet` is the unit of training data moved through the manager. Records
     * are stored column-wise (states, actions, rewards, next states) so that a batch can be
     * converted into tensors without reshuffling. Order is always preserved: extend()
     * appends after the existing records.
     *
     * The association with a policy is carried by the key under which the batch is
     * passed to a PolicyManager, not by the batch itself.
     */
    class ExperienceSet
    {
    private:
        std::vector<std::vector<float>> states;     /**< Observed states */
        std::vector<std::vector<float>> actions;    /**< Actions taken in each state */
        std::vector<float> rewards;                 /**< Reward received for each action */
        std::vector<std::vector<float>> nextStates; /**< States reached after each action */
    public:
        ExperienceSet() = default;

        /**
         * @brief Builds a batch from pre-collected columns
         *
         * @throws std::invalid_argument if the four columns do not have the same length
         */
        ExperienceSet(std::vector<std::vector<float>> states,
                      std::vector<std::vector<float>> actions,
                      std::vector<float> rewards,
                      std::vector<std::vector<float>> nextStates);

        /**
         * @brief Number of transitions in the batch
         */
        inline std::size_t size() const
        {
            return rewards.size();
        }

        inline bool empty() const
        {
            return rewards.empty();
        }

        /**
         * @brief Appends a single transition
         */
        void add(std::vector<float> state, std::vector<float> action, float reward, std::vector<float> nextState);

        /**
         * @brief Appends a copy of @p other after the current records
         */
        void extend(const ExperienceSet &other);

        /**
         * @brief Appends the records of @p other, leaving it empty
         */
        void extend(ExperienceSet &&other);

        /**
         * @brief Copies out the records in the half-open range [begin, end)
         */
        ExperienceSet slice(std::size_t begin, std::size_t end) const;

        void clear();

        /**
         * @brief Checks that the four columns hold the same number of records
         *
         * Batches decoded from the wire bypass the constructor and must be checked explicitly.
         *
         * @throws std::invalid_argument if the column lengths differ
         */
        void validate() const;

        /**
         * @brief Converts the batch into float tensors
         *
         * States and actions must have a consistent width across records.
         *
         * @throws std::invalid_argument if the batch is empty or rows have different widths
         */
        ExperienceTensors toTensors() const;

        inline const std::vector<std::vector<float>> &get_states() const
        {
            return states;
        }

        inline const std::vector<std::vector<float>> &get_actions() const
        {
            return actions;
        }

        inline const std::vector<float> &get_rewards() const
        {
            return rewards;
        }

        inline const std::vector<std::vector<float>> &get_next_states() const
        {
            return nextStates;
        }

        MSGPACK_DEFINE_MAP(states, actions, rewards, nextStates);
    };
}

#endif //POLICYHUB_EXPERIENCESET_HPP
