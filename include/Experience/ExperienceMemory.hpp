#pragma once
//
// Created by moinshaikh on 3/2/26.
//

#ifndef POLICYHUB_EXPERIENCEMEMORY_HPP
#define POLICYHUB_EXPERIENCEMEMORY_HPP

#include<cstddef>

#include"ExperienceSet.hpp"

namespace PolicyHub
{
    /**
     * @brief Experience store owned by a trainable policy
     *
     * Accumulates the batches handed to a policy between learn() calls. With a capacity
     * of zero the memory grows without bound; otherwise, once full, the oldest records are
     * overwritten first (rolling overwrite) so that the newest `capacity` transitions are kept.
     */
    class ExperienceMemory
    {
    private:
        ExperienceSet records;  /**< Stored transitions, oldest first */
        std::size_t capacity;   /**< Maximum number of transitions kept, 0 for unbounded */
    public:
        explicit ExperienceMemory(std::size_t capacity = 0);

        /**
         * @brief Stores a batch, evicting the oldest records if the capacity is exceeded
         */
        void put(const ExperienceSet &batch);

        void put(ExperienceSet &&batch);

        /**
         * @brief Number of transitions currently held
         */
        inline std::size_t size() const
        {
            return records.size();
        }

        inline std::size_t get_capacity() const
        {
            return capacity;
        }

        /**
         * @brief All stored transitions, oldest first
         */
        inline const ExperienceSet &get() const
        {
            return records;
        }

        /**
         * @brief Copy of the newest @p count transitions (all of them if fewer are stored)
         */
        ExperienceSet latest(std::size_t count) const;

        void clear();
    private:
        void evict();
    };
}

#endif //POLICYHUB_EXPERIENCEMEMORY_HPP
