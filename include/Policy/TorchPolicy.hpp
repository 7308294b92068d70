#pragma once
//
// Created by moinshaikh on 3/3/26.
//

#ifndef POLICYHUB_TORCHPOLICY_HPP
#define POLICYHUB_TORCHPOLICY_HPP

#include<cstddef>
#include<functional>
#include<memory>
#include<vector>

#include<torch/torch.h>

#include"Policy.hpp"

namespace PolicyHub
{
    /**
     * @brief Computes the training loss of a module on a batch of experience
     *
     * The returned tensor must be a scalar connected to the module parameters.
     */
    using LossFunction = std::function<torch::Tensor(torch::nn::AnyModule &, const ExperienceTensors &)>;

    /**
     * @brief Hyperparameters of the learn() step of a TorchPolicy
     */
    struct TorchPolicyOptions
    {
        std::size_t batchSize = 0;      /**< Newest transitions used per learn(), 0 for the whole store */
        int iterations = 1;             /**< Optimizer steps per learn() */
        std::size_t memoryCapacity = 0; /**< Capacity of the experience store, 0 for unbounded */
    };

    /**
     * @class TorchPolicy
     * @brief Trainable policy backed by a libtorch module and optimizer
     *
     * Adapts an arbitrary `torch::nn::Module` (held through `torch::nn::AnyModule`) to the
     * CorePolicy capability set. The network architecture and the loss are supplied by the
     * caller; this class only runs optimizer steps over the experience store and moves the
     * parameters in and out of PolicyState bytes.
     *
     * State snapshots are libtorch archives containing the module's parameters and buffers and,
     * under the "optimizer" key, the optimizer state.
     */
    class TorchPolicy : public CorePolicy
    {
    private:
        torch::nn::AnyModule module;                       ///< Network mapping states to actions
        std::unique_ptr<torch::optim::Optimizer> optimizer; ///< Optimizer over the module parameters
        LossFunction lossFunction;                          ///< Loss minimised by learn()
        TorchPolicyOptions options;                         ///< Batch and iteration settings
        ExperienceMemory memory;                            ///< Experience put by the manager or trainer
        std::vector<UpdateDatum> lastUpdate;                ///< Diagnostics of the last learn()
        int updateCount;                                    ///< Number of successful learn() calls
    public:
        /**
         * @brief Wraps a module and its optimizer
         *
         * @param module Module whose forward() maps a [N, state_size] tensor to [N, action_size]
         * @param optimizer Optimizer constructed over module parameters
         * @param lossFunction Loss evaluated on every learn() iteration
         * @param options Batch size, iterations and memory capacity
         *
         * @throws std::invalid_argument if the module is empty, the optimizer or loss is missing,
         *         or iterations is not positive
         */
        TorchPolicy(torch::nn::AnyModule module,
                    std::unique_ptr<torch::optim::Optimizer> optimizer,
                    LossFunction lossFunction,
                    TorchPolicyOptions options = {});

        std::vector<float> chooseAction(const std::vector<float> &state) override;

        /**
         * @brief Runs `iterations` optimizer steps on the newest `batchSize` transitions
         *
         * @return false without touching the parameters if the store is empty
         */
        bool learn() override;

        PolicyState getState() const override;

        void setState(const PolicyState &state) override;

        ExperienceMemory &experienceStore() override
        {
            return memory;
        }

        /**
         * @brief "loss" of the last iteration and number of "experiences" used
         */
        std::vector<UpdateDatum> tracker() const override
        {
            return lastUpdate;
        }

        inline int get_update_count() const
        {
            return updateCount;
        }

        inline std::shared_ptr<torch::nn::Module> get_module() const
        {
            return module.ptr();
        }
    };
}

#endif //POLICYHUB_TORCHPOLICY_HPP
