/**
 * @file TorchPolicy.cpp
 * @brief libtorch adapter for the trainable policy capability set
 * @author moinshaikh
 * @date 3/3/26
 */

#include<sstream>
#include<stdexcept>

#include"../../include/Policy/TorchPolicy.hpp"

namespace PolicyHub
{
    TorchPolicy::TorchPolicy(torch::nn::AnyModule module,
                             std::unique_ptr<torch::optim::Optimizer> optimizer,
                             LossFunction lossFunction,
                             TorchPolicyOptions options) :
        module(std::move(module)),
        optimizer(std::move(optimizer)),
        lossFunction(std::move(lossFunction)),
        options(options),
        memory(options.memoryCapacity),
        updateCount(0)
    {
        if (this->module.is_empty())
        {
            throw std::invalid_argument("TorchPolicy needs a module");
        }
        if (!this->optimizer)
        {
            throw std::invalid_argument("TorchPolicy needs an optimizer");
        }
        if (!this->lossFunction)
        {
            throw std::invalid_argument("TorchPolicy needs a loss function");
        }
        if (options.iterations < 1)
        {
            throw std::invalid_argument("TorchPolicy needs at least one iteration per learn(), got " +
                                        std::to_string(options.iterations));
        }
    }

    std::vector<float> TorchPolicy::chooseAction(const std::vector<float> &state)
    {
        torch::NoGradGuard noGrad;
        module.ptr()->eval();
        std::vector<float> input(state);
        auto observation = torch::from_blob(input.data(), {1, static_cast<int64_t>(input.size())}).clone();
        auto output = module.forward(observation).reshape({-1}).to(torch::kFloat).contiguous();
        return std::vector<float>(output.data_ptr<float>(), output.data_ptr<float>() + output.numel());
    }

    bool TorchPolicy::learn()
    {
        if (memory.size() == 0)
        {
            lastUpdate.clear();
            return false;
        }

        ExperienceSet batch = options.batchSize == 0 ? memory.get() : memory.latest(options.batchSize);
        auto tensors = batch.toTensors();

        module.ptr()->train();
        float loss = 0;
        for (int i = 0; i < options.iterations; ++i)
        {
            optimizer->zero_grad();
            auto lossTensor = lossFunction(module, tensors);
            lossTensor.backward();
            optimizer->step();
            loss = lossTensor.item().toFloat();
        }

        ++updateCount;
        lastUpdate = {{"loss", loss},
                      {"experiences", static_cast<float>(batch.size())}};
        return true;
    }

    PolicyState TorchPolicy::getState() const
    {
        torch::serialize::OutputArchive archive;
        module.ptr()->save(archive);

        torch::serialize::OutputArchive optimizerArchive;
        optimizer->save(optimizerArchive);
        archive.write("optimizer", optimizerArchive);

        std::ostringstream stream;
        archive.save_to(stream);
        return stream.str();
    }

    void TorchPolicy::setState(const PolicyState &state)
    {
        std::istringstream stream(state);
        torch::serialize::InputArchive archive;
        archive.load_from(stream);
        module.ptr()->load(archive);

        torch::serialize::InputArchive optimizerArchive;
        if (archive.try_read("optimizer", optimizerArchive))
        {
            optimizer->load(optimizerArchive);
        }
    }
}
