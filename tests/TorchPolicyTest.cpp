//
// Created by moinshaikh on 3/3/26.
//

#include<filesystem>

#include<doctest/doctest.h>

#include"TestPolicies.hpp"

using namespace PolicyHub;
using namespace PolicyHub::Testing;

namespace
{
    struct DropoutNetImpl : torch::nn::Module
    {
        DropoutNetImpl() :
            hidden(register_module("hidden", torch::nn::Linear(2, 64))),
            dropout(register_module("dropout", torch::nn::Dropout(0.5))),
            output(register_module("output", torch::nn::Linear(64, 1)))
        {

        }

        torch::Tensor forward(torch::Tensor x)
        {
            return output(dropout(torch::relu(hidden(x))));
        }

        torch::nn::Linear hidden;
        torch::nn::Dropout dropout;
        torch::nn::Linear output;
    };
    TORCH_MODULE(DropoutNet);
}

TEST_CASE("TorchPolicy")
{
    torch::manual_seed(0);

    SUBCASE("learn() does nothing without experience")
    {
        auto policy = makeRegressionPolicy();
        CHECK_FALSE(policy->learn());
        CHECK(policy->tracker().empty());
        CHECK(policy->get_update_count() == 0);
    }

    SUBCASE("Repeated learn() reduces the loss")
    {
        auto policy = makeRegressionPolicy({0, 5, 0});
        policy->experienceStore().put(makeRegressionBatch(12));

        REQUIRE(policy->learn());
        auto firstLoss = policy->tracker()[0].value;
        for (int i = 0; i < 20; ++i)
        {
            policy->learn();
        }
        auto lastLoss = policy->tracker()[0].value;

        CHECK(lastLoss < firstLoss);
        CHECK(policy->tracker()[0].name == "loss");
        CHECK(policy->tracker()[1].name == "experiences");
        CHECK(policy->tracker()[1].value == doctest::Approx(12));
        CHECK(policy->get_update_count() == 21);
    }

    SUBCASE("batchSize limits learn() to the newest transitions")
    {
        auto policy = makeRegressionPolicy({4, 1, 0});
        policy->experienceStore().put(makeRegressionBatch(10));
        REQUIRE(policy->learn());
        CHECK(policy->tracker()[1].value == doctest::Approx(4));
    }

    SUBCASE("setState() transfers parameters between instances")
    {
        auto trained = makeRegressionPolicy();
        trained->experienceStore().put(makeRegressionBatch(6));
        trained->learn();

        auto fresh = makeRegressionPolicy();
        fresh->setState(trained->getState());

        auto expected = trained->chooseAction({1, 2});
        auto actual = fresh->chooseAction({1, 2});
        REQUIRE(actual.size() == 1);
        CHECK(actual[0] == doctest::Approx(expected[0]));
    }

    SUBCASE("save() and load() go through the file system")
    {
        auto dir = std::filesystem::temp_directory_path() / "policyhub_torch_policy_test";
        std::filesystem::remove_all(dir);

        auto trained = makeRegressionPolicy();
        trained->experienceStore().put(makeRegressionBatch(6));
        trained->learn();
        trained->save(dir / "policy");

        auto fresh = makeRegressionPolicy();
        CHECK(fresh->load(dir / "policy"));
        CHECK(fresh->chooseAction({2, 1})[0] == doctest::Approx(trained->chooseAction({2, 1})[0]));

        auto before = fresh->chooseAction({2, 1})[0];
        CHECK_FALSE(fresh->load(dir / "missing"));
        CHECK(fresh->chooseAction({2, 1})[0] == doctest::Approx(before));

        std::filesystem::remove_all(dir);
    }

    SUBCASE("chooseAction() runs the module in evaluation mode")
    {
        DropoutNet net;
        auto optimizer = std::make_unique<torch::optim::SGD>(net->parameters(), torch::optim::SGDOptions(0.05));
        TorchPolicy policy(torch::nn::AnyModule(net),
                           std::move(optimizer),
                           [](torch::nn::AnyModule &module, const ExperienceTensors &batch)
                           {
                               return torch::mse_loss(module.forward(batch.states), batch.rewards);
                           });
        policy.experienceStore().put(makeRegressionBatch(6));
        REQUIRE(policy.learn());
        CHECK(policy.get_module()->is_training());

        auto first = policy.chooseAction({1, 2});
        CHECK_FALSE(policy.get_module()->is_training());
        for (int i = 0; i < 5; ++i)
        {
            CHECK(policy.chooseAction({1, 2})[0] == doctest::Approx(first[0]));
        }

        REQUIRE(policy.learn());
        CHECK(policy.get_module()->is_training());
    }

    SUBCASE("Constructor rejects incomplete setups")
    {
        torch::nn::Linear linear(2, 1);
        CHECK_THROWS_AS(TorchPolicy(torch::nn::AnyModule(linear), nullptr,
                                    [](torch::nn::AnyModule &, const ExperienceTensors &) { return torch::zeros({1}); }),
                        std::invalid_argument);
    }
}
