//
// Created by moinshaikh on 3/11/26.
//

#include<atomic>
#include<filesystem>
#include<thread>

#include<doctest/doctest.h>

#include"TestPolicies.hpp"

using namespace PolicyHub;
using namespace PolicyHub::Testing;

static const ScriptedPolicy &scripted(const std::map<std::string, std::shared_ptr<Policy>> &policies, const std::string &name)
{
    return dynamic_cast<const ScriptedPolicy &>(*policies.at(name));
}

TEST_CASE("LocalPolicyManager")
{
    auto policies = scriptedPolicies({"A", "B"});

    SUBCASE("Version grows by one per update, no-op rounds included")
    {
        LocalPolicyManager manager(policies);
        CHECK(manager.version() == 0);
        CHECK(manager.getState(-1).size() == 2);

        for (int round = 1; round <= 4; ++round)
        {
            manager.update({});
            CHECK(manager.version() == round);
            CHECK(manager.getState().empty());
        }
        manager.update({{"A", makeBatch(1)}});
        CHECK(manager.version() == 5);
    }

    SUBCASE("A policy learns once its trigger and warm-up are met")
    {
        PolicyManagerOptions options;
        options.updateTrigger["A"] = 10;
        options.warmup["A"] = 5;
        LocalPolicyManager manager(policies, options);

        manager.update({{"A", makeBatch(3)}});
        CHECK(manager.getState().empty());
        manager.update({{"A", makeBatch(4)}});
        CHECK(manager.getState().empty());
        CHECK(scripted(policies, "A").get_learn_count() == 0);

        manager.update({{"A", makeBatch(5)}});
        CHECK(manager.version() == 3);
        CHECK(manager.getState() == std::map<std::string, PolicyState>{{"A", "1:12"}});
        CHECK(scripted(policies, "A").get_learn_count() == 1);

        // The trigger counter restarts after learning
        manager.update({{"A", makeBatch(9)}});
        CHECK(manager.getState().empty());
        manager.update({{"A", makeBatch(1)}});
        CHECK(manager.getState() == std::map<std::string, PolicyState>{{"A", "2:22"}});
    }

    SUBCASE("Warm-up counts stored experience, not new experience")
    {
        PolicyManagerOptions options;
        options.updateTrigger["B"] = 1;
        options.warmup["B"] = 4;
        LocalPolicyManager manager(policies, options);

        manager.update({{"B", makeBatch(2)}});
        CHECK(manager.getState().empty());
        manager.update({{"B", makeBatch(2)}});
        CHECK(manager.getState() == std::map<std::string, PolicyState>{{"B", "1:4"}});
    }

    SUBCASE("getState returns the union of policies updated since a version")
    {
        LocalPolicyManager manager(policies);
        manager.update({{"A", makeBatch(1)}});
        manager.update({{"B", makeBatch(1)}});
        manager.update({{"A", makeBatch(1)}});

        CHECK(manager.getState(0) == std::map<std::string, PolicyState>{{"A", "2:2"}, {"B", "1:1"}});
        CHECK(manager.getState(1) == std::map<std::string, PolicyState>{{"A", "2:2"}, {"B", "1:1"}});
        CHECK(manager.getState(2) == std::map<std::string, PolicyState>{{"A", "2:2"}});
        CHECK(manager.getState() == manager.getState(2));
        CHECK(manager.getState(3).empty());
        CHECK(manager.getState(-1).size() == 2);
    }

    SUBCASE("No-op rounds leave cached states untouched")
    {
        LocalPolicyManager manager(policies);
        manager.update({{"A", makeBatch(2)}});
        auto before = manager.getState(-1);
        manager.update({});
        manager.update({{"A", ExperienceSet()}});
        CHECK(manager.version() == 3);
        CHECK(manager.getState(-1) == before);
        CHECK(manager.getState(1).empty());
    }

    SUBCASE("Unknown policies are rejected before anything changes")
    {
        LocalPolicyManager manager(policies);
        CHECK_THROWS_AS(manager.update({{"A", makeBatch(1)}, {"Z", makeBatch(1)}}), ConfigurationError);
        CHECK(manager.version() == 0);
        CHECK(scripted(policies, "A").get_learn_count() == 0);
        CHECK(dynamic_cast<ScriptedPolicy &>(*policies.at("A")).experienceStore().size() == 0);
    }

    SUBCASE("Exceptions from learn() propagate and the round is not recorded")
    {
        auto failing = scriptedPolicies({"A", "B"}, {{"B", {true, 0}}});
        LocalPolicyManager manager(failing);
        CHECK_THROWS_WITH(manager.update({{"B", makeBatch(1)}}), "scripted learn failure");
        CHECK(manager.version() == 0);
        manager.update({{"A", makeBatch(1)}});
        CHECK(manager.version() == 1);
    }

    SUBCASE("update() and exit() fail after exit()")
    {
        LocalPolicyManager manager(policies);
        manager.update({{"A", makeBatch(1)}});
        manager.exit();
        CHECK_THROWS_AS(manager.update({{"A", makeBatch(1)}}), ManagerClosedError);
        CHECK_THROWS_AS(manager.exit(), ManagerClosedError);
        CHECK(manager.version() == 1);
        CHECK(manager.getState().count("A"));
    }

    SUBCASE("postUpdate receives the trackers of every round")
    {
        std::vector<std::vector<Tracker>> rounds;
        PolicyManagerOptions options;
        options.postUpdate = [&](const std::vector<Tracker> &trackers)
        {
            rounds.push_back(trackers);
        };
        LocalPolicyManager manager(policies, options);
        manager.update({{"A", makeBatch(3)}});
        manager.update({});

        REQUIRE(rounds.size() == 2);
        REQUIRE(rounds[0].size() == 1);
        CHECK(rounds[0][0].at("A")[0].value == doctest::Approx(3));
        CHECK(rounds[0][0].at("B").empty());
    }
}

TEST_CASE("LocalPolicyManager configuration")
{
    SUBCASE("Only trainable policies can be managed")
    {
        std::map<std::string, std::shared_ptr<Policy>> fixed{{"A", std::make_shared<FixedPolicy>()}};
        CHECK_THROWS_AS(LocalPolicyManager{fixed}, ConfigurationError);

        std::map<std::string, std::shared_ptr<Policy>> missing{{"A", nullptr}};
        CHECK_THROWS_AS(LocalPolicyManager{missing}, ConfigurationError);

        CHECK_THROWS_AS(LocalPolicyManager{std::map<std::string, std::shared_ptr<Policy>>{}}, ConfigurationError);
    }

    SUBCASE("Thresholds must be positive and name known policies")
    {
        auto policies = scriptedPolicies({"A"});
        PolicyManagerOptions zero;
        zero.updateTrigger["A"] = 0;
        CHECK_THROWS_AS(LocalPolicyManager(policies, zero), ConfigurationError);

        PolicyManagerOptions unknown;
        unknown.warmup["Z"] = 3;
        CHECK_THROWS_AS(LocalPolicyManager(policies, unknown), ConfigurationError);
    }

    SUBCASE("Checkpoints are loaded when present and skipped otherwise")
    {
        auto dir = std::filesystem::temp_directory_path() / "policyhub_load_test";
        std::filesystem::remove_all(dir);
        writePolicyState(dir / "A", "5:0");

        auto policies = scriptedPolicies({"A", "B"});
        PolicyManagerOptions options;
        options.loadPaths["A"] = dir / "A";
        options.loadPaths["B"] = dir / "missing";
        LocalPolicyManager manager(policies, options);

        CHECK(manager.getState(-1).at("A") == "5:0");
        CHECK(manager.getState(-1).at("B") == "0:0");
        std::filesystem::remove_all(dir);
    }

    SUBCASE("Checkpoints are written every N updates of a policy")
    {
        auto dir = std::filesystem::temp_directory_path() / "policyhub_checkpoint_test";
        std::filesystem::remove_all(dir);

        PolicyManagerOptions options;
        options.checkpointDir = dir;
        options.checkpointEvery = 2;
        LocalPolicyManager manager(scriptedPolicies({"A"}), options);

        manager.update({{"A", makeBatch(1)}});
        CHECK_FALSE(std::filesystem::exists(dir / "A"));
        manager.update({{"A", makeBatch(1)}});
        auto saved = readPolicyState(dir / "A");
        REQUIRE(saved);
        CHECK(*saved == "2:2");
        std::filesystem::remove_all(dir);

        // A checkpoint that cannot be written does not fail the round
        auto blocked = std::filesystem::temp_directory_path() / "policyhub_checkpoint_blocked";
        std::filesystem::remove_all(blocked);
        writePolicyState(blocked, "not a directory");
        int hooked = 0;
        PolicyManagerOptions unwritable;
        unwritable.checkpointDir = blocked;
        unwritable.checkpointEvery = 1;
        unwritable.postUpdate = [&](const std::vector<Tracker> &)
        {
            ++hooked;
        };
        LocalPolicyManager stuck(scriptedPolicies({"A"}), unwritable);
        CHECK_NOTHROW(stuck.update({{"A", makeBatch(1)}}));
        CHECK(stuck.version() == 1);
        CHECK(stuck.getState() == std::map<std::string, PolicyState>{{"A", "1:1"}});
        CHECK(hooked == 1);
        std::filesystem::remove_all(blocked);

        PolicyManagerOptions noDirectory;
        noDirectory.checkpointEvery = 1;
        CHECK_THROWS_AS(LocalPolicyManager(scriptedPolicies({"A"}), noDirectory), ConfigurationError);
    }
}

TEST_CASE("LocalPolicyManager readers see whole rounds")
{
    LocalPolicyManager manager(scriptedPolicies({"A", "B"}));
    std::atomic<bool> done(false);
    std::atomic<int> torn(0);

    std::thread reader([&]()
    {
        while (!done)
        {
            int version = manager.version();
            auto states = manager.getState(-1);
            if (states.size() != 2 || manager.version() < version)
            {
                ++torn;
            }
        }
    });
    for (int round = 0; round < 200; ++round)
    {
        manager.update({{"A", makeBatch(1)}, {"B", makeBatch(1)}});
    }
    done = true;
    reader.join();

    CHECK(torn == 0);
    CHECK(manager.getState(0) == std::map<std::string, PolicyState>{{"A", "200:200"}, {"B", "200:200"}});
}

TEST_CASE("LocalPolicyManager trains torch policies")
{
    torch::manual_seed(0);
    auto policy = makeRegressionPolicy();
    std::vector<float> losses;

    PolicyManagerOptions options;
    options.updateTrigger["linear"] = 8;
    LocalPolicyManager manager({{"linear", policy}}, options);
    auto initial = manager.getState(-1).at("linear");

    for (int round = 0; round < 40; ++round)
    {
        manager.update({{"linear", makeRegressionBatch(4, round)}});
        if (!manager.getState().empty())
        {
            losses.push_back(policy->tracker().at(0).value);
        }
    }

    REQUIRE(losses.size() == 20);
    CHECK(losses.back() < losses.front());
    CHECK(manager.getState(-1).at("linear") != initial);
    CHECK(policy->get_update_count() == 20);
}
