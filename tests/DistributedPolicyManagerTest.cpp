//
// Created by moinshaikh on 3/12/26.
//

#include<deque>
#include<thread>

#include<doctest/doctest.h>

#include"TestPolicies.hpp"

using namespace PolicyHub;
using namespace PolicyHub::Testing;

/**
 * @brief Endpoint replaying canned replies, for driving the manager without trainers
 */
class ScriptedEndpoint : public ManagerEndpoint
{
public:
    std::vector<std::string> trainers;
    std::deque<std::pair<Message, std::string>> inbox;
    std::vector<std::pair<std::string, Message>> outbox;
    bool closed = false;

    explicit ScriptedEndpoint(std::vector<std::string> trainers) : trainers(std::move(trainers)) {}

    const std::vector<std::string> &workers() const override
    {
        return trainers;
    }

    void send(const std::string &worker, const Message &message) override
    {
        outbox.emplace_back(worker, message);
    }

    std::pair<Message, std::string> receive() override
    {
        if (inbox.empty())
        {
            throw TrainerTimeoutError("no reply scripted");
        }
        auto next = std::move(inbox.front());
        inbox.pop_front();
        return next;
    }

    void close() override
    {
        closed = true;
    }

    void reply(const std::string &sender, MessageTag type, std::map<std::string, PolicyState> states = {})
    {
        Message message;
        message.type = type;
        message.sender = sender;
        message.policyState = std::move(states);
        inbox.emplace_back(std::move(message), sender);
    }
};

TEST_CASE("DistributedPolicyManager with a scripted endpoint")
{
    auto endpoint = std::make_unique<ScriptedEndpoint>(std::vector<std::string>{"TRAINER.0", "TRAINER.1"});
    auto *script = endpoint.get();
    auto policies = scriptedPolicies({"a", "b", "c"});

    SUBCASE("Replies are matched by sender in any order")
    {
        script->reply("TRAINER.1", MessageTag::InitDone);
        script->reply("TRAINER.0", MessageTag::InitDone);
        DistributedPolicyManager manager(policies, std::move(endpoint));

        REQUIRE(script->outbox.size() == 2);
        CHECK(script->outbox[0].first == "TRAINER.0");
        CHECK(script->outbox[0].second.type == MessageTag::InitPolicyState);
        CHECK(script->outbox[0].second.policyState == std::map<std::string, PolicyState>{{"a", "0:0"}, {"c", "0:0"}});
        CHECK(script->outbox[1].second.policyState == std::map<std::string, PolicyState>{{"b", "0:0"}});

        script->reply("TRAINER.1", MessageTag::LearnDone, {{"b", "1:4"}});
        script->reply("TRAINER.0", MessageTag::LearnDone);
        manager.update({{"b", makeBatch(4)}});
        CHECK(manager.getState() == std::map<std::string, PolicyState>{{"b", "1:4"}});

        // Every trainer is asked each round, only due batches are attached
        REQUIRE(script->outbox.size() == 4);
        CHECK(script->outbox[2].second.type == MessageTag::Learn);
        CHECK(script->outbox[2].second.experiences.empty());
        CHECK(script->outbox[3].second.experiences.at("b").size() == 4);

        manager.exit();
        CHECK(script->closed);
        CHECK(script->outbox.back().second.type == MessageTag::Exit);

        auto sent = script->outbox.size();
        CHECK_THROWS_AS(manager.update({{"a", makeBatch(1)}}), ManagerClosedError);
        CHECK_THROWS_AS(manager.exit(), ManagerClosedError);
        CHECK(script->outbox.size() == sent);
        CHECK(manager.version() == 1);
        CHECK(manager.getState().count("b"));
    }

    SUBCASE("A second reply from the same trainer is a protocol error")
    {
        script->reply("TRAINER.0", MessageTag::InitDone);
        script->reply("TRAINER.0", MessageTag::InitDone);
        CHECK_THROWS_AS(DistributedPolicyManager(policies, std::move(endpoint)), ProtocolError);
    }

    SUBCASE("A reply from a trainer that was not asked is a protocol error")
    {
        script->reply("TRAINER.0", MessageTag::InitDone);
        script->reply("TRAINER.9", MessageTag::InitDone);
        CHECK_THROWS_AS(DistributedPolicyManager(policies, std::move(endpoint)), ProtocolError);
    }

    SUBCASE("A missing reply faults the manager")
    {
        script->reply("TRAINER.0", MessageTag::InitDone);
        script->reply("TRAINER.1", MessageTag::InitDone);
        DistributedPolicyManager manager(policies, std::move(endpoint));

        script->reply("TRAINER.0", MessageTag::LearnDone);
        CHECK_THROWS_AS(manager.update({}), TrainerTimeoutError);
        CHECK(manager.version() == 0);
        CHECK_THROWS_AS(manager.update({}), ManagerClosedError);
        manager.exit();
    }
}

TEST_CASE("DistributedPolicyManager configuration")
{
    auto policies = scriptedPolicies({"a"});
    CHECK_THROWS_AS(DistributedPolicyManager(policies, nullptr), ConfigurationError);
    CHECK_THROWS_AS(DistributedPolicyManager(policies, std::make_unique<ScriptedEndpoint>(std::vector<std::string>{})),
                    ConfigurationError);
}

TEST_CASE("DistributedPolicyManager with trainer nodes")
{
    auto context = std::make_shared<zmq::context_t>(1);
    const std::vector<std::string> names{"a", "b", "c"};

    auto startNodes = [&](const std::string &group, const std::string &address, int count,
                          const std::map<std::string, ScriptedBehavior> &behaviors)
    {
        std::vector<std::thread> nodes;
        for (int i = 0; i < count; ++i)
        {
            nodes.emplace_back([=]()
            {
                TrainerNode node(context, group, address, trainerName(i), scriptedFactories(names, behaviors));
                node.run();
            });
        }
        return nodes;
    };

    SUBCASE("Nodes learn the policies assigned to them")
    {
        auto nodes = startNodes("NODES", "inproc://distributed-nodes", 2, {});
        EndpointOptions endpointOptions;
        endpointOptions.discoveryTimeoutMs = 10000;
        endpointOptions.receiveTimeoutMs = 10000;
        DistributedPolicyManager manager(scriptedPolicies(names),
                                         std::make_unique<ZmqManagerEndpoint>(context, "NODES", "inproc://distributed-nodes",
                                                                              2, endpointOptions));

        CHECK(manager.get_assignment().policyToTrainer.at("a") == "TRAINER.0");
        CHECK(manager.get_assignment().policyToTrainer.at("b") == "TRAINER.1");
        CHECK(manager.get_assignment().policyToTrainer.at("c") == "TRAINER.0");

        manager.update({{"a", makeBatch(2)}, {"b", makeBatch(3)}});
        CHECK(manager.getState() == std::map<std::string, PolicyState>{{"a", "1:2"}, {"b", "1:3"}});
        manager.update({{"c", makeBatch(1)}});
        CHECK(manager.getState(0).size() == 3);
        CHECK(manager.version() == 2);

        manager.exit();
        for (auto &node : nodes)
        {
            node.join();
        }
    }

    SUBCASE("Errors reported by a node surface as TrainerError")
    {
        auto nodes = startNodes("FAILING", "inproc://distributed-failing", 1, {{"b", {true, 0}}});
        DistributedPolicyManager manager(scriptedPolicies(names),
                                         std::make_unique<ZmqManagerEndpoint>(context, "FAILING", "inproc://distributed-failing", 1));

        CHECK_THROWS_AS(manager.update({{"b", makeBatch(1)}}), TrainerError);
        CHECK(manager.version() == 0);
        manager.update({{"a", makeBatch(1)}});
        CHECK(manager.version() == 1);

        manager.exit();
        for (auto &node : nodes)
        {
            node.join();
        }
    }

    SUBCASE("makePolicyManager builds a distributed manager")
    {
        auto nodes = startNodes("FACTORY", "inproc://distributed-factory", 1, {});
        ManagerConfig config;
        config.mode = parseManagerMode("distributed");
        config.group = "FACTORY";
        config.address = "inproc://distributed-factory";
        config.context = context;
        auto manager = makePolicyManager(config, scriptedPolicies(names));

        REQUIRE(dynamic_cast<DistributedPolicyManager *>(manager.get()));
        manager->update({{"c", makeBatch(2)}});
        CHECK(manager->getState() == std::map<std::string, PolicyState>{{"c", "1:2"}});

        manager->exit();
        for (auto &node : nodes)
        {
            node.join();
        }
    }
}

TEST_CASE("makePolicyManager builds local managers")
{
    ManagerConfig config;
    config.mode = parseManagerMode("simple");
    auto manager = makePolicyManager(config, scriptedPolicies({"a"}));
    CHECK(dynamic_cast<LocalPolicyManager *>(manager.get()));
    manager->update({{"a", makeBatch(1)}});
    CHECK(manager->version() == 1);
}
