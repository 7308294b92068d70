//
// Created by moinshaikh on 3/11/26.
//

#include<thread>

#include<doctest/doctest.h>

#include"TestPolicies.hpp"

using namespace PolicyHub;
using namespace PolicyHub::Testing;

static Message initRequest(const std::map<std::string, PolicyState> &states)
{
    Message request;
    request.type = MessageTag::InitPolicyState;
    request.policyState = states;
    return request;
}

TEST_CASE("Trainer")
{
    Trainer trainer("TRAINER.0", scriptedFactories({"a", "b"}, {{"b", {true, 0}}}));

    SUBCASE("InitPolicyState builds the named policies and loads their state")
    {
        auto reply = trainer.handle(initRequest({{"a", "3:0"}}));
        REQUIRE(reply);
        CHECK(reply->type == MessageTag::InitDone);
        CHECK(reply->sender == "TRAINER.0");
        REQUIRE(trainer.get_policies().count("a"));
        CHECK_FALSE(trainer.get_policies().count("b"));
        CHECK(trainer.get_policies().at("a")->getState() == "3:0");
    }

    SUBCASE("Learn only reports policies with a non-empty batch")
    {
        trainer.handle(initRequest({{"a", "0:0"}, {"b", "0:0"}}));

        Message request;
        request.type = MessageTag::Learn;
        request.experiences["a"] = makeBatch(2);
        request.experiences["b"] = ExperienceSet();
        auto reply = trainer.handle(std::move(request));

        REQUIRE(reply);
        CHECK(reply->type == MessageTag::LearnDone);
        CHECK(reply->sender == "TRAINER.0");
        CHECK(reply->policyState == std::map<std::string, PolicyState>{{"a", "1:2"}});
        REQUIRE(reply->tracker.count("a"));
        CHECK(reply->tracker.at("a")[0].name == "experiences");
        CHECK(reply->tracker.at("a")[0].value == doctest::Approx(2));
        CHECK_FALSE(reply->tracker.count("b"));
    }

    SUBCASE("Failures become Error replies and the trainer keeps serving")
    {
        trainer.handle(initRequest({{"a", "0:0"}, {"b", "0:0"}}));

        Message failing;
        failing.type = MessageTag::Learn;
        failing.experiences["b"] = makeBatch(1);
        auto reply = trainer.handle(std::move(failing));
        REQUIRE(reply);
        CHECK(reply->type == MessageTag::Error);
        CHECK(reply->sender == "TRAINER.0");
        CHECK(reply->error == "scripted learn failure");

        Message healthy;
        healthy.type = MessageTag::Learn;
        healthy.experiences["a"] = makeBatch(1);
        reply = trainer.handle(std::move(healthy));
        REQUIRE(reply);
        CHECK(reply->type == MessageTag::LearnDone);
    }

    SUBCASE("Batches for policies the trainer does not own are rejected")
    {
        trainer.handle(initRequest({{"a", "0:0"}}));
        Message request;
        request.type = MessageTag::Learn;
        request.experiences["z"] = makeBatch(1);
        auto reply = trainer.handle(std::move(request));
        REQUIRE(reply);
        CHECK(reply->type == MessageTag::Error);
        CHECK(reply->error.find("does not own") != std::string::npos);
    }

    SUBCASE("Policies without a factory cannot be initialized")
    {
        auto reply = trainer.handle(initRequest({{"c", "0:0"}}));
        REQUIRE(reply);
        CHECK(reply->type == MessageTag::Error);
        CHECK(reply->error.find("no factory") != std::string::npos);
    }

    SUBCASE("Exit has no reply")
    {
        Message quit;
        quit.type = MessageTag::Exit;
        CHECK_FALSE(trainer.handle(std::move(quit)));
    }
}

TEST_CASE("serve")
{
    zmq::context_t context(1);
    const std::string url = "inproc://trainer-serve";
    Channel manager(context, url, Channel::Mode::Bind, 5000);

    std::thread worker([&]()
    {
        Channel channel(context, url, Channel::Mode::Connect);
        Trainer trainer("TRAINER.3", scriptedFactories({"a"}));
        serve(trainer, channel);
    });

    manager.send(initRequest({{"a", "4:0"}}));
    auto initialized = manager.receive();
    CHECK(initialized.type == MessageTag::InitDone);
    CHECK(initialized.sender == "TRAINER.3");

    Message learn;
    learn.type = MessageTag::Learn;
    learn.experiences["a"] = makeBatch(3);
    manager.send(learn);
    auto learned = manager.receive();
    CHECK(learned.type == MessageTag::LearnDone);
    CHECK(learned.policyState.at("a") == "5:3");

    Message quit;
    quit.type = MessageTag::Exit;
    manager.send(quit);
    worker.join();
}
