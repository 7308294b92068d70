//
// Created by moinshaikh on 3/4/26.
//

#include<fmt/format.h>

#include"../../include/Communication/Message.hpp"

#include<doctest/doctest.h>

namespace PolicyHub
{
    const char *tagName(MessageTag tag)
    {
        switch (tag)
        {
            case MessageTag::Register:
                return "REGISTER";
            case MessageTag::InitPolicyState:
                return "INIT_POLICY_STATE";
            case MessageTag::InitDone:
                return "INIT_DONE";
            case MessageTag::Learn:
                return "LEARN";
            case MessageTag::LearnDone:
                return "LEARN_DONE";
            case MessageTag::Error:
                return "ERROR";
            case MessageTag::Exit:
                return "EXIT";
        }
        return "UNKNOWN";
    }

    template<>
    Message unpack<Message>(const char *data, std::size_t size)
    {
        auto message = decode<Message>(data, size);
        for (const auto &entry : message.experiences)
        {
            try
            {
                entry.second.validate();
            }
            catch (const std::invalid_argument &e)
            {
                throw ProtocolError(fmt::format("Batch for policy '{}' is malformed: {}", entry.first, e.what()));
            }
        }
        return message;
    }

    namespace
    {
        // Wire layout of a batch without the column-length check
        struct RawColumns
        {
            std::vector<std::vector<float>> states;
            std::vector<std::vector<float>> actions;
            std::vector<float> rewards;
            std::vector<std::vector<float>> nextStates;

            MSGPACK_DEFINE_MAP(states, actions, rewards, nextStates);
        };

        struct RawLearn
        {
            MessageTag type = MessageTag::Learn;
            std::map<std::string, RawColumns> experiences;

            MSGPACK_DEFINE_MAP(type, experiences);
        };
    }

    TEST_CASE("Message")
    {
        SUBCASE("Learn requests keep batches and binary states intact")
        {
            Message request;
            request.type = MessageTag::Learn;
            request.sender = "TRAINER.1";
            request.policyState["a"] = PolicyState("\x00\x01\xff", 3);
            request.experiences["a"].add({1, 2}, {0}, 1.5, {2, 3});
            request.tracker["a"] = {{"loss", 0.25f}};

            auto buffer = pack(request);
            auto decoded = unpack<Message>(buffer.data(), buffer.size());

            CHECK(decoded.type == MessageTag::Learn);
            CHECK(decoded.sender == "TRAINER.1");
            REQUIRE(decoded.policyState.count("a") == 1);
            CHECK(decoded.policyState["a"] == request.policyState["a"]);
            REQUIRE(decoded.experiences["a"].size() == 1);
            CHECK(decoded.experiences["a"].get_next_states()[0][1] == doctest::Approx(3));
            CHECK(decoded.tracker["a"][0].name == "loss");
        }

        SUBCASE("Garbage is reported as a protocol error")
        {
            const char garbage[] = {'\xc1', '\x00'};
            CHECK_THROWS_AS(unpack<Message>(garbage, sizeof(garbage)), ProtocolError);

            auto notAMessage = pack(42);
            CHECK_THROWS_AS(unpack<Message>(notAMessage.data(), notAMessage.size()), ProtocolError);
        }

        SUBCASE("Batches with columns of different lengths are rejected")
        {
            RawLearn ragged;
            ragged.experiences["a"].rewards = {1, 2, 3};
            ragged.experiences["a"].actions = {{0}, {0}, {0}};
            ragged.experiences["a"].nextStates = {{1}, {2}, {3}};
            auto buffer = pack(ragged);
            CHECK_THROWS_AS(unpack<Message>(buffer.data(), buffer.size()), ProtocolError);

            ragged.experiences["a"].states = {{0}, {1}, {2}};
            buffer = pack(ragged);
            auto decoded = unpack<Message>(buffer.data(), buffer.size());
            CHECK(decoded.experiences["a"].size() == 3);
        }

        SUBCASE("Tags have readable names")
        {
            CHECK(std::string(tagName(MessageTag::InitPolicyState)) == "INIT_POLICY_STATE");
            CHECK(std::string(tagName(MessageTag::Exit)) == "EXIT");
        }
    }
}
