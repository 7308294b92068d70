//
// Created by moinshaikh on 3/4/26.
//


#include<fmt/format.h>
#include<spdlog/spdlog.h>

#include"../../include/Communication/Channel.hpp"

#include<doctest/doctest.h>

namespace PolicyHub
{
    Channel::Channel(zmq::context_t &context, const std::string &url, Mode mode, int timeoutMs) :
        url(url),
        timeoutMs(timeoutMs)
    {
        try
        {
            socket = zmq::socket_t(context, zmq::socket_type::pair);
            socket.set(zmq::sockopt::linger, 0);
            socket.set(zmq::sockopt::rcvtimeo, timeoutMs);
            socket.set(zmq::sockopt::sndtimeo, timeoutMs);
            if (mode == Mode::Bind)
            {
                socket.bind(url);
            }
            else
            {
                socket.connect(url);
            }
        }
        catch (const zmq::error_t &e)
        {
            throw TrainerError(fmt::format("Cannot open channel on {}: {}", url, e.what()));
        }
        spdlog::debug("Channel {} on {}", mode == Mode::Bind ? "bound" : "connected", url);
    }

    Channel::~Channel()
    {
        close();
    }

    void Channel::send(const Message &message)
    {
        if (!trySend(message, zmq::send_flags::none))
        {
            throw TrainerTimeoutError(fmt::format("Could not send {} on {} within {} ms", tagName(message.type), url, timeoutMs));
        }
    }

    bool Channel::trySend(const Message &message)
    {
        return trySend(message, zmq::send_flags::dontwait);
    }

    bool Channel::trySend(const Message &message, zmq::send_flags flags)
    {
        auto buffer = pack(message);
        zmq::message_t payload(buffer.data(), buffer.size());
        try
        {
            return socket.send(payload, flags).has_value();
        }
        catch (const zmq::error_t &e)
        {
            throw TrainerError(fmt::format("Failed to send {} on {}: {}", tagName(message.type), url, e.what()));
        }
    }

    Message Channel::receive()
    {
        zmq::message_t payload;
        zmq::recv_result_t received;
        try
        {
            received = socket.recv(payload, zmq::recv_flags::none);
        }
        catch (const zmq::error_t &e)
        {
            throw TrainerError(fmt::format("Failed to receive on {}: {}", url, e.what()));
        }
        if (!received)
        {
            throw TrainerTimeoutError(fmt::format("No message on {} within {} ms", url, timeoutMs));
        }
        return unpack<Message>(payload.data<char>(), payload.size());
    }

    void Channel::close()
    {
        if (socket)
        {
            socket.close();
        }
    }

    TEST_CASE("Channel")
    {
        zmq::context_t context(1);

        SUBCASE("Messages cross the channel in order")
        {
            Channel manager(context, "inproc://channel-order", Channel::Mode::Bind);
            Channel trainer(context, "inproc://channel-order", Channel::Mode::Connect);

            Message first;
            first.type = MessageTag::InitPolicyState;
            Message second;
            second.type = MessageTag::Learn;
            second.experiences["p"].add({1}, {1}, 1, {1});

            manager.send(first);
            manager.send(second);

            CHECK(trainer.receive().type == MessageTag::InitPolicyState);
            auto received = trainer.receive();
            CHECK(received.type == MessageTag::Learn);
            CHECK(received.experiences["p"].size() == 1);

            Message reply;
            reply.type = MessageTag::LearnDone;
            reply.sender = "TRAINER.0";
            trainer.send(reply);
            CHECK(manager.receive().sender == "TRAINER.0");
        }

        SUBCASE("A receive deadline raises a timeout")
        {
            Channel manager(context, "inproc://channel-timeout", Channel::Mode::Bind, 50);
            Channel trainer(context, "inproc://channel-timeout", Channel::Mode::Connect);
            CHECK_THROWS_AS(manager.receive(), TrainerTimeoutError);
        }

        SUBCASE("Sending without a peer times out")
        {
            Channel lonely(context, "inproc://channel-lonely", Channel::Mode::Bind, 50);
            CHECK_THROWS_AS(lonely.send(Message()), TrainerTimeoutError);
            CHECK_FALSE(lonely.trySend(Message()));
        }

        SUBCASE("Closed channels refuse traffic")
        {
            Channel manager(context, "inproc://channel-closed", Channel::Mode::Bind);
            manager.close();
            CHECK_THROWS_AS(manager.send(Message()), TrainerError);
        }
    }
}
