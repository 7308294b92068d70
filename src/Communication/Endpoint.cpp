//
// Created by moinshaikh on 3/5/26.
//

#include<algorithm>
#include<thread>

#include<fmt/format.h>
#include<fmt/ranges.h>

#include"../../include/Communication/Endpoint.hpp"
#include"../../include/Logging.hpp"

#include<doctest/doctest.h>

namespace PolicyHub
{
    // Undelivered messages are kept this long when a socket closes
    static const int lingerMs = 1000;

    std::string trainerName(int index)
    {
        return "TRAINER." + std::to_string(index);
    }

    ZmqManagerEndpoint::ZmqManagerEndpoint(std::shared_ptr<zmq::context_t> context,
                                           std::string group,
                                           std::string address,
                                           int numTrainers,
                                           EndpointOptions options) :
        context(std::move(context)),
        group(std::move(group)),
        address(std::move(address)),
        options(options),
        logger(makeLogger("MANAGER_ENDPOINT")),
        closed(false)
    {
        if (numTrainers < 1)
        {
            throw ConfigurationError(fmt::format("A manager endpoint needs at least one trainer, got {}", numTrainers));
        }
        for (int i = 0; i < numTrainers; ++i)
        {
            trainers.push_back(trainerName(i));
        }

        try
        {
            socket = zmq::socket_t(*this->context, zmq::socket_type::router);
            socket.set(zmq::sockopt::linger, lingerMs);
            socket.set(zmq::sockopt::router_mandatory, true);
            socket.bind(this->address);
        }
        catch (const zmq::error_t &e)
        {
            throw TrainerError(fmt::format("Cannot bind manager endpoint on {}: {}", this->address, e.what()));
        }
        logger->info("Group {} listening on {} for {} trainers", this->group, this->address, numTrainers);
        discover();
    }

    ZmqManagerEndpoint::~ZmqManagerEndpoint()
    {
        if (!closed)
        {
            close();
        }
    }

    void ZmqManagerEndpoint::discover()
    {
        socket.set(zmq::sockopt::rcvtimeo, options.discoveryTimeoutMs);
        std::set<std::string> pending(trainers.begin(), trainers.end());
        while (!pending.empty())
        {
            std::pair<Message, std::string> received;
            try
            {
                received = receiveFrames();
            }
            catch (const TrainerTimeoutError &)
            {
                throw TrainerTimeoutError(fmt::format("Peer discovery for group {} timed out, still waiting for {}",
                                                      group, fmt::join(pending, ", ")));
            }

            const auto &message = received.first;
            const auto &sender = received.second;
            if (message.type != MessageTag::Register)
            {
                logger->warn("Ignoring {} from {} during discovery", tagName(message.type), sender);
                continue;
            }
            if (message.group != group)
            {
                logger->warn("Ignoring {} which registered for group {}", sender, message.group);
                continue;
            }
            if (pending.erase(sender) == 0)
            {
                logger->warn("Ignoring unexpected or repeated registration from {}", sender);
                continue;
            }
            logger->info("{} joined group {}", sender, group);
        }
        socket.set(zmq::sockopt::rcvtimeo, options.receiveTimeoutMs);
    }

    std::pair<Message, std::string> ZmqManagerEndpoint::receiveFrames()
    {
        zmq::message_t identity;
        zmq::message_t payload;
        try
        {
            if (!socket.recv(identity, zmq::recv_flags::none))
            {
                throw TrainerTimeoutError(fmt::format("No message from group {} on {}", group, address));
            }
            if (!socket.get(zmq::sockopt::rcvmore))
            {
                throw ProtocolError(fmt::format("Message from {} has no payload", identity.to_string()));
            }
            if (!socket.recv(payload, zmq::recv_flags::none))
            {
                throw TrainerTimeoutError(fmt::format("Payload from {} did not arrive", identity.to_string()));
            }
        }
        catch (const zmq::error_t &e)
        {
            throw TrainerError(fmt::format("Failed to receive on {}: {}", address, e.what()));
        }
        return {unpack<Message>(payload.data<char>(), payload.size()), identity.to_string()};
    }

    void ZmqManagerEndpoint::send(const std::string &worker, const Message &message)
    {
        if (closed)
        {
            throw TrainerError(fmt::format("Cannot send {} to {}: endpoint is closed", tagName(message.type), worker));
        }
        if (std::find(trainers.begin(), trainers.end(), worker) == trainers.end())
        {
            throw TrainerError(fmt::format("Unknown trainer {} in group {}", worker, group));
        }

        auto buffer = pack(message);
        zmq::message_t payload(buffer.data(), buffer.size());
        try
        {
            socket.send(zmq::buffer(worker), zmq::send_flags::sndmore);
            socket.send(payload, zmq::send_flags::none);
        }
        catch (const zmq::error_t &e)
        {
            throw TrainerError(fmt::format("Failed to send {} to {}: {}", tagName(message.type), worker, e.what()));
        }
    }

    std::pair<Message, std::string> ZmqManagerEndpoint::receive()
    {
        if (closed)
        {
            throw TrainerError("Cannot receive: endpoint is closed");
        }
        while (true)
        {
            auto received = receiveFrames();
            if (received.first.type == MessageTag::Register)
            {
                logger->debug("Late registration from {}", received.second);
                continue;
            }
            return received;
        }
    }

    void ZmqManagerEndpoint::close()
    {
        socket.close();
        closed = true;
    }

    ZmqWorkerEndpoint::ZmqWorkerEndpoint(std::shared_ptr<zmq::context_t> context,
                                         const std::string &group,
                                         const std::string &address,
                                         std::string trainerId,
                                         int receiveTimeoutMs) :
        context(std::move(context)),
        trainerId(std::move(trainerId)),
        receiveTimeoutMs(receiveTimeoutMs)
    {
        try
        {
            socket = zmq::socket_t(*this->context, zmq::socket_type::dealer);
            socket.set(zmq::sockopt::routing_id, this->trainerId);
            socket.set(zmq::sockopt::linger, lingerMs);
            socket.set(zmq::sockopt::rcvtimeo, receiveTimeoutMs);
            socket.connect(address);
        }
        catch (const zmq::error_t &e)
        {
            throw TrainerError(fmt::format("{} cannot connect to {}: {}", this->trainerId, address, e.what()));
        }

        Message registration;
        registration.type = MessageTag::Register;
        registration.sender = this->trainerId;
        registration.group = group;
        send(registration);
    }

    ZmqWorkerEndpoint::~ZmqWorkerEndpoint()
    {
        socket.close();
    }

    void ZmqWorkerEndpoint::send(const Message &message)
    {
        auto buffer = pack(message);
        zmq::message_t payload(buffer.data(), buffer.size());
        try
        {
            socket.send(payload, zmq::send_flags::none);
        }
        catch (const zmq::error_t &e)
        {
            throw TrainerError(fmt::format("{} failed to send {}: {}", trainerId, tagName(message.type), e.what()));
        }
    }

    Message ZmqWorkerEndpoint::receive()
    {
        zmq::message_t payload;
        zmq::recv_result_t received;
        try
        {
            received = socket.recv(payload, zmq::recv_flags::none);
        }
        catch (const zmq::error_t &e)
        {
            throw TrainerError(fmt::format("{} failed to receive: {}", trainerId, e.what()));
        }
        if (!received)
        {
            throw TrainerTimeoutError(fmt::format("{} got no message within {} ms", trainerId, receiveTimeoutMs));
        }
        return unpack<Message>(payload.data<char>(), payload.size());
    }

    TEST_CASE("ZmqManagerEndpoint")
    {
        auto context = std::make_shared<zmq::context_t>(1);

        SUBCASE("Discovers trainers of its group and routes replies by sender")
        {
            const std::string address = "inproc://endpoint-routing";
            auto echo = [&](const std::string &group, const std::string &id)
            {
                ZmqWorkerEndpoint worker(context, group, address, id);
                if (group != "ROUTING")
                {
                    return;
                }
                auto request = worker.receive();
                Message reply;
                reply.type = MessageTag::LearnDone;
                reply.sender = id;
                reply.tracker[id] = {{"experiences", static_cast<float>(request.experiences.size())}};
                worker.send(reply);
                while (worker.receive().type != MessageTag::Exit)
                {
                }
            };
            std::thread intruder(echo, "OTHER", "TRAINER.5");
            std::thread first(echo, "ROUTING", "TRAINER.0");
            std::thread second(echo, "ROUTING", "TRAINER.1");

            ZmqManagerEndpoint endpoint(context, "ROUTING", address, 2);
            REQUIRE(endpoint.workers() == std::vector<std::string>{"TRAINER.0", "TRAINER.1"});

            Message request;
            request.type = MessageTag::Learn;
            request.experiences["b"].add({1}, {1}, 1, {1});
            endpoint.send("TRAINER.1", request);
            request.experiences["a"].add({1}, {1}, 1, {1});
            endpoint.send("TRAINER.0", request);

            std::map<std::string, Message> replies;
            for (int i = 0; i < 2; ++i)
            {
                auto received = endpoint.receive();
                CHECK(received.first.sender == received.second);
                replies[received.second] = received.first;
            }
            CHECK(replies["TRAINER.0"].tracker["TRAINER.0"][0].value == doctest::Approx(2));
            CHECK(replies["TRAINER.1"].tracker["TRAINER.1"][0].value == doctest::Approx(1));

            CHECK_THROWS_AS(endpoint.send("TRAINER.7", request), TrainerError);

            Message quit;
            quit.type = MessageTag::Exit;
            endpoint.send("TRAINER.0", quit);
            endpoint.send("TRAINER.1", quit);
            first.join();
            second.join();
            intruder.join();
            endpoint.close();
            CHECK_THROWS_AS(endpoint.send("TRAINER.0", quit), TrainerError);
        }

        SUBCASE("Discovery gives up after its deadline")
        {
            EndpointOptions options;
            options.discoveryTimeoutMs = 50;
            CHECK_THROWS_AS(ZmqManagerEndpoint(context, "EMPTY", "inproc://endpoint-empty", 1, options),
                            TrainerTimeoutError);
        }

        SUBCASE("At least one trainer is required")
        {
            CHECK_THROWS_AS(ZmqManagerEndpoint(context, "NONE", "inproc://endpoint-none", 0), ConfigurationError);
        }
    }
}
