#pragma once
/**
 * @file Endpoint.hpp
 * @brief Multi-node endpoints for the distributed policy manager
 * @author moinshaikh
 * @date 3/5/26
 *
 * The distributed manager only needs three things from the network: send a message to a
 * trainer by id, receive the next message together with its sender, and close. Those are
 * captured by ManagerEndpoint. The ZeroMQ implementation uses a ROUTER socket on the manager
 * and one DEALER socket per trainer node whose routing id is the trainer id.
 */

#ifndef POLICYHUB_ENDPOINT_HPP
#define POLICYHUB_ENDPOINT_HPP

#include<memory>
#include<set>
#include<string>
#include<utility>
#include<vector>

#include<spdlog/spdlog.h>
#include<zmq.hpp>

#include"Channel.hpp"
#include"Message.hpp"

namespace PolicyHub
{
    /**
     * @brief Conventional id of the trainer with the given index ("TRAINER.<index>")
     */
    std::string trainerName(int index);

    /**
     * @brief Manager side of the multi-node transport
     */
    class ManagerEndpoint
    {
    public:
        virtual ~ManagerEndpoint() = 0;

        /**
         * @brief Ids of the trainers reachable through this endpoint, in a fixed order
         */
        virtual const std::vector<std::string> &workers() const = 0;

        /**
         * @brief Sends @p message to trainer @p worker
         * @throws TrainerError if the worker is unknown or the transport fails
         */
        virtual void send(const std::string &worker, const Message &message) = 0;

        /**
         * @brief Blocks until a message arrives from any trainer
         * @return The message and the id of the trainer that sent it
         * @throws TrainerTimeoutError if a receive deadline is set and expires
         */
        virtual std::pair<Message, std::string> receive() = 0;

        virtual void close() = 0;
    };
    inline ManagerEndpoint::~ManagerEndpoint() {}

    /**
     * @brief Deadlines applied by the ZeroMQ endpoints, in milliseconds (-1 waits forever)
     */
    struct EndpointOptions
    {
        int receiveTimeoutMs = -1;   ///< Deadline for each receive() after discovery
        int discoveryTimeoutMs = -1; ///< Deadline for each registration during discovery
    };

    /**
     * @class ZmqManagerEndpoint
     * @brief ROUTER socket that discovers `numTrainers` trainers of one group
     *
     * The constructor binds @p address and blocks until every trainer "TRAINER.0" ..
     * "TRAINER.<numTrainers-1>" of @p group has registered. Registrations from other groups
     * or with unexpected ids are logged and ignored.
     */
    class ZmqManagerEndpoint : public ManagerEndpoint
    {
    private:
        std::shared_ptr<zmq::context_t> context;  ///< Context shared with inproc peers
        zmq::socket_t socket;                     ///< ROUTER socket
        std::string group;                        ///< Training group name
        std::string address;                      ///< Bound address
        std::vector<std::string> trainers;        ///< Expected trainer ids, index order
        EndpointOptions options;                  ///< Deadlines
        std::shared_ptr<spdlog::logger> logger;   ///< Endpoint logger
        bool closed;                              ///< Set by close()

        void discover();

        std::pair<Message, std::string> receiveFrames();
    public:
        /**
         * @throws ConfigurationError if numTrainers is not positive
         * @throws TrainerError if the address cannot be bound
         * @throws TrainerTimeoutError if discovery does not complete in time
         */
        ZmqManagerEndpoint(std::shared_ptr<zmq::context_t> context,
                           std::string group,
                           std::string address,
                           int numTrainers,
                           EndpointOptions options = {});

        ~ZmqManagerEndpoint() override;

        const std::vector<std::string> &workers() const override
        {
            return trainers;
        }

        void send(const std::string &worker, const Message &message) override;

        std::pair<Message, std::string> receive() override;

        void close() override;
    };

    /**
     * @class ZmqWorkerEndpoint
     * @brief DEALER socket used by a trainer node to talk to its manager
     *
     * Registers with the manager as soon as it is constructed.
     */
    class ZmqWorkerEndpoint : public Connection
    {
    private:
        std::shared_ptr<zmq::context_t> context; ///< Context shared with inproc peers
        zmq::socket_t socket;                    ///< DEALER socket, routing id = trainer id
        std::string trainerId;                   ///< This trainer's id
        int receiveTimeoutMs;                    ///< Receive deadline, -1 to wait forever
    public:
        ZmqWorkerEndpoint(std::shared_ptr<zmq::context_t> context,
                          const std::string &group,
                          const std::string &address,
                          std::string trainerId,
                          int receiveTimeoutMs = -1);

        ~ZmqWorkerEndpoint() override;

        void send(const Message &message) override;

        Message receive() override;

        inline const std::string &get_trainer_id() const
        {
            return trainerId;
        }
    };
}

#endif //POLICYHUB_ENDPOINT_HPP
