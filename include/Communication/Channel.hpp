#pragma once
/**
 * @file Channel.hpp
 * @brief ZeroMQ PAIR channel between a policy manager and a forked trainer process
 * @author moinshaikh
 * @date 3/4/26
 *
 * The multi-process policy manager talks to each of its trainer processes over one
 * duplex channel. Both ends exchange MessagePack-encoded Message envelopes; the manager
 * binds an `ipc://` address and the trainer process connects to it after fork().
 */

#ifndef POLICYHUB_CHANNEL_HPP
#define POLICYHUB_CHANNEL_HPP

#include<string>

#include<zmq.hpp>

#include"Message.hpp"

namespace PolicyHub
{
    /**
     * @brief Duplex, strictly ordered message pipe
     *
     * Implemented by the process channel and by the worker side of the node endpoint so that
     * the trainer serving loop does not care which transport it runs on.
     */
    class Connection
    {
    public:
        virtual ~Connection() = 0;

        /**
         * @brief Blocks until the message is queued for delivery
         * @throws TrainerError if the transport fails
         */
        virtual void send(const Message &message) = 0;

        /**
         * @brief Blocks until the next message arrives
         * @throws TrainerTimeoutError if a receive deadline is set and expires
         * @throws TrainerError if the transport fails
         * @throws ProtocolError if the payload cannot be decoded
         */
        virtual Message receive() = 0;
    };
    inline Connection::~Connection() {}

    /**
     * @class Channel
     * @brief ZeroMQ `ZMQ_PAIR` socket carrying Message envelopes
     *
     * Usage pattern:
     * 1. Manager creates the channel in Bind mode on an `ipc://` address
     * 2. Trainer process creates its own context and a Connect-mode channel on the same address
     * 3. Strict request/response: send(), then receive()
     * 4. Socket is closed on destruction
     */
    class Channel : public Connection
    {
    public:
        enum class Mode
        {
            Bind,
            Connect
        };
    private:
        zmq::socket_t socket;  ///< PAIR socket
        std::string url;       ///< Address the socket is bound or connected to
        int timeoutMs;         ///< Send and receive deadline in milliseconds, -1 to block forever

        bool trySend(const Message &message, zmq::send_flags flags);
    public:
        /**
         * @brief Opens the socket and binds or connects it
         *
         * @param context ZeroMQ context of the calling process
         * @param url Transport address (e.g., "ipc:///tmp/policyhub-1234-TRAINER.0")
         * @param mode Whether this end binds or connects
         * @param timeoutMs Deadline for send() and receive(), -1 to wait forever. A PAIR socket
         *        without a connected peer blocks on send, so a dead peer is only noticed with a
         *        deadline.
         *
         * @throws TrainerError if the socket cannot be opened
         */
        Channel(zmq::context_t &context, const std::string &url, Mode mode, int timeoutMs = -1);

        ~Channel() override;

        /**
         * @throws TrainerTimeoutError if the deadline expires before the message is queued
         * @throws TrainerError if the transport fails
         */
        void send(const Message &message) override;

        /**
         * @brief Queues @p message only if that is possible without blocking
         *
         * @return false if the peer is gone or its queue is full
         * @throws TrainerError if the transport fails
         */
        bool trySend(const Message &message);

        Message receive() override;

        /**
         * @brief Closes the socket; further send() or receive() calls fail
         */
        void close();

        inline const std::string &get_url() const
        {
            return url;
        }
    };
}

#endif //POLICYHUB_CHANNEL_HPP
