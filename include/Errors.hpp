#pragma once
//
// Created by moinshaikh on 3/2/26.
//

#ifndef POLICYHUB_ERRORS_HPP
#define POLICYHUB_ERRORS_HPP

#include<stdexcept>
#include<string>

namespace PolicyHub
{
    /**
     * @brief Raised when a manager, trainer or policy is configured with values it cannot work with
     *
     * Thrown at construction time (unknown manager mode, non-trainable policy, bad thresholds)
     * and when update() names a policy the manager does not know.
     */
    class ConfigurationError : public std::invalid_argument
    {
    public:
        explicit ConfigurationError(const std::string &message) : std::invalid_argument(message) {}
    };

    /**
     * @brief A trainer unit failed to complete a request
     *
     * Carries the error text reported by the trainer, or the transport failure that
     * prevented the reply from arriving.
     */
    class TrainerError : public std::runtime_error
    {
    public:
        explicit TrainerError(const std::string &message) : std::runtime_error(message) {}
    };

    /**
     * @brief No reply arrived from a trainer before the configured receive deadline
     */
    class TrainerTimeoutError : public TrainerError
    {
    public:
        explicit TrainerTimeoutError(const std::string &message) : TrainerError(message) {}
    };

    /**
     * @brief A message could not be decoded or arrived out of protocol order
     */
    class ProtocolError : public std::runtime_error
    {
    public:
        explicit ProtocolError(const std::string &message) : std::runtime_error(message) {}
    };

    /**
     * @brief The manager was used after exit() or after a failed round left it unusable
     */
    class ManagerClosedError : public std::logic_error
    {
    public:
        explicit ManagerClosedError(const std::string &message) : std::logic_error(message) {}
    };
}

#endif //POLICYHUB_ERRORS_HPP
