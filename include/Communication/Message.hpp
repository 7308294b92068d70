#pragma once
/**
 * @file Message.hpp
 * @brief Message schema exchanged between a policy manager and its trainer units
 * @author moinshaikh
 * @date 3/4/26
 *
 * Every request and reply travelling between the manager and a trainer (forked process or
 * remote node) is a single `Message` envelope tagged with a MessageTag. Only the fields that
 * belong to the tag are filled; the others stay empty and cost a few bytes on the wire.
 */

#ifndef POLICYHUB_MESSAGE_HPP
#define POLICYHUB_MESSAGE_HPP

#include<cstddef>
#include<map>
#include<string>

#include<msgpack.hpp>

#include"../Errors.hpp"
#include"../Experience/ExperienceSet.hpp"
#include"../Policy/Policy.hpp"

namespace PolicyHub
{
    /**
     * @brief Kind of a Message
     */
    enum class MessageTag
    {
        Register,        ///< worker -> manager: announce trainer id and group (nodes only)
        InitPolicyState, ///< manager -> trainer: initial state of the policies it owns
        InitDone,        ///< trainer -> manager: acknowledgment carrying the trainer id
        Learn,           ///< manager -> trainer: batches to learn from, keyed by policy
        LearnDone,       ///< trainer -> manager: updated states and tracker
        Error,           ///< trainer -> manager: the request failed, see `error`
        Exit             ///< manager -> trainer: terminate, no reply
    };
}

MSGPACK_ADD_ENUM(PolicyHub::MessageTag);

namespace PolicyHub
{
    /**
     * @brief Readable name of a tag for logs and error messages
     */
    const char *tagName(MessageTag tag);

    /**
     * @struct Message
     * @brief Envelope for the manager/trainer protocol
     */
    struct Message
    {
        MessageTag type = MessageTag::Exit;               ///< What the message asks for or answers
        std::string sender;                               ///< Trainer id on trainer replies and registrations
        std::string group;                                ///< Training group, checked on registration
        std::map<std::string, PolicyState> policyState;   ///< States for InitPolicyState and LearnDone
        std::map<std::string, ExperienceSet> experiences; ///< Batches for Learn
        Tracker tracker;                                  ///< Diagnostics for LearnDone
        std::string error;                                ///< Failure description for Error

        MSGPACK_DEFINE_MAP(type, sender, group, policyState, experiences, tracker, error);
    };

    /**
     * @brief Serializes any msgpack-adapted object into a buffer
     */
    template<class T>
    msgpack::sbuffer pack(const T &object)
    {
        msgpack::sbuffer buffer;
        msgpack::pack(buffer, object);
        return buffer;
    }

    /**
     * @brief Deserializes a buffer produced by pack()
     *
     * @throws ProtocolError if the bytes are not a valid encoding of T
     */
    template<class T>
    T decode(const char *data, std::size_t size)
    {
        try
        {
            msgpack::object_handle objectHandle = msgpack::unpack(data, size);
            return objectHandle.get().as<T>();
        }
        catch (const msgpack::unpack_error &e)
        {
            throw ProtocolError(std::string("Malformed message: ") + e.what());
        }
        catch (const msgpack::type_error &e)
        {
            throw ProtocolError(std::string("Unexpected message layout: ") + e.what());
        }
    }

    template<class T>
    T unpack(const char *data, std::size_t size)
    {
        return decode<T>(data, size);
    }

    /**
     * @brief Decodes a Message and checks every batch it carries
     *
     * @throws ProtocolError if the bytes are malformed or a batch has columns of different lengths
     */
    template<>
    Message unpack<Message>(const char *data, std::size_t size);
}

#endif //POLICYHUB_MESSAGE_HPP
