#pragma once

#include <boost/property_tree/ptree.hpp>
#include <exception>
#include <ostream>
#include <string>
#include <variant>

#include "devicehost/log/log_config.hpp"
#include "devicehost/message/message.hpp"

namespace devicehost::message {

/// @brief Asks a manager to start a component on its device.
class StartComponentRequest
    : public ClonableMessage<StartComponentRequest, Request> {
public:
    StartComponentRequest() = default;
    StartComponentRequest(
        std::string name,
        log::LogConfig::LogLevel level = log::LogConfig::LogLevel::INFO,
        boost::property_tree::ptree configuration = {})
        : component_name(std::move(name)),
          log_level(level),
          conf(std::move(configuration)) {}

    std::string type_name() const override { return "StartComponentRequest"; }

    std::string component_name;
    log::LogConfig::LogLevel log_level = log::LogConfig::LogLevel::INFO;
    // Opaque to the manager, handed to the component as is.
    boost::property_tree::ptree conf;
};

/// @brief Asks a manager to stop serving and shut down its components.
class StopRequest : public ClonableMessage<StopRequest, Request> {
public:
    std::string type_name() const override { return "StopRequest"; }
};

/// @brief Reply to a successful start: where the component publishes.
class StartedComponentInformation
    : public ClonableMessage<StartedComponentInformation> {
public:
    StartedComponentInformation() = default;
    explicit StartedComponentInformation(std::string channel,
                                         bool singleton = false)
        : output_channel(std::move(channel)), is_singleton(singleton) {}

    std::string type_name() const override {
        return "StartedComponentInformation";
    }

    std::string output_channel;
    bool is_singleton = false;
};

/// @brief Reply sent when the requested component is not hosted here.
class IgnoreRequestMessage : public ClonableMessage<IgnoreRequestMessage> {
public:
    std::string type_name() const override { return "IgnoreRequestMessage"; }
};

/// @brief Generic acknowledgement.
class SuccessMessage : public ClonableMessage<SuccessMessage> {
public:
    std::string type_name() const override { return "SuccessMessage"; }
};

enum class StartError {
    STARTUP_FAILURE,     // factory, launch or early component failure
    STARTUP_TIMEOUT,     // not ready in time and the policy says fail
    ADMISSION_REJECTED,  // instance limit reached
};

inline std::ostream& operator<<(std::ostream& os, StartError error) {
    switch (error) {
        case StartError::STARTUP_FAILURE:
            return os << "STARTUP_FAILURE";
        case StartError::STARTUP_TIMEOUT:
            return os << "STARTUP_TIMEOUT";
        case StartError::ADMISSION_REJECTED:
            return os << "ADMISSION_REJECTED";
        default:
            return os << "UNKNOWN";
    }
}

/// @brief Reply to a start that did not succeed.
class NotStartedMessage : public ClonableMessage<NotStartedMessage> {
public:
    NotStartedMessage() = default;
    NotStartedMessage(StartError error_kind, std::string reason_text,
                      std::exception_ptr error_cause = nullptr)
        : kind(error_kind),
          reason(std::move(reason_text)),
          cause(std::move(error_cause)) {}

    std::string type_name() const override { return "NotStartedMessage"; }

    StartError kind = StartError::STARTUP_FAILURE;
    std::string reason;
    std::exception_ptr cause;
};

/// @brief Plain text payload, used by the sample components.
class TextMessage : public ClonableMessage<TextMessage> {
public:
    TextMessage() = default;
    explicit TextMessage(std::string body) : text(std::move(body)) {}

    std::string type_name() const override { return "TextMessage"; }

    std::string text;
};

// Outcome of a start: either routing information or a typed failure.
using StartResult = std::variant<StartedComponentInformation, NotStartedMessage>;

// Every reply a manager can produce for one request.
using Reply = std::variant<StartedComponentInformation, NotStartedMessage,
                           IgnoreRequestMessage, SuccessMessage>;

Reply to_reply(StartResult result);

// Boxes a reply for transport over the bus.
std::shared_ptr<Message> to_message(const Reply& reply);

// Name of the alternative held by a reply, for logging.
std::string reply_type_name(const Reply& reply);

}  // namespace devicehost::message
