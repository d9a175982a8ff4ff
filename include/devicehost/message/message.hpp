#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace devicehost::message {

// Base class of everything that travels over the bus.
class Message {
public:
    Message() : timestamp_(std::chrono::system_clock::now()) {}
    virtual ~Message() = default;

    virtual std::string type_name() const = 0;

    // Deep copy, used whenever one stored message is handed to several
    // receivers.
    virtual std::shared_ptr<Message> clone() const = 0;

    auto timestamp() const { return timestamp_; }

    // Correlation id of the request this message answers. Stamped by the bus.
    std::optional<uint64_t> request_id;

private:
    std::chrono::system_clock::time_point timestamp_;
};

// Messages that expect exactly one reply.
class Request : public Message {};

// CRTP helper providing clone() for concrete message types
template <typename Derived, typename Base = Message>
class ClonableMessage : public Base {
public:
    std::shared_ptr<Message> clone() const override {
        return std::make_shared<Derived>(static_cast<const Derived&>(*this));
    }
};

}  // namespace devicehost::message
