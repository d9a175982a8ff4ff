#include "devicehost/message/messages.hpp"

namespace devicehost::message {

Reply to_reply(StartResult result) {
    return std::visit([](auto&& value) -> Reply { return std::move(value); },
                      std::move(result));
}

std::shared_ptr<Message> to_message(const Reply& reply) {
    return std::visit(
        [](const auto& value) -> std::shared_ptr<Message> {
            return value.clone();
        },
        reply);
}

std::string reply_type_name(const Reply& reply) {
    return std::visit([](const auto& value) { return value.type_name(); },
                      reply);
}

}  // namespace devicehost::message
