// tests/message/test_messages.cpp
#define BOOST_TEST_MODULE MessageTests
#include <boost/test/unit_test.hpp>

#include "devicehost/message/messages.hpp"

using namespace devicehost::message;

BOOST_AUTO_TEST_SUITE(MessageTestSuite)

BOOST_AUTO_TEST_CASE(test_clone_is_deep_copy) {
    boost::property_tree::ptree conf;
    conf.put("speed", 3);
    StartComponentRequest request("motor",
                                  devicehost::log::LogConfig::LogLevel::DEBUG,
                                  conf);

    auto copy = request.clone();
    auto* typed = dynamic_cast<StartComponentRequest*>(copy.get());
    BOOST_REQUIRE(typed != nullptr);
    BOOST_CHECK(typed != &request);
    BOOST_CHECK_EQUAL(typed->component_name, "motor");
    BOOST_CHECK_EQUAL(typed->conf.get<int>("speed"), 3);

    typed->conf.put("speed", 5);
    BOOST_CHECK_EQUAL(request.conf.get<int>("speed"), 3);
}

BOOST_AUTO_TEST_CASE(test_requests_are_requests) {
    StartComponentRequest start("echo");
    StopRequest stop;
    TextMessage text("hello");
    BOOST_CHECK(dynamic_cast<const Request*>(&start) != nullptr);
    BOOST_CHECK(dynamic_cast<const Request*>(&stop) != nullptr);
    BOOST_CHECK(dynamic_cast<const Request*>(&text) == nullptr);
}

BOOST_AUTO_TEST_CASE(test_start_result_to_reply) {
    StartResult started = StartedComponentInformation("echo:10.0.0.5");
    Reply reply = to_reply(started);
    BOOST_REQUIRE(std::holds_alternative<StartedComponentInformation>(reply));
    BOOST_CHECK_EQUAL(std::get<StartedComponentInformation>(reply).output_channel,
                      "echo:10.0.0.5");
    BOOST_CHECK_EQUAL(reply_type_name(reply), "StartedComponentInformation");

    StartResult failed =
        NotStartedMessage(StartError::STARTUP_TIMEOUT, "not ready");
    reply = to_reply(failed);
    BOOST_REQUIRE(std::holds_alternative<NotStartedMessage>(reply));
    BOOST_CHECK(std::get<NotStartedMessage>(reply).kind ==
                StartError::STARTUP_TIMEOUT);
}

BOOST_AUTO_TEST_CASE(test_reply_to_message) {
    Reply reply = IgnoreRequestMessage{};
    auto boxed = to_message(reply);
    BOOST_REQUIRE(boxed);
    BOOST_CHECK_EQUAL(boxed->type_name(), "IgnoreRequestMessage");
    BOOST_CHECK(dynamic_cast<IgnoreRequestMessage*>(boxed.get()) != nullptr);
}

BOOST_AUTO_TEST_CASE(test_not_started_keeps_cause) {
    std::exception_ptr cause;
    try {
        throw std::runtime_error("boom");
    } catch (const std::exception&) {
        cause = std::current_exception();
    }
    NotStartedMessage message(StartError::STARTUP_FAILURE, "failed", cause);
    auto copy = std::static_pointer_cast<NotStartedMessage>(message.clone());
    BOOST_CHECK(copy->cause == cause);
    BOOST_CHECK_THROW(std::rethrow_exception(copy->cause), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()
