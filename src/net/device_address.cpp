#include "devicehost/net/device_address.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>

#include "devicehost/log/logger.hpp"

namespace devicehost::net {

std::string resolve_device_address() {
    boost::asio::io_context io_context;
    boost::asio::ip::udp::socket socket(io_context);
    boost::system::error_code ec;

    const boost::asio::ip::udp::endpoint probe(
        boost::asio::ip::make_address_v4("10.255.255.255"), 1);

    socket.open(boost::asio::ip::udp::v4(), ec);
    if (!ec) {
        socket.connect(probe, ec);
    }
    if (ec) {
        DEVICEHOST_LOG_WARN << "Could not determine device address ("
                            << ec.message() << "), using "
                            << LOOPBACK_ADDRESS;
        return LOOPBACK_ADDRESS;
    }

    auto local = socket.local_endpoint(ec);
    if (ec || local.address().is_unspecified()) {
        DEVICEHOST_LOG_WARN << "No local endpoint for device address probe, "
                            << "using " << LOOPBACK_ADDRESS;
        return LOOPBACK_ADDRESS;
    }
    return local.address().to_string();
}

}  // namespace devicehost::net
