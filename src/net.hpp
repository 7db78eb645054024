#pragma once

#include <string>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

namespace net = boost::asio;
namespace ip = net::ip;
using tcp = net::ip::tcp;

namespace pico
{

// Splits a string in the form host:port in two strings. Returns empty
// strings if either part is missing.
std::pair<std::string, std::string> split_host_port(std::string const& addr);

std::string to_string(tcp::endpoint const& endpoint);

}

