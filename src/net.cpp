#include "net.hpp"

#include <fmt/format.h>

namespace pico
{

std::pair<std::string, std::string> split_host_port(std::string const& addr)
{
   // rfind so that the port of bracketed IPv6 addresses is found.
   auto const pos = addr.rfind(':');
   if (pos == std::string::npos || pos == 0)
      return {};

   if (1 + pos == std::size(addr))
      return {};

   auto host = addr.substr(0, pos);
   if (std::size(host) > 2 && host.front() == '[' && host.back() == ']')
      host = host.substr(1, std::size(host) - 2);

   return {host, addr.substr(pos + 1)};
}

std::string to_string(tcp::endpoint const& endpoint)
{
   auto const addr = endpoint.address();
   if (addr.is_v6())
      return fmt::format("[{0}]:{1}", addr.to_string(), endpoint.port());

   return fmt::format("{0}:{1}", addr.to_string(), endpoint.port());
}

}

