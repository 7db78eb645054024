#include "logger.hpp"

#include <mutex>
#include <iostream>
#include <algorithm>

namespace pico { namespace log {

namespace global
{
level filter = level::notice;
std::vector<std::string> subsystems;
std::mutex mutex;
}

char const* to_string(level ll) noexcept
{
   switch (ll) {
      case level::emerg:   return "emerg";
      case level::alert:   return "alert";
      case level::crit:    return "crit";
      case level::err:     return "err";
      case level::warning: return "warning";
      case level::notice:  return "notice";
      case level::info:    return "info";
      case level::debug:   return "debug";
      default:             return "";
   }
}

void upto(level ll)
{
   global::filter = ll;
}

void enable_subsystems(std::vector<std::string> const& subsystems)
{
   global::subsystems = subsystems;
}

bool is_enabled(std::string_view subsystem)
{
   auto const match =
      std::find( std::cbegin(global::subsystems)
               , std::cend(global::subsystems)
               , subsystem);

   return match != std::cend(global::subsystems);
}

void write_line(level ll, std::string const& msg)
{
   auto const line = fmt::format("{0}: {1}\n", to_string(ll), msg);

   std::lock_guard<std::mutex> lock {global::mutex};
   std::clog << line << std::flush;
}

}
}

