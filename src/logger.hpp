#pragma once

#include <string>
#include <vector>
#include <stdexcept>
#include <string_view>

#include <fmt/format.h>

namespace pico { namespace log {

enum class level
{ emerg
, alert
, crit
, err
, warning
, notice
, info
, debug
};

// Throws std::invalid_argument on unknown level names.
template <class T>
T to_level(std::string const& ll)
{
   if (ll == "emerg")   return T::emerg;
   if (ll == "alert")   return T::alert;
   if (ll == "crit")    return T::crit;
   if (ll == "err")     return T::err;
   if (ll == "warning") return T::warning;
   if (ll == "notice")  return T::notice;
   if (ll == "info")    return T::info;
   if (ll == "debug")   return T::debug;

   throw std::invalid_argument {"unknown log level '" + ll + "'"};
}

char const* to_string(level ll) noexcept;

void upto(level ll);

// Debug messages written with a subsystem name are output when the
// subsystem is in this list, regardless of the global filter.
void enable_subsystems(std::vector<std::string> const& subsystems);
bool is_enabled(std::string_view subsystem);

namespace global {extern level filter;}

inline
auto ignore(level ll)
{
   return ll > global::filter;
}

// Writes a complete line. Safe to call from multiple threads.
void write_line(level ll, std::string const& msg);

template <class... Args>
void write(level ll, char const* fmt, Args const& ... args)
{
   if (ignore(ll))
      return;

   write_line(ll, fmt::vformat(fmt, fmt::make_format_args(args...)));
}

template <class... Args>
void write( char const* subsystem
          , level ll
          , char const* fmt
          , Args const& ... args)
{
   auto const pass = !ignore(ll) ||
      (ll == level::debug && is_enabled(subsystem));

   if (!pass)
      return;

   write_line(ll, fmt::format( "[{0}] {1}"
                             , subsystem
                             , fmt::vformat(fmt, fmt::make_format_args(args...))));
}

}
}

