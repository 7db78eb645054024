#include "signal_source.hpp"

#include <csignal>

#include <fmt/format.h>

#include "logger.hpp"

namespace pico
{

std::string signal_name(int n)
{
   switch (n) {
      case SIGINT:  return "SIGINT";
      case SIGTERM: return "SIGTERM";
      case SIGHUP:  return "SIGHUP";
      case SIGQUIT: return "SIGQUIT";
      default:      return fmt::format("signal {0}", n);
   }
}

os_signal_source::os_signal_source()
: signals_ {ioc_, SIGINT, SIGTERM}
{
   do_wait();

   auto const handler = [this]()
   {
      try {
         ioc_.run();
      } catch (std::exception const& e) {
         log::write( log::level::crit
                   , "os_signal_source: Unhandled exception '{0}'"
                   , e.what());
      }
   };

   thread_ = std::thread {handler};
}

os_signal_source::~os_signal_source()
{
   ioc_.stop();
   thread_.join();
}

void os_signal_source::do_wait()
{
   auto const handler = [this](auto const& ec, auto n)
      { on_signal(ec, n); };

   signals_.async_wait(handler);
}

void os_signal_source::on_signal(boost::system::error_code const& ec, int n)
{
   if (ec) {
      if (ec == net::error::operation_aborted)
         return;

      log::write( log::level::crit
                , "os_signal_source::on_signal: Unhandled error '{0}'"
                , ec.message());
      return;
   }

   log::write( "signal", log::level::debug
             , "Signal {0} captured.", signal_name(n));

   {
      std::lock_guard<std::mutex> lock {mutex_};
      if (delivered_ || pending_) {
         log::write( log::level::notice
                   , "Signal {0} ignored, already shutting down."
                   , signal_name(n));
      } else if (handler_) {
         delivered_ = true;
         handler_(n);
      } else {
         pending_ = n;
      }
   }

   // Keeps listening so that repeated signals are logged instead of
   // queued.
   do_wait();
}

void os_signal_source::subscribe(handler_type handler)
{
   std::lock_guard<std::mutex> lock {mutex_};
   handler_ = std::move(handler);

   if (pending_ && !delivered_) {
      delivered_ = true;
      handler_(*pending_);
   }
}

void os_signal_source::unsubscribe()
{
   std::lock_guard<std::mutex> lock {mutex_};
   handler_ = nullptr;
}

}

