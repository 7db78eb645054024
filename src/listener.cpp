#include "listener.hpp"

#include <stdexcept>

#include <fmt/format.h>

#include "logger.hpp"

namespace pico
{

listener::listener(worker_spec spec, config::listener const& cfg)
: spec_ {std::move(spec)}
, cfg_ {cfg}
, resolver_ {ioc_}
, socket_ {ioc_}
, deadline_ {ioc_}
, retry_timer_ {ioc_}
{
   auto const addr = split_host_port(spec_.target);
   if (std::empty(addr.first)) {
      throw std::invalid_argument
         {"invalid forward address '" + spec_.target + "': must be in "
          "format '<host>:<port>'"};
   }

   host_ = addr.first;
   port_ = addr.second;
}

void listener::run(std::stop_token token)
{
   log::write( log::level::info
             , "Listener '{0}' forwarding to {1}."
             , spec_.id
             , spec_.target);

   // If the stop has already been requested the shutdown is posted
   // before the resolve below, and nothing gets started.
   std::stop_callback cb {token, [this]()
      { net::post(ioc_, [this]() { shutdown(); }); }};

   net::post(ioc_, [this]() { do_resolve(); });

   ioc_.run();

   if (!std::empty(fatal_))
      throw std::runtime_error {fatal_};

   log::write( log::level::info
             , "Listener '{0}' stopped."
             , spec_.id);
}

void listener::do_resolve()
{
   if (stopped_)
      return;

   auto handler = [this](auto const& ec, auto results)
      { on_resolve(ec, results); };

   resolver_.async_resolve(host_, port_, handler);
}

void listener::on_resolve( boost::system::error_code const& ec
                         , tcp::resolver::results_type results)
{
   if (stopped_)
      return;

   if (ec) {
      if (ec == net::error::operation_aborted)
         return;

      on_failure(ec);
      return;
   }

   timed_out_ = false;
   deadline_.expires_after(cfg_.connect_timeout);

   auto timeout_handler = [this](auto const& e)
      { on_connect_timeout(e); };

   deadline_.async_wait(timeout_handler);

   auto handler = [this]( boost::system::error_code ec
                        , tcp::endpoint const& endpoint)
      { on_connect(ec, endpoint); };

   net::async_connect(socket_, results, handler);
}

void listener::on_connect_timeout(boost::system::error_code const& ec)
{
   if (ec || stopped_)
      return;

   // Closing the socket aborts the pending connect.
   timed_out_ = true;
   boost::system::error_code ignore;
   socket_.close(ignore);
}

void listener::on_connect( boost::system::error_code ec
                         , tcp::endpoint const& endpoint)
{
   deadline_.cancel();

   if (stopped_)
      return;

   if (ec) {
      if (ec == net::error::operation_aborted && !timed_out_)
         return;

      if (timed_out_)
         ec = net::error::timed_out;

      on_failure(ec);
      return;
   }

   failures_ = 0;

   log::write( "listener", log::level::debug
             , "{0}: connected to {1}."
             , spec_.id
             , to_string(endpoint));

   if (!reachable_) {
      log::write( log::level::notice
                , "Listener '{0}': upstream {1} is reachable."
                , spec_.id
                , spec_.target);
      reachable_ = true;
   }

   boost::system::error_code ignore;
   socket_.shutdown(tcp::socket::shutdown_both, ignore);
   socket_.close(ignore);

   wait_retry();
}

void listener::on_failure(boost::system::error_code const& ec)
{
   ++failures_;

   log::write( "listener", log::level::debug
             , "{0}: attempt {1} failed: {2}."
             , spec_.id
             , failures_
             , ec.message());

   if (reachable_ || failures_ == 1) {
      log::write( log::level::warning
                , "Listener '{0}': upstream {1} is unreachable: {2}."
                , spec_.id
                , spec_.target
                , ec.message());
   }

   reachable_ = false;

   boost::system::error_code ignore;
   socket_.close(ignore);

   if (cfg_.max_failures > 0 && failures_ >= cfg_.max_failures) {
      fatal_ = fmt::format( "upstream {0} unreachable after {1} attempts: {2}"
                          , spec_.target
                          , failures_
                          , ec.message());
      shutdown();
      return;
   }

   wait_retry();
}

void listener::wait_retry()
{
   retry_timer_.expires_after(cfg_.retry_interval);

   auto handler = [this](auto const& ec)
      { on_retry(ec); };

   retry_timer_.async_wait(handler);
}

void listener::on_retry(boost::system::error_code const& ec)
{
   if (ec) {
      if (ec == net::error::operation_aborted)
         return;

      log::write( log::level::warning
                , "Listener '{0}': unhandled timer error '{1}'."
                , spec_.id
                , ec.message());
   }

   do_resolve();
}

void listener::shutdown()
{
   if (stopped_)
      return;

   stopped_ = true;

   log::write( "listener", log::level::debug
             , "{0}: shutting down.", spec_.id);

   resolver_.cancel();
   deadline_.cancel();
   retry_timer_.cancel();

   boost::system::error_code ec;
   socket_.close(ec);
   if (ec) {
      log::write( log::level::info
                , "Listener '{0}': close: {1}."
                , spec_.id
                , ec.message());
   }
}

}

