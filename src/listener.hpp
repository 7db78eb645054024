#pragma once

#include <string>
#include <stop_token>

#include "net.hpp"
#include "config.hpp"
#include "worker.hpp"
#include "worker_spec.hpp"

namespace pico
{

// Runs the endpoint registered under spec.id and keeps track of the
// upstream it forwards to (spec.target, in the form host:port).
//
// The upstream is resolved and connected to periodically. Failures are
// retried until max_failures consecutive attempts failed, in which case
// run throws.
class listener : public worker {
private:
   worker_spec const spec_;
   config::listener const cfg_;

   net::io_context ioc_ {1};
   tcp::resolver resolver_;
   tcp::socket socket_;
   net::steady_timer deadline_;
   net::steady_timer retry_timer_;

   std::string host_;
   std::string port_;

   int failures_ = 0;
   bool reachable_ = false;
   bool timed_out_ = false;
   bool stopped_ = false;

   // Set when giving up, thrown from run.
   std::string fatal_;

   void do_resolve();
   void on_resolve( boost::system::error_code const& ec
                  , tcp::resolver::results_type results);
   void on_connect( boost::system::error_code ec
                  , tcp::endpoint const& endpoint);
   void on_connect_timeout(boost::system::error_code const& ec);
   void on_failure(boost::system::error_code const& ec);
   void wait_retry();
   void on_retry(boost::system::error_code const& ec);

   // Must be called from the io_context thread.
   void shutdown();

public:
   listener(worker_spec spec, config::listener const& cfg);

   std::string const& get_id() const noexcept override
      { return spec_.id; }

   auto const& get_spec() const noexcept { return spec_; }

   void run(std::stop_token token) override;
};

}

