#include <atomic>
#include <thread>
#include <chrono>
#include <string>
#include <stdexcept>
#include <exception>
#include <stop_token>

#include "net.hpp"
#include "logger.hpp"
#include "listener.hpp"
#include "test_utils.hpp"
#include "supervisor.hpp"
#include "test_workers.hpp"

using namespace pico;
using namespace pico::test;

// Accepts and drops connections on a loopback port.
class upstream {
private:
   net::io_context ioc_ {1};
   tcp::acceptor acceptor_;
   std::atomic<int> accepted_ {0};
   std::thread thread_;

   void do_accept()
   {
      auto handler = [this](auto const& ec, auto socket)
      {
         if (ec)
            return;

         ++accepted_;
         do_accept();
      };

      acceptor_.async_accept(handler);
   }

public:
   upstream()
   : acceptor_ {ioc_, tcp::endpoint {ip::make_address("127.0.0.1"), 0}}
   {
      do_accept();
      thread_ = std::thread {[this]() { ioc_.run(); }};
   }

   ~upstream()
   {
      net::post(ioc_, [this]()
      {
         boost::system::error_code ec;
         acceptor_.close(ec);
      });

      thread_.join();
   }

   auto get_target() const
      { return "127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port()); }

   auto accepted() const noexcept { return accepted_.load(); }
};

// A loopback target nobody listens on.
std::string closed_target()
{
   net::io_context ioc;
   tcp::acceptor acc {ioc, tcp::endpoint {ip::make_address("127.0.0.1"), 0}};
   auto const port = acc.local_endpoint().port();
   acc.close();
   return "127.0.0.1:" + std::to_string(port);
}

config::listener make_cfg(int max_failures)
{
   config::listener cfg;
   cfg.retry_interval = std::chrono::milliseconds {10};
   cfg.connect_timeout = std::chrono::milliseconds {500};
   cfg.max_failures = max_failures;
   return cfg;
}

// Runs the listener on its own thread.
class runner {
private:
   std::stop_source stop_;
   std::exception_ptr error_;
   std::atomic<bool> done_ {false};
   std::thread thread_;

public:
   explicit runner(listener& l)
   : thread_ {[this, &l, token = stop_.get_token()]()
      {
         try {
            l.run(token);
         } catch (...) {
            error_ = std::current_exception();
         }
         done_ = true;
      }}
   { }

   ~runner()
   {
      if (thread_.joinable())
         thread_.join();
   }

   void stop() { stop_.request_stop(); }
   auto done() const noexcept { return done_.load(); }

   auto join()
   {
      thread_.join();
      return error_;
   }
};

template <class Pred>
bool wait_until(Pred pred, std::chrono::milliseconds max = std::chrono::seconds {3})
{
   timer tm;
   while (!pred()) {
      if (tm.elapsed() > max)
         return false;

      std::this_thread::sleep_for(5ms);
   }

   return true;
}

void reachable_tests()
{
   upstream up;
   listener l {{"a", up.get_target()}, make_cfg(1)};
   runner r {l};

   auto const probed = wait_until([&]() { return up.accepted() >= 2; });
   assert_true(probed, "reachable: upstream probed repeatedly");
   assert_true(!r.done(), "reachable: still running");

   r.stop();
   auto const stopped = wait_until([&]() { return r.done(); }, 1000ms);
   assert_true(stopped, "reachable: stops on cancellation");

   auto const error = r.join();
   assert_true(!error, "reachable: clean return");
}

void unreachable_tests()
{
   {  // Gives up after max_failures consecutive attempts.
      listener l {{"b", closed_target()}, make_cfg(3)};

      std::string what;
      try {
         l.run(std::stop_source {}.get_token());
      } catch (std::runtime_error const& e) {
         what = e.what();
      }

      auto const found = what.find("unreachable after 3 attempts") != std::string::npos;
      assert_true(found, "unreachable: fails after max failures");
   }

   {  // Keeps retrying when max_failures is zero.
      listener l {{"b", closed_target()}, make_cfg(0)};
      runner r {l};

      std::this_thread::sleep_for(100ms);
      assert_true(!r.done(), "unreachable: retries forever");

      r.stop();
      auto const stopped = wait_until([&]() { return r.done(); }, 1000ms);
      assert_true(stopped, "unreachable: stops on cancellation");
      assert_true(!r.join(), "unreachable: clean return");
   }
}

void cancelled_before_run_tests()
{
   upstream up;
   listener l {{"a", up.get_target()}, make_cfg(1)};

   std::stop_source stop;
   stop.request_stop();

   timer tm;
   l.run(stop.get_token());
   assert_true(tm.elapsed() < 1000ms, "cancelled_before_run: returns at once");
}

void invalid_target_tests()
{
   assert_throw<std::invalid_argument>([]()
      { listener l({"a", "localhost"}, make_cfg(0)); }, "invalid_target: no port");

   assert_throw<std::invalid_argument>([]()
      { listener l({"a", "localhost:"}, make_cfg(0)); }, "invalid_target: empty port");

   assert_throw<std::invalid_argument>([]()
      { listener l({"a", ":3000"}, make_cfg(0)); }, "invalid_target: empty host");
}

void supervised_tests()
{
   // A listener that gives up brings the healthy one down.
   upstream up;
   manual_signal_source sigs;

   std::vector<worker_spec> const specs
   { {"healthy", up.get_target()}
   , {"broken", closed_target()}
   };

   auto const factory = [](worker_spec const& spec)
      { return std::make_unique<listener>(spec, make_cfg(2)); };

   supervisor sup;
   auto const res = sup.supervise(specs, factory, sigs);

   assert_true(res.failed(), "supervised: failed");
   assert_equal(res.worker_id, std::string {"broken"}, "supervised: broken one reported");
   assert_true(!res.signal, "supervised: no signal");
}

int main()
{
   log::upto(log::level::emerg);

   reachable_tests();
   unreachable_tests();
   cancelled_before_run_tests();
   invalid_target_tests();
   supervised_tests();

   return report();
}

