#include "supervisor.hpp"

#include <mutex>
#include <thread>
#include <iterator>
#include <algorithm>
#include <stop_token>
#include <stdexcept>
#include <system_error>
#include <condition_variable>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "logger.hpp"

namespace pico
{

std::string outcome::what() const
{
   if (!error)
      return {};

   try {
      std::rethrow_exception(error);
   } catch (std::exception const& e) {
      return e.what();
   } catch (...) {
      return "unknown error";
   }
}

namespace
{

// Collects the results of the worker threads. Written concurrently by
// every worker and by the signal handler, read by the supervisor.
class run_state {
private:
   std::mutex mutex_;
   std::condition_variable cv_;

   std::vector<std::string> ids_;
   std::vector<bool> running_;
   int active_ = 0;

   // Set once, by the first signal or the first error.
   bool triggered_ = false;
   outcome outcome_;

public:
   explicit run_state(std::vector<std::string> ids)
   : ids_ {std::move(ids)}
   , running_(std::size(ids_), true)
   , active_ {static_cast<int>(std::size(ids_))}
   { }

   void on_signal(int n)
   {
      std::lock_guard<std::mutex> lock {mutex_};
      if (triggered_)
         return;

      triggered_ = true;
      outcome_.signal = n;
      cv_.notify_all();
   }

   void on_done(std::size_t i, std::exception_ptr error)
   {
      std::lock_guard<std::mutex> lock {mutex_};

      running_[i] = false;
      --active_;

      if (error && !outcome_.error) {
         outcome_.error = error;
         outcome_.worker_id = ids_[i];
         triggered_ = true;
      } else if (!error && !triggered_) {
         log::write( log::level::notice
                   , "Listener '{0}' stopped before shutdown was requested."
                   , ids_[i]);
      }

      cv_.notify_all();
   }

   // For workers that were never started.
   void on_skipped(std::size_t i)
   {
      std::lock_guard<std::mutex> lock {mutex_};
      running_[i] = false;
      --active_;
      cv_.notify_all();
   }

   // Blocks until a signal arrives or a worker fails.
   void wait_trigger()
   {
      std::unique_lock<std::mutex> lock {mutex_};
      cv_.wait(lock, [this]() { return triggered_; });
   }

   // Blocks until every worker has finished, reporting the workers that
   // are still running at the given rate.
   void wait_drained(std::chrono::milliseconds interval)
   {
      std::unique_lock<std::mutex> lock {mutex_};
      auto const pred = [this]() { return active_ == 0; };

      if (interval <= std::chrono::milliseconds::zero()) {
         cv_.wait(lock, pred);
         return;
      }

      while (!cv_.wait_for(lock, interval, pred)) {
         std::vector<std::string> pending;
         for (std::size_t i = 0; i < std::size(ids_); ++i) {
            if (running_[i])
               pending.push_back(ids_[i]);
         }

         log::write( log::level::warning
                   , "Waiting for {0} listener(s) to stop: {1}"
                   , active_
                   , fmt::format("{}", fmt::join(pending, ", ")));
      }
   }

   outcome get_outcome()
   {
      std::lock_guard<std::mutex> lock {mutex_};
      return outcome_;
   }
};

void run_worker(run_state& st, worker& w, std::stop_token token, std::size_t i)
{
   try {
      log::write( "supervisor", log::level::debug
                , "Starting listener '{0}'.", w.get_id());

      w.run(token);

      log::write( "supervisor", log::level::debug
                , "Listener '{0}' returned.", w.get_id());
   } catch (...) {
      // Reported in the outcome.
      st.on_done(i, std::current_exception());
      return;
   }

   st.on_done(i, nullptr);
}

} // anonymous

supervisor::supervisor(config::supervisor const& cfg)
: cfg_ {cfg}
{ }

outcome
supervisor::supervise( std::vector<worker_spec> const& specs
                     , factory_type const& factory
                     , signal_source& signals) const
{
   std::vector<std::unique_ptr<worker>> workers;
   std::vector<std::string> ids;

   // All workers are built before any of them is started, a failure
   // here leaves nothing to clean up.
   try {
      for (auto const& spec : specs) {
         auto w = factory(spec);
         if (!w) {
            throw std::runtime_error
               {"no worker could be created for '" + spec.id + "'"};
         }

         workers.push_back(std::move(w));
         ids.push_back(spec.id);
      }
   } catch (...) {
      outcome ret;
      ret.error = std::current_exception();
      ret.worker_id = std::size(ids) < std::size(specs)
                    ? specs[std::size(ids)].id
                    : std::string {};

      log::write( log::level::err
                , "Unable to create listener '{0}': {1}"
                , ret.worker_id
                , ret.what());
      return ret;
   }

   run_state st {ids};
   std::stop_source stop;
   std::vector<std::thread> threads;

   {
      auto const on_signal = [&st](int n)
         { st.on_signal(n); };

      signal_subscription sub {signals, on_signal};

      for (std::size_t i = 0; i < std::size(workers); ++i) {
         auto& w = *workers[i];
         auto const token = stop.get_token();

         try {
            threads.emplace_back([&st, &w, token, i]()
               { run_worker(st, w, token, i); });
         } catch (std::system_error const& e) {
            log::write( log::level::err
                      , "Unable to start listener '{0}': {1}"
                      , w.get_id()
                      , e.what());

            // The failed one carries the error, the remaining ones
            // never ran.
            st.on_done(i, std::current_exception());
            for (auto j = i + 1; j < std::size(workers); ++j)
               st.on_skipped(j);

            break;
         }
      }

      log::write( "supervisor", log::level::debug
                , "{0} listener(s) started.", std::size(threads));

      st.wait_trigger();

      auto const res = st.get_outcome();
      if (res.signal) {
         log::write( log::level::notice
                   , "Received shutdown signal {0}."
                   , signal_name(*res.signal));
      } else {
         log::write( log::level::err
                   , "Listener '{0}' failed: {1}"
                   , res.worker_id
                   , res.what());
      }

      log::write(log::level::info, "Stopping all listeners.");
      stop.request_stop();

      st.wait_drained(cfg_.drain_warn_interval);

      for (auto& t : threads)
         t.join();
   }

   log::write( "supervisor", log::level::debug
             , "All listeners stopped.");

   return st.get_outcome();
}

}

