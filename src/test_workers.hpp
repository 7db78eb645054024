#pragma once

#include <map>
#include <set>
#include <mutex>
#include <chrono>
#include <string>
#include <memory>
#include <thread>
#include <vector>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <condition_variable>

#include "worker.hpp"
#include "supervisor.hpp"
#include "worker_spec.hpp"
#include "signal_source.hpp"

namespace pico { namespace test {

using namespace std::chrono_literals;

// Signal source controlled by the test. Follows the same delivery
// rules as os_signal_source.
class manual_signal_source : public signal_source {
private:
   std::mutex mutex_;
   handler_type handler_;
   std::optional<int> pending_;
   bool delivered_ = false;
   int ignored_ = 0;

public:
   void raise(int n)
   {
      std::lock_guard<std::mutex> lock {mutex_};
      if (delivered_ || pending_) {
         ++ignored_;
      } else if (handler_) {
         delivered_ = true;
         handler_(n);
      } else {
         pending_ = n;
      }
   }

   void subscribe(handler_type handler) override
   {
      std::lock_guard<std::mutex> lock {mutex_};
      handler_ = std::move(handler);
      if (pending_ && !delivered_) {
         delivered_ = true;
         handler_(*pending_);
      }
   }

   void unsubscribe() override
   {
      std::lock_guard<std::mutex> lock {mutex_};
      handler_ = nullptr;
   }

   auto ignored()
   {
      std::lock_guard<std::mutex> lock {mutex_};
      return ignored_;
   }
};

// Records what the scripted workers did.
class probe {
public:
   using clock_type = std::chrono::steady_clock;

private:
   mutable std::mutex mutex_;
   std::map<std::string, clock_type::time_point> started_;
   std::map<std::string, clock_type::time_point> stopped_;
   std::set<std::string> cancelled_;

public:
   void on_start(std::string const& id)
   {
      std::lock_guard<std::mutex> lock {mutex_};
      started_[id] = clock_type::now();
   }

   void on_cancel(std::string const& id)
   {
      std::lock_guard<std::mutex> lock {mutex_};
      cancelled_.insert(id);
   }

   void on_stop(std::string const& id)
   {
      std::lock_guard<std::mutex> lock {mutex_};
      stopped_[id] = clock_type::now();
   }

   auto started() const
   {
      std::lock_guard<std::mutex> lock {mutex_};
      return std::size(started_);
   }

   auto stopped() const
   {
      std::lock_guard<std::mutex> lock {mutex_};
      return std::size(stopped_);
   }

   bool was_started(std::string const& id) const
   {
      std::lock_guard<std::mutex> lock {mutex_};
      return started_.count(id) == 1;
   }

   bool was_stopped(std::string const& id) const
   {
      std::lock_guard<std::mutex> lock {mutex_};
      return stopped_.count(id) == 1;
   }

   bool was_cancelled(std::string const& id) const
   {
      std::lock_guard<std::mutex> lock {mutex_};
      return cancelled_.count(id) == 1;
   }

   std::optional<clock_type::time_point> stop_time(std::string const& id) const
   {
      std::lock_guard<std::mutex> lock {mutex_};
      auto const match = stopped_.find(id);
      if (match == std::cend(stopped_))
         return {};

      return match->second;
   }
};

// What a scripted worker does.
struct script {
   // Throws after this time, unless cancelled first.
   std::optional<std::chrono::milliseconds> fail_after;

   // Returns cleanly after this time, unless cancelled first.
   std::optional<std::chrono::milliseconds> finish_after;

   // Time taken to return once the cancellation has been observed.
   std::chrono::milliseconds drain {0};

   std::string error {"connection refused"};

   // Throws something not derived from std::exception.
   bool throw_int = false;

   // Throws after the drain instead of returning.
   bool fail_on_cancel = false;
};

class scripted_worker : public worker {
private:
   std::string id_;
   script script_;
   probe& probe_;

   std::mutex mutex_;
   std::condition_variable_any cv_;

   struct stop_guard {
      probe& p;
      std::string const& id;
      ~stop_guard() { p.on_stop(id); }
   };

   // Returns true if the token has been stopped.
   bool wait(std::stop_token const& token, std::optional<std::chrono::milliseconds> d)
   {
      std::unique_lock<std::mutex> lock {mutex_};
      auto const never = []() { return false; };

      if (d)
         cv_.wait_for(lock, token, *d, never);
      else
         cv_.wait(lock, token, never);

      return token.stop_requested();
   }

public:
   scripted_worker(std::string id, script s, probe& p)
   : id_ {std::move(id)}
   , script_ {std::move(s)}
   , probe_ {p}
   { }

   std::string const& get_id() const noexcept override
      { return id_; }

   void run(std::stop_token token) override
   {
      probe_.on_start(id_);
      stop_guard guard {probe_, id_};

      auto const d = script_.fail_after ? script_.fail_after
                                        : script_.finish_after;

      if (!wait(token, d)) {
         if (script_.finish_after)
            return;

         if (script_.throw_int)
            throw 42;

         throw std::runtime_error {script_.error};
      }

      probe_.on_cancel(id_);
      std::this_thread::sleep_for(script_.drain);

      if (script_.fail_on_cancel)
         throw std::runtime_error {script_.error};
   }
};

// Builds a scripted worker per spec. Specs without a script block until
// cancelled.
inline
supervisor::factory_type
make_factory(std::map<std::string, script> scripts, probe& p)
{
   return [scripts, &p](worker_spec const& spec)
   {
      auto const match = scripts.find(spec.id);
      auto const s = match == std::cend(scripts) ? script {} : match->second;
      return std::make_unique<scripted_worker>(spec.id, s, p);
   };
}

inline
std::vector<worker_spec> make_specs(int n)
{
   std::vector<worker_spec> ret;
   for (auto i = 0; i < n; ++i) {
      ret.push_back({ "w" + std::to_string(i)
                    , "localhost:" + std::to_string(3000 + i)});
   }

   return ret;
}

} // test
} // pico

