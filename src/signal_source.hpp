#pragma once

#include <mutex>
#include <thread>
#include <string>
#include <optional>
#include <functional>

#include "net.hpp"

namespace pico
{

// Source of termination requests.
//
// Implementations deliver at most one notification per source. A
// notification that arrives before subscribe is kept and delivered on
// subscription. After unsubscribe returns the handler is not running
// and won't be called anymore.
//
// The handler is called with internal locks held and must not call
// back into the source.
class signal_source {
public:
   using handler_type = std::function<void(int)>;

   virtual ~signal_source() = default;
   virtual void subscribe(handler_type handler) = 0;
   virtual void unsubscribe() = 0;
};

// Subscription guard.
class signal_subscription {
private:
   signal_source& source_;

public:
   signal_subscription(signal_source& source, signal_source::handler_type h)
   : source_ {source}
   { source_.subscribe(std::move(h)); }

   signal_subscription(signal_subscription const&) = delete;
   signal_subscription& operator=(signal_subscription const&) = delete;

   ~signal_subscription() { source_.unsubscribe(); }
};

// Listens for SIGINT and SIGTERM. The signals are registered in the
// constructor, so it should be created before any worker is started.
class os_signal_source : public signal_source {
private:
   net::io_context ioc_ {1};
   net::signal_set signals_;

   std::mutex mutex_;
   handler_type handler_;
   std::optional<int> pending_;
   bool delivered_ = false;

   std::thread thread_;

   void do_wait();
   void on_signal(boost::system::error_code const& ec, int n);

public:
   os_signal_source();
   ~os_signal_source();

   os_signal_source(os_signal_source const&) = delete;
   os_signal_source& operator=(os_signal_source const&) = delete;

   void subscribe(handler_type handler) override;
   void unsubscribe() override;
};

std::string signal_name(int n);

}

