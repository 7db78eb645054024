#pragma once

#include <string>
#include <stop_token>

namespace pico {

// A unit of work run on its own thread by the supervisor.
//
// run must return in bounded time once the token is stopped. Returning
// normally means the worker stopped cleanly, whether by choice or
// because it was asked to. Throwing signals an unrecoverable failure,
// which brings the whole process down.
class worker {
public:
   virtual ~worker() = default;

   virtual std::string const& get_id() const noexcept = 0;
   virtual void run(std::stop_token token) = 0;
};

} // pico

