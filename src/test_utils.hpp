#pragma once

#include <string>
#include <chrono>
#include <sstream>
#include <iostream>

#include "logger.hpp"

namespace pico { namespace test {

namespace global {inline int failures = 0;}

inline
void assert_true(bool b, std::string const& msg = "assert_true")
{
   if (b) {
     std::cout << "Success: " << msg << std::endl;
   } else {
     std::cout << "Error: " << msg << std::endl;
     ++global::failures;
   }
}

template <class T, class U>
void assert_equal(T const& a, U const& b, std::string const& msg = "assert_equal")
{
   if (a == b) {
     std::cout << "Success: " << msg << std::endl;
   } else {
     std::cout << "Error: " << msg << std::endl;
     ++global::failures;
   }
}

// Calls f and expects it to throw E.
template <class E, class F>
void assert_throw(F f, std::string const& msg = "assert_throw")
{
   try {
      f();
   } catch (E const&) {
      std::cout << "Success: " << msg << std::endl;
      return;
   } catch (std::exception const& e) {
      std::cout << "Error: " << msg << ": " << e.what() << std::endl;
      ++global::failures;
      return;
   }

   std::cout << "Error: " << msg << ": nothing thrown" << std::endl;
   ++global::failures;
}

// The exit status of a test program.
inline
int report()
{
   if (global::failures == 0) {
      std::cout << "All tests passed." << std::endl;
      return 0;
   }

   std::cout << global::failures << " test(s) failed." << std::endl;
   return 1;
}

class timer {
private:
  std::chrono::steady_clock::time_point start_ = std::chrono::steady_clock::now();

public:
  void start()
  {
     start_ = std::chrono::steady_clock::now();
  }

  auto elapsed() const
  {
    auto const diff = std::chrono::steady_clock::now() - start_;
    return std::chrono::duration_cast<std::chrono::milliseconds>(diff);
  }
};

// Redirects std::clog and sets the log level while alive.
class log_capture {
private:
  std::ostringstream oss_;
  std::streambuf* old_buf_;
  log::level old_filter_;

public:
  explicit log_capture(log::level ll)
  : old_buf_ {std::clog.rdbuf(oss_.rdbuf())}
  , old_filter_ {log::global::filter}
  {
     log::upto(ll);
  }

  ~log_capture()
  {
     log::upto(old_filter_);
     std::clog.rdbuf(old_buf_);
  }

  auto contains(std::string const& s) const
     { return oss_.str().find(s) != std::string::npos; }
};

} // test
} // pico

