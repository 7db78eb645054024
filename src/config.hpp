#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace pico { namespace config {

struct listener {
   // Time between two attempts to reach the upstream service.
   std::chrono::milliseconds retry_interval {1000};

   // Time we are willing to wait for a single connection attempt to
   // the upstream to complete.
   std::chrono::milliseconds connect_timeout {2000};

   // Number of consecutive failed attempts after which the listener
   // gives up and fails. Zero means it keeps retrying forever.
   int max_failures = 0;
};

struct supervisor {
   // While draining, the workers that did not finish yet are logged
   // at this rate.
   std::chrono::milliseconds drain_warn_interval {5000};
};

struct log {
   std::string level {"notice"};

   // Subsystems whose debug messages should be output regardless of
   // the log level.
   std::vector<std::string> subsystems;
};

} // config
} // pico

