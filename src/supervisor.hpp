#pragma once

#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <exception>
#include <functional>

#include "config.hpp"
#include "worker.hpp"
#include "worker_spec.hpp"
#include "signal_source.hpp"

namespace pico
{

// The result of a supervised run.
struct outcome {
   // The first error observed, null on a clean shutdown.
   std::exception_ptr error;

   // The worker that raised the error above.
   std::string worker_id;

   // The signal that triggered the shutdown, if any.
   std::optional<int> signal;

   auto failed() const noexcept { return error != nullptr; }
   auto exit_status() const noexcept { return failed() ? 1 : 0; }

   // The message of the error or an empty string.
   std::string what() const;
};

// Runs one thread per worker until either a worker fails or a
// termination signal arrives, then asks every worker to stop and waits
// for all of them.
class supervisor {
public:
   using factory_type =
      std::function<std::unique_ptr<worker>(worker_spec const&)>;

private:
   config::supervisor cfg_;

public:
   explicit supervisor(config::supervisor const& cfg = {});

   // Failures of the factory or of the workers are reported in the
   // outcome, not thrown. Returns only after every started worker has
   // returned.
   outcome supervise( std::vector<worker_spec> const& specs
                    , factory_type const& factory
                    , signal_source& signals) const;
};

}

