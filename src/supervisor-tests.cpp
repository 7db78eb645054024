#include <future>
#include <thread>
#include <chrono>
#include <csignal>
#include <iostream>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>

#include "logger.hpp"
#include "test_utils.hpp"
#include "supervisor.hpp"
#include "test_workers.hpp"
#include "signal_source.hpp"

using namespace pico;
using namespace pico::test;

namespace po = boost::program_options;

// Raises n on the source after d, from another thread.
auto raise_after(manual_signal_source& sigs, std::chrono::milliseconds d, int n = SIGTERM)
{
   return std::thread {[&sigs, d, n]()
   {
      std::this_thread::sleep_for(d);
      sigs.raise(n);
   }};
}

void empty_set_tests()
{
   {  // Signal delivered while waiting.
      probe p;
      manual_signal_source sigs;
      auto t = raise_after(sigs, 5ms);

      supervisor sup;
      auto const res = sup.supervise({}, make_factory({}, p), sigs);
      t.join();

      assert_true(!res.failed(), "empty_set: clean");
      assert_equal(res.exit_status(), 0, "empty_set: exit status");
      assert_true(res.signal == SIGTERM, "empty_set: signal recorded");
      assert_equal(p.started(), 0u, "empty_set: nothing started");
   }

   {  // Signal delivered before supervise subscribed.
      probe p;
      manual_signal_source sigs;
      sigs.raise(SIGINT);

      supervisor sup;
      auto const res = sup.supervise({}, make_factory({}, p), sigs);

      assert_true(!res.failed(), "empty_set: early signal clean");
      assert_true(res.signal == SIGINT, "empty_set: early signal kept");
   }
}

void all_awaited_tests()
{
   for (auto n = 0; n <= 6; ++n) {
      probe p;
      manual_signal_source sigs;
      auto const specs = make_specs(n);

      // Slow drains make a premature return visible.
      std::map<std::string, script> scripts;
      for (auto const& spec : specs)
         scripts[spec.id].drain = 5ms;

      auto t = raise_after(sigs, 20ms);

      supervisor sup;
      auto const res = sup.supervise(specs, make_factory(scripts, p), sigs);

      auto const name = "all_awaited (" + std::to_string(n) + ")";
      assert_true(!res.failed(), name + ": clean");
      assert_equal(p.started(), std::size(specs), name + ": all started");
      assert_equal(p.stopped(), std::size(specs), name + ": all stopped");

      auto cancelled = true;
      for (auto const& spec : specs)
         cancelled = cancelled && p.was_cancelled(spec.id);

      assert_true(cancelled, name + ": all cancelled");
      t.join();
   }
}

void one_failure_tests()
{
   probe p;
   manual_signal_source sigs;
   auto const specs = make_specs(5);

   std::map<std::string, script> scripts;
   scripts["w2"].fail_after = 10ms;
   scripts["w2"].error = "w2 is broken";

   supervisor sup;
   auto const res = sup.supervise(specs, make_factory(scripts, p), sigs);

   assert_true(res.failed(), "one_failure: failed");
   assert_equal(res.exit_status(), 1, "one_failure: exit status");
   assert_equal(res.what(), std::string {"w2 is broken"}, "one_failure: error");
   assert_equal(res.worker_id, std::string {"w2"}, "one_failure: worker id");
   assert_true(!res.signal, "one_failure: no signal");
   assert_equal(p.stopped(), std::size(specs), "one_failure: all stopped");
   assert_true(!p.was_cancelled("w2"), "one_failure: failed one not cancelled");

   auto others = true;
   for (auto const& spec : specs) {
      if (spec.id != "w2")
         others = others && p.was_cancelled(spec.id);
   }

   assert_true(others, "one_failure: the others unblocked");
}

void failing_during_drain_tests()
{
   // An error raised while draining still makes the run fail.
   probe p;
   manual_signal_source sigs;
   auto const specs = make_specs(2);

   std::map<std::string, script> scripts;
   scripts["w1"].fail_on_cancel = true;
   scripts["w1"].error = "unclean shutdown";

   auto t = raise_after(sigs, 5ms);

   supervisor sup;
   auto const res = sup.supervise(specs, make_factory(scripts, p), sigs);
   t.join();

   assert_true(res.failed(), "failing_during_drain: failed");
   assert_equal(res.what(), std::string {"unclean shutdown"}, "failing_during_drain: error");
   assert_true(res.signal == SIGTERM, "failing_during_drain: triggered by the signal");
   assert_equal(p.stopped(), std::size(specs), "failing_during_drain: all stopped");
}

void idempotence_tests()
{
   probe p;
   manual_signal_source sigs;
   auto const specs = make_specs(3);

   std::map<std::string, script> scripts;
   scripts["w0"].fail_after = 10ms;
   scripts["w1"].drain = 60ms;

   // Both arrive while w1 is still draining.
   auto t1 = raise_after(sigs, 30ms, SIGINT);
   auto t2 = raise_after(sigs, 40ms, SIGTERM);

   supervisor sup;
   auto const res = sup.supervise(specs, make_factory(scripts, p), sigs);
   t1.join();
   t2.join();

   assert_true(res.failed(), "idempotence: still failed");
   assert_equal(res.what(), std::string {"connection refused"}, "idempotence: first error kept");
   assert_equal(res.worker_id, std::string {"w0"}, "idempotence: worker id kept");
   assert_true(!res.signal, "idempotence: late signal not recorded");
   assert_equal(sigs.ignored(), 1, "idempotence: second signal ignored");

   // After the run the source is unsubscribed, raising is harmless.
   sigs.raise(SIGTERM);
   assert_equal(sigs.ignored(), 2, "idempotence: raise after run");
}

void multiple_failures_tests()
{
   probe p;
   manual_signal_source sigs;
   auto const specs = make_specs(4);

   std::map<std::string, script> scripts;
   scripts["w0"].fail_after = 10ms;
   scripts["w0"].error = "w0 failed";
   scripts["w3"].fail_after = 10ms;
   scripts["w3"].error = "w3 failed";

   supervisor sup;
   auto const res = sup.supervise(specs, make_factory(scripts, p), sigs);

   auto const what = res.what();
   auto const one_of = what == "w0 failed" || what == "w3 failed";
   assert_true(res.failed(), "multiple_failures: failed");
   assert_true(one_of, "multiple_failures: one representative error");
   assert_true(what == res.worker_id + " failed", "multiple_failures: consistent id");
   assert_equal(p.stopped(), std::size(specs), "multiple_failures: all stopped");
}

void early_clean_return_tests()
{
   // A worker that returns cleanly does not stop the others.
   probe p;
   manual_signal_source sigs;
   auto const specs = make_specs(2);

   std::map<std::string, script> scripts;
   scripts["w0"].finish_after = 5ms;

   timer tm;
   auto t = raise_after(sigs, 50ms);

   log_capture cap {log::level::notice};
   supervisor sup;
   auto const res = sup.supervise(specs, make_factory(scripts, p), sigs);
   t.join();

   assert_true(!res.failed(), "early_clean_return: clean");
   assert_true( cap.contains("Listener 'w0' stopped before shutdown was requested.")
              , "early_clean_return: w0 reported");
   assert_true( !cap.contains("Listener 'w1' stopped before shutdown was requested.")
              , "early_clean_return: w1 not reported");
   assert_true(tm.elapsed() >= 50ms, "early_clean_return: waited for the signal");
   assert_true(!p.was_cancelled("w0"), "early_clean_return: w0 returned by itself");
   assert_true(p.was_cancelled("w1"), "early_clean_return: w1 cancelled by the signal");
}

void failure_scenario_tests()
{
   // a drains in 50ms once cancelled, b fails at 10ms.
   probe p;
   manual_signal_source sigs;
   std::vector<worker_spec> const specs
   { {"a", "localhost:3000"}
   , {"b", "localhost:4000"}
   };

   std::map<std::string, script> scripts;
   scripts["a"].drain = 50ms;
   scripts["b"].fail_after = 10ms;

   timer tm;
   supervisor sup;
   auto const res = sup.supervise(specs, make_factory(scripts, p), sigs);
   auto const elapsed = tm.elapsed();

   assert_true(res.failed(), "failure_scenario: failed");
   assert_equal(res.what(), std::string {"connection refused"}, "failure_scenario: error");
   assert_equal(res.worker_id, std::string {"b"}, "failure_scenario: worker id");
   assert_true(p.was_cancelled("a"), "failure_scenario: a cancelled");
   assert_true(elapsed >= 60ms, "failure_scenario: a awaited");

   auto const a_stop = p.stop_time("a");
   auto const b_stop = p.stop_time("b");
   auto const ordered = a_stop && b_stop && (*a_stop - *b_stop) >= 50ms;
   assert_true(ordered, "failure_scenario: a exits after its drain");
}

void clean_scenario_tests()
{
   // Signal at 5ms, a exits 10ms after observing the cancellation.
   probe p;
   manual_signal_source sigs;
   std::vector<worker_spec> const specs {{"a", "localhost:3000"}};

   std::map<std::string, script> scripts;
   scripts["a"].drain = 10ms;

   timer tm;
   auto t = raise_after(sigs, 5ms);

   supervisor sup;
   auto const res = sup.supervise(specs, make_factory(scripts, p), sigs);
   auto const elapsed = tm.elapsed();
   t.join();

   assert_true(!res.failed(), "clean_scenario: clean");
   assert_true(res.signal == SIGTERM, "clean_scenario: signal");
   assert_true(p.was_stopped("a"), "clean_scenario: a stopped");
   assert_true(elapsed >= 15ms, "clean_scenario: not earlier than a");
}

void factory_tests()
{
   {  // Throwing factory, nothing is started.
      probe p;
      manual_signal_source sigs;
      auto const specs = make_specs(3);
      auto inner = make_factory({}, p);

      auto const factory = [&inner](worker_spec const& spec)
         -> std::unique_ptr<worker>
      {
         if (spec.id == "w1")
            throw std::invalid_argument {"bad target"};

         return inner(spec);
      };

      supervisor sup;
      auto const res = sup.supervise(specs, factory, sigs);

      assert_true(res.failed(), "factory: throwing factory fails");
      assert_equal(res.what(), std::string {"bad target"}, "factory: error");
      assert_equal(res.worker_id, std::string {"w1"}, "factory: worker id");
      assert_equal(p.started(), 0u, "factory: nothing started");
   }

   {  // Null worker.
      manual_signal_source sigs;
      auto const factory = [](worker_spec const&)
         { return std::unique_ptr<worker> {}; };

      supervisor sup;
      auto const res = sup.supervise(make_specs(1), factory, sigs);
      assert_true(res.failed(), "factory: null worker fails");
   }
}

void non_std_exception_tests()
{
   probe p;
   manual_signal_source sigs;

   std::map<std::string, script> scripts;
   scripts["w0"].fail_after = 1ms;
   scripts["w0"].throw_int = true;

   supervisor sup;
   auto const res = sup.supervise(make_specs(1), make_factory(scripts, p), sigs);

   assert_true(res.failed(), "non_std_exception: failed");
   assert_equal(res.what(), std::string {"unknown error"}, "non_std_exception: what");
}

void shutdown_notice_tests()
{
   // Workers returning once the shutdown has been triggered are not
   // reported as having stopped by themselves.
   probe p;
   manual_signal_source sigs;

   std::map<std::string, script> scripts;
   scripts["w2"].fail_after = 5ms;

   log_capture cap {log::level::notice};
   supervisor sup;
   auto const res = sup.supervise(make_specs(4), make_factory(scripts, p), sigs);

   assert_true(res.failed(), "shutdown_notice: failed");
   assert_equal(res.worker_id, std::string {"w2"}, "shutdown_notice: w2 reported");
   assert_true( !cap.contains("stopped before shutdown was requested")
              , "shutdown_notice: no early stop reported");
}

void drain_warning_tests()
{
   // Warnings are issued while waiting but never shorten the wait.
   probe p;
   manual_signal_source sigs;

   std::map<std::string, script> scripts;
   scripts["w0"].drain = 50ms;

   auto t = raise_after(sigs, 1ms);

   timer tm;
   log_capture cap {log::level::warning};
   supervisor sup {config::supervisor {std::chrono::milliseconds {5}}};
   auto const res = sup.supervise(make_specs(1), make_factory(scripts, p), sigs);
   t.join();

   assert_true( cap.contains("Waiting for 1 listener(s) to stop: w0")
              , "drain_warning: pending listener named");

   assert_true(!res.failed(), "drain_warning: clean");
   assert_true(tm.elapsed() >= 50ms, "drain_warning: waited for the drain");
   assert_true(p.was_stopped("w0"), "drain_warning: w0 stopped");
}

void os_signal_source_tests()
{
   {  // Delivery and repeated signals.
      os_signal_source sigs;
      std::promise<int> received;
      auto fut = received.get_future();
      auto count = 0;

      sigs.subscribe([&](int n)
      {
         if (count++ == 0)
            received.set_value(n);
      });

      std::raise(SIGTERM);
      auto const st = fut.wait_for(std::chrono::seconds {2});
      assert_true(st == std::future_status::ready, "os_signal_source: delivered");
      if (st == std::future_status::ready)
         assert_equal(fut.get(), SIGTERM, "os_signal_source: number");

      std::raise(SIGINT);
      std::this_thread::sleep_for(50ms);
      sigs.unsubscribe();
      assert_equal(count, 1, "os_signal_source: delivered at most once");
   }

   {  // Signal arriving before the subscription.
      os_signal_source sigs;
      std::raise(SIGINT);
      std::this_thread::sleep_for(50ms);

      std::promise<int> received;
      auto fut = received.get_future();
      sigs.subscribe([&](int n) { received.set_value(n); });

      auto const st = fut.wait_for(std::chrono::seconds {2});
      assert_true(st == std::future_status::ready, "os_signal_source: early signal kept");
      sigs.unsubscribe();
   }

   {  // End to end.
      probe p;
      os_signal_source sigs;

      std::thread t {[]()
      {
         std::this_thread::sleep_for(20ms);
         std::raise(SIGINT);
      }};

      supervisor sup;
      auto const res = sup.supervise(make_specs(3), make_factory({}, p), sigs);
      t.join();

      assert_true(!res.failed(), "os_signal_source: supervise clean");
      assert_true(res.signal == SIGINT, "os_signal_source: supervise signal");
      assert_equal(p.stopped(), 3u, "os_signal_source: supervise all stopped");
   }
}

int main(int argc, char* argv[])
{
   int test = 0;
   std::string log_level;

   po::options_description desc("Options");
   desc.add_options()
   ("help,h", "Produces the help message.")
   ("log-level", po::value<std::string>(&log_level)->default_value("emerg"), "Log level of the code under test.")
   ( "test,r"
   , po::value<int>(&test)->default_value(0)
   , "The test to run:\n"
     "• 0: \tall.\n"
     "• 1: \tempty set.\n"
     "• 2: \tall workers awaited.\n"
     "• 3: \tone failure.\n"
     "• 4: \tidempotence.\n"
     "• 5: \tscenarios.\n"
     "• 6: \tfactory and exceptions.\n"
     "• 7: \tdrain.\n"
     "• 8: \tos signal source.\n"
   )
   ;

   po::variables_map vm;
   po::store(po::parse_command_line(argc, argv, desc), vm);
   po::notify(vm);

   if (vm.count("help")) {
      std::cout << desc << "\n";
      return 0;
   }

   log::upto(log::to_level<log::level>(log_level));

   if (test == 0 || test == 1)
      empty_set_tests();

   if (test == 0 || test == 2)
      all_awaited_tests();

   if (test == 0 || test == 3) {
      one_failure_tests();
      multiple_failures_tests();
      early_clean_return_tests();
      shutdown_notice_tests();
   }

   if (test == 0 || test == 4)
      idempotence_tests();

   if (test == 0 || test == 5) {
      failure_scenario_tests();
      clean_scenario_tests();
   }

   if (test == 0 || test == 6) {
      factory_tests();
      non_std_exception_tests();
   }

   if (test == 0 || test == 7) {
      failing_during_drain_tests();
      drain_warning_tests();
   }

   if (test == 0 || test == 8)
      os_signal_source_tests();

   return report();
}

