#include <string>
#include <vector>
#include <stdexcept>

#include "net.hpp"
#include "logger.hpp"
#include "test_utils.hpp"
#include "worker_spec.hpp"

using namespace pico;
using namespace pico::test;

void parse_tests()
{
   {
      auto const spec = parse_worker_spec("my-endpoint-123/localhost:3000");
      assert_equal(spec.id, std::string {"my-endpoint-123"}, "parse: id");
      assert_equal(spec.target, std::string {"localhost:3000"}, "parse: target");
   }

   assert_throw<std::invalid_argument>([]()
      { parse_worker_spec("localhost:3000"); }, "parse: no delimiter");

   assert_throw<std::invalid_argument>([]()
      { parse_worker_spec("a/b/c"); }, "parse: two delimiters");

   assert_throw<std::invalid_argument>([]()
      { parse_worker_spec("/localhost:3000"); }, "parse: empty id");

   assert_throw<std::invalid_argument>([]()
      { parse_worker_spec("my-endpoint/"); }, "parse: empty target");

   assert_throw<std::invalid_argument>([]()
      { parse_worker_spec(""); }, "parse: empty entry");
}

void split_list_tests()
{
   {
      auto const r = split_list({"a/x:1,b/y:2", "c/z:3"});
      std::vector<std::string> const expected {"a/x:1", "b/y:2", "c/z:3"};
      assert_true(r == expected, "split_list: comma and repeated");
   }

   {
      auto const r = split_list({",a/x:1,,", ""});
      std::vector<std::string> const expected {"a/x:1"};
      assert_true(r == expected, "split_list: empty items dropped");
   }

   assert_true(std::empty(split_list({})), "split_list: no values");
}

void worker_set_tests()
{
   {
      auto const set =
         make_worker_set({"a/localhost:3000", "b/localhost:4000"});

      std::vector<worker_spec> const expected
      { {"a", "localhost:3000"}
      , {"b", "localhost:4000"}
      };

      assert_true(set == expected, "worker_set: order kept");
   }

   {  // Duplicates start two workers.
      auto const set = make_worker_set({"a/localhost:3000", "a/localhost:3001"});
      assert_equal(std::size(set), 2u, "worker_set: duplicates kept");
   }

   assert_throw<std::invalid_argument>([]()
      { make_worker_set({}); }, "worker_set: no listeners");

   assert_throw<std::invalid_argument>([]()
      { make_worker_set({"a/localhost:3000", "broken"}); }, "worker_set: one malformed");

   assert_throw<std::invalid_argument>([]()
      { make_worker_set({"a/localhost"}); }, "worker_set: target without port");

   assert_throw<std::invalid_argument>([]()
      { make_worker_set({"a/localhost:3000", "b/:4000"}); }, "worker_set: target without host");
}

void host_port_tests()
{
   {
      auto const r = split_host_port("localhost:3000");
      assert_equal(r.first, std::string {"localhost"}, "host_port: host");
      assert_equal(r.second, std::string {"3000"}, "host_port: port");
   }

   {
      auto const r = split_host_port("[::1]:8080");
      assert_equal(r.first, std::string {"::1"}, "host_port: ipv6 host");
      assert_equal(r.second, std::string {"8080"}, "host_port: ipv6 port");
   }

   assert_true(std::empty(split_host_port("localhost").first), "host_port: no port");
   assert_true(std::empty(split_host_port("localhost:").first), "host_port: empty port");
   assert_true(std::empty(split_host_port(":3000").first), "host_port: empty host");
}

void log_level_tests()
{
   assert_true( log::to_level<log::level>("debug") == log::level::debug
              , "log_level: debug");
   assert_true( log::to_level<log::level>("warning") == log::level::warning
              , "log_level: warning");

   assert_throw<std::invalid_argument>([]()
      { log::to_level<log::level>("verbose"); }, "log_level: unknown");

   log::enable_subsystems({"listener", "signal"});
   assert_true(log::is_enabled("listener"), "log_subsystems: enabled");
   assert_true(!log::is_enabled("supervisor"), "log_subsystems: disabled");
   log::enable_subsystems({});
}

int main()
{
   log::upto(log::level::emerg);

   parse_tests();
   split_list_tests();
   worker_set_tests();
   host_port_tests();
   log_level_tests();

   return report();
}

