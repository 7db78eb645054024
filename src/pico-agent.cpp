#include <memory>
#include <string>
#include <vector>
#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/variables_map.hpp>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "logger.hpp"
#include "listener.hpp"
#include "release.hpp"
#include "supervisor.hpp"
#include "worker_spec.hpp"
#include "signal_source.hpp"

using namespace pico;

using json = nlohmann::json;

struct config_all {
   int help = 0; // 0: continue, 1: help, -1: error.
   std::vector<worker_spec> listeners;
   config::log logging;
   config::listener listener;
   config::supervisor supervisor;
   log::level logfilter = log::level::notice;
};

json dump_cfg(config_all const& cfg)
{
   json listeners = json::array();
   for (auto const& o : cfg.listeners)
      listeners.push_back({{"id", o.id}, {"target", o.target}});

   return
   { {"listeners", listeners}
   , {"log", { {"level", cfg.logging.level}
             , {"subsystems", cfg.logging.subsystems}}}
   , {"upstream", { {"retry_interval_ms", cfg.listener.retry_interval.count()}
                  , {"connect_timeout_ms", cfg.listener.connect_timeout.count()}
                  , {"max_failures", cfg.listener.max_failures}}}
   , {"drain_warn_interval_ms", cfg.supervisor.drain_warn_interval.count()}
   };
}

namespace po = boost::program_options;

auto get_cfg(int argc, char* argv[])
{
   config_all cfg;
   std::string conf_file;
   std::vector<std::string> listeners;
   std::vector<std::string> subsystems;
   int retry_interval = 1000;
   int connect_timeout = 2000;
   int drain_warn_interval = 5000;

   po::options_description desc("Options");
   desc.add_options()
   ("help,h", "Produces help message.")
   ("version,v", "The git SHA1 the agent was built from.")
   ("config", po::value<std::string>(&conf_file), "The file containing the configuration.")
   ("listeners", po::value<std::vector<std::string>>(&listeners)->multitoken(), "Comma separated listeners to register, with format '<endpoint ID>/<forward addr>'.")
   ("log-level", po::value<std::string>(&cfg.logging.level)->default_value("notice"), "Available options are: emerg, alert, crit, err, warning, notice, info, debug.")
   ("log-subsystems", po::value<std::vector<std::string>>(&subsystems)->multitoken(), "Enable debug logs for the given subsystems: supervisor, signal, listener.")
   ("upstream-retry-interval", po::value<int>(&retry_interval)->default_value(1000), "Time in milliseconds between two attempts to reach the upstream.")
   ("upstream-connect-timeout", po::value<int>(&connect_timeout)->default_value(2000), "Time in milliseconds allowed for one connection attempt to the upstream.")
   ("upstream-max-failures", po::value<int>(&cfg.listener.max_failures)->default_value(0), "Consecutive failed attempts after which a listener fails. 0 retries forever.")
   ("drain-warn-interval", po::value<int>(&drain_warn_interval)->default_value(5000), "Rate in milliseconds at which listeners that don't stop are reported on shutdown.")
   ;

   po::positional_options_description pos;
   pos.add("config", -1);

   po::variables_map vm;
   po::store(po::command_line_parser(argc, argv).options(desc).positional(pos).run(), vm);
   po::notify(vm);

   if (!std::empty(conf_file)) {
      std::ifstream ifs {conf_file};
      if (!ifs)
         throw std::invalid_argument {"unable to open " + conf_file};

      po::store(po::parse_config_file(ifs, desc, true), vm);
      notify(vm);
   }

   if (vm.count("help")) {
      std::cout << desc << "\n";
      return config_all {1};
   }

   if (vm.count("version")) {
      std::cout << PICO_GIT_SHA1 << "\n";
      return config_all {1};
   }

   if (retry_interval <= 0)
      throw std::invalid_argument {"upstream-retry-interval must be positive"};

   if (connect_timeout <= 0)
      throw std::invalid_argument {"upstream-connect-timeout must be positive"};

   if (cfg.listener.max_failures < 0)
      throw std::invalid_argument {"upstream-max-failures must not be negative"};

   if (drain_warn_interval <= 0)
      throw std::invalid_argument {"drain-warn-interval must be positive"};

   cfg.listeners = make_worker_set(split_list(listeners));
   cfg.logging.subsystems = split_list(subsystems);
   cfg.logfilter = log::to_level<log::level>(cfg.logging.level);
   cfg.listener.retry_interval = std::chrono::milliseconds {retry_interval};
   cfg.listener.connect_timeout = std::chrono::milliseconds {connect_timeout};
   cfg.supervisor.drain_warn_interval =
      std::chrono::milliseconds {drain_warn_interval};

   return cfg;
}

auto parse_cfg(int argc, char* argv[])
{
   try {
      return get_cfg(argc, argv);
   } catch (std::exception const& e) {
      std::cerr << "invalid config: " << e.what() << std::endl;
      return config_all {-1};
   }
}

int main(int argc, char* argv[])
{
   try {
      auto const cfg = parse_cfg(argc, argv);

      if (cfg.help == 1)
         return 0;

      if (cfg.help == -1)
         return 1;

      log::upto(cfg.logfilter);
      log::enable_subsystems(cfg.logging.subsystems);

      // Must be installed before any listener is started.
      os_signal_source signals;

      log::write( log::level::notice
                , "starting pico agent: {0}"
                , dump_cfg(cfg).dump());

      auto const factory = [&cfg](worker_spec const& spec)
         { return std::make_unique<listener>(spec, cfg.listener); };

      supervisor sup {cfg.supervisor};
      auto const res = sup.supervise(cfg.listeners, factory, signals);

      if (res.failed()) {
         log::write( log::level::err
                   , "failed to run agent: {0}: {1}"
                   , res.worker_id
                   , res.what());
      }

      log::write(log::level::notice, "shutdown complete");
      log::write( log::level::notice
                , "Exiting with status {0} ..."
                , res.exit_status());

      return res.exit_status();

   } catch (std::exception const& e) {
      log::write(log::level::notice, "{0}", e.what());
      log::write(log::level::notice, "Exiting with status 1 ...");
      return 1;
   }
}

