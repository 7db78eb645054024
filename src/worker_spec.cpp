#include "worker_spec.hpp"

#include <set>
#include <sstream>
#include <iterator>
#include <algorithm>
#include <stdexcept>

#include "net.hpp"
#include "logger.hpp"

namespace pico
{

bool operator==(worker_spec const& a, worker_spec const& b)
{
   return a.id == b.id && a.target == b.target;
}

std::ostream& operator<<(std::ostream& os, worker_spec const& spec)
{
   os << spec.id << '/' << spec.target;
   return os;
}

worker_spec parse_worker_spec(std::string const& entry)
{
   auto const n = std::count(std::cbegin(entry), std::cend(entry), '/');
   if (n != 1) {
      throw std::invalid_argument
         {"invalid listener '" + entry + "': must be in format "
          "'<endpoint ID>/<forward addr>'"};
   }

   auto const pos = entry.find('/');

   worker_spec spec
   { entry.substr(0, pos)
   , entry.substr(pos + 1)
   };

   if (std::empty(spec.id)) {
      throw std::invalid_argument
         {"invalid listener '" + entry + "': missing endpoint ID"};
   }

   if (std::empty(spec.target)) {
      throw std::invalid_argument
         {"invalid listener '" + entry + "': missing forward address"};
   }

   return spec;
}

std::vector<std::string>
split_list(std::vector<std::string> const& values)
{
   std::vector<std::string> ret;
   for (auto const& value : values) {
      std::istringstream iss {value};
      std::string item;
      while (std::getline(iss, item, ',')) {
         if (!std::empty(item))
            ret.push_back(item);
      }
   }

   return ret;
}

std::vector<worker_spec>
make_worker_set(std::vector<std::string> const& entries)
{
   if (std::empty(entries))
      throw std::invalid_argument {"no listeners"};

   std::vector<worker_spec> ret;
   std::transform( std::cbegin(entries)
                 , std::cend(entries)
                 , std::back_inserter(ret)
                 , parse_worker_spec);

   for (auto const& spec : ret) {
      if (std::empty(split_host_port(spec.target).first)) {
         throw std::invalid_argument
            {"invalid listener '" + spec.id + "': forward address '"
             + spec.target + "' must be in format '<host>:<port>'"};
      }
   }

   // Duplicates simply start two independent workers.
   std::set<std::string> ids;
   for (auto const& spec : ret) {
      if (!ids.insert(spec.id).second) {
         log::write( log::level::warning
                   , "Listener '{0}' registered more than once."
                   , spec.id);
      }
   }

   return ret;
}

}

