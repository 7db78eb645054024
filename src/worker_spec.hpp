#pragma once

#include <string>
#include <vector>
#include <ostream>

namespace pico
{

// Describes one worker before it is started. Parsed from entries in
// the form <id>/<target> e.g. my-endpoint/localhost:3000.
struct worker_spec {
   std::string id;
   std::string target;
};

bool operator==(worker_spec const& a, worker_spec const& b);
std::ostream& operator<<(std::ostream& os, worker_spec const& spec);

// Throws std::invalid_argument if the entry does not have exactly two
// non-empty components separated by a single '/'.
worker_spec parse_worker_spec(std::string const& entry);

// Splits each element on ',' and drops empty items, so that both
// repeated flags and comma separated lists are accepted.
std::vector<std::string>
split_list(std::vector<std::string> const& values);

// Parses all entries. Throws std::invalid_argument on the first
// malformed one or if there is no entry at all.
std::vector<worker_spec>
make_worker_set(std::vector<std::string> const& entries);

}

