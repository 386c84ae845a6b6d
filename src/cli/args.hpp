#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>
#include <core/types.hpp>

// Parsed command line of one subcommand: positionals plus "--name value"
// options (repeatable) and boolean "--flag" switches.
struct Args {
    std::vector<std::string> positional;
    std::map<std::string, std::vector<std::string>> options;
    std::set<std::string> flags;

    bool has(const std::string& name) const;
    std::string get(const std::string& name, const std::string& fallback = "") const;
    std::vector<std::string> all(const std::string& name) const;
};

// boolean_flags lists the long names ("--wait") that take no value.
// Short aliases: -e --env, -v --volume, -n --name, -p --preset, -c --concurrency,
// -d --description, -q --quiet.
// "--name=value" is accepted. Everything after "--" is positional.
Result<Args> parse_args(const std::vector<std::string>& argv,
                        const std::set<std::string>& boolean_flags);
