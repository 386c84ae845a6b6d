#include "args.hpp"
#include <fmt/format.h>

bool Args::has(const std::string& name) const {
    return flags.count(name) > 0 || options.count(name) > 0;
}

std::string Args::get(const std::string& name, const std::string& fallback) const {
    auto it = options.find(name);
    if (it == options.end() || it->second.empty()) return fallback;
    return it->second.back();
}

std::vector<std::string> Args::all(const std::string& name) const {
    auto it = options.find(name);
    if (it == options.end()) return {};
    return it->second;
}

static std::string expand_alias(const std::string& arg) {
    static const std::map<std::string, std::string> aliases = {
        {"-e", "--env"},
        {"-v", "--volume"},
        {"-n", "--name"},
        {"-p", "--preset"},
        {"-c", "--concurrency"},
        {"-d", "--description"},
        {"-q", "--quiet"},
    };
    auto it = aliases.find(arg);
    return it != aliases.end() ? it->second : arg;
}

Result<Args> parse_args(const std::vector<std::string>& argv,
                        const std::set<std::string>& boolean_flags) {
    Args args;
    bool only_positional = false;

    for (size_t i = 0; i < argv.size(); ++i) {
        std::string arg = argv[i];

        if (only_positional || arg.size() < 2 || arg[0] != '-') {
            args.positional.push_back(arg);
            continue;
        }
        if (arg == "--") {
            only_positional = true;
            continue;
        }

        arg = expand_alias(arg);
        if (arg.compare(0, 2, "--") != 0) {
            return Result<Args>::Err(fmt::format("Unknown option '{}'", arg));
        }

        auto eq = arg.find('=');
        if (eq != std::string::npos) {
            args.options[arg.substr(0, eq)].push_back(arg.substr(eq + 1));
            continue;
        }

        if (boolean_flags.count(arg)) {
            args.flags.insert(arg);
            continue;
        }

        if (i + 1 >= argv.size()) {
            return Result<Args>::Err(fmt::format("Option '{}' needs a value", arg));
        }
        args.options[arg].push_back(argv[++i]);
    }
    return Result<Args>::Ok(args);
}
