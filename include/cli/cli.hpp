#pragma once

#include <algorithm>
#include <functional>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace netmap {

/**
 * @brief Malformed command line (unknown option, missing value, ...)
 */
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief One option value as typed on the command line
 */
struct ArgValue {
    std::string value;
    bool is_set = false;

    explicit operator bool() const { return is_set; }

    int as_int(int fallback = 0) const {
        if (!is_set) return fallback;
        size_t used = 0;
        int parsed = 0;
        try {
            parsed = std::stoi(value, &used);
        } catch (const std::exception&) {
            throw UsageError("Expected an integer, got '" + value + "'");
        }
        if (used != value.size()) {
            throw UsageError("Expected an integer, got '" + value + "'");
        }
        return parsed;
    }

    size_t as_size(size_t fallback = 0) const {
        if (!is_set) return fallback;
        int parsed = as_int();
        if (parsed < 0) {
            throw UsageError("Expected a non-negative integer, got '" + value + "'");
        }
        return static_cast<size_t>(parsed);
    }

    // Comma-separated, empty items dropped
    std::vector<std::string> as_list(char delim = ',') const {
        std::vector<std::string> items;
        std::istringstream in(value);
        std::string item;
        while (is_set && std::getline(in, item, delim)) {
            if (!item.empty()) items.push_back(item);
        }
        return items;
    }
};

/**
 * @brief Options seen by a command handler (command options plus globals)
 */
class Args {
public:
    std::map<std::string, ArgValue> named;

    ArgValue get(const std::string& name, const std::string& fallback = "") const {
        auto it = named.find(name);
        if (it != named.end() && it->second.is_set) return it->second;
        return ArgValue{fallback, !fallback.empty()};
    }

    bool has(const std::string& name) const {
        auto it = named.find(name);
        return it != named.end() && it->second.is_set;
    }

    std::string require(const std::string& name) const {
        if (!has(name)) {
            throw UsageError("Missing required option --" + name);
        }
        return named.at(name).value;
    }
};

struct ArgDef {
    std::string name;
    std::string short_name;
    std::string description;
    std::string default_value;
    bool required = false;
    bool is_flag = false;       ///< Takes no value; presence sets "true"
};

struct Command {
    std::string name;
    std::string description;
    std::vector<ArgDef> args;
    std::function<int(const Args&)> handler;
};

namespace cli_detail {

inline const ArgDef* lookup(const std::vector<ArgDef>& defs, const std::string& token, std::string* inline_value) {
    std::string key = token;
    bool has_inline = false;
    if (token.rfind("--", 0) == 0) {
        auto eq = token.find('=');
        if (eq != std::string::npos) {
            *inline_value = token.substr(eq + 1);
            key = token.substr(0, eq);
            has_inline = true;
        }
        key = key.substr(2);
        for (const auto& d : defs) {
            if (d.name == key) return &d;
        }
    } else if (token.size() == 2 && token[0] == '-') {
        key = token.substr(1);
        for (const auto& d : defs) {
            if (!d.short_name.empty() && d.short_name == key) return &d;
        }
    }
    if (has_inline) inline_value->clear();
    return nullptr;
}

/**
 * @brief Parse options from tokens[pos] onward into `out`
 *
 * With `stop_at_word` set, parsing ends at the first token that is not an
 * option and its index is returned; otherwise such a token is an error.
 */
inline size_t parse_options(const std::vector<std::string>& tokens, size_t pos,
                            const std::vector<ArgDef>& defs, Args& out, bool stop_at_word) {
    while (pos < tokens.size()) {
        const std::string& token = tokens[pos];
        bool looks_like_option = token.size() > 1 && token[0] == '-';
        if (!looks_like_option) {
            if (stop_at_word) break;
            throw UsageError("Unexpected argument: " + token);
        }

        std::string value;
        const ArgDef* def = lookup(defs, token, &value);
        if (!def) {
            if (stop_at_word) break;
            throw UsageError("Unknown option: " + token);
        }

        if (def->is_flag) {
            value = "true";
        } else if (value.empty() && token.find('=') == std::string::npos) {
            if (pos + 1 >= tokens.size()) {
                throw UsageError("Option " + token + " needs a value");
            }
            value = tokens[++pos];
        }
        out.named[def->name] = ArgValue{value, true};
        ++pos;
    }
    return pos;
}

inline void apply_defaults(const std::vector<ArgDef>& defs, Args& out) {
    for (const auto& d : defs) {
        if (out.has(d.name)) continue;
        if (d.required) {
            throw UsageError("Missing required option --" + d.name);
        }
        if (!d.default_value.empty()) {
            out.named[d.name] = ArgValue{d.default_value, true};
        }
    }
}

inline void print_options(std::ostream& os, const std::vector<ArgDef>& defs) {
    for (const auto& d : defs) {
        std::string spec = "--" + d.name;
        if (!d.short_name.empty()) spec += ", -" + d.short_name;
        if (!d.is_flag) spec += " <value>";
        os << "  " << spec << "\n      " << d.description;
        if (!d.default_value.empty()) os << " [default " << d.default_value << "]";
        if (d.required) os << " [required]";
        os << "\n";
    }
}

} // namespace cli_detail

/**
 * @brief Command registry and dispatcher for the netmap binary
 *
 * Global options (--config, --db, ...) come before the command name and
 * are merged into every command's Args. Exceptions escaping a handler go
 * to the error handler, which reports them and picks the exit code.
 */
class CLI {
public:
    using ErrorHandler = std::function<int(const std::exception&)>;

    CLI(std::string program_name, std::string version)
        : program_name_(std::move(program_name)), version_(std::move(version)) {}

    void register_command(Command cmd) {
        std::string key = cmd.name;
        commands_[key] = std::move(cmd);
    }

    void add_global_arg(ArgDef def) { globals_.push_back(std::move(def)); }

    void set_error_handler(ErrorHandler handler) { on_error_ = std::move(handler); }

    int run(int argc, char** argv) {
        const std::vector<std::string> tokens(argv + 1, argv + argc);

        Args globals;
        size_t pos = 0;
        try {
            pos = cli_detail::parse_options(tokens, 0, globals_, globals, true);
            cli_detail::apply_defaults(globals_, globals);
        } catch (const UsageError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }

        if (pos >= tokens.size()) {
            print_usage(std::cerr);
            return 1;
        }
        const std::string& word = tokens[pos];
        if (word == "--help" || word == "-h" || word == "help") {
            print_usage(std::cout);
            return 0;
        }
        if (word == "--version") {
            std::cout << program_name_ << " " << version_ << "\n";
            return 0;
        }

        auto it = commands_.find(word);
        if (it == commands_.end()) {
            std::cerr << "Unknown command '" << word << "'. Try '" << program_name_ << " --help'.\n";
            return 1;
        }
        const Command& cmd = it->second;

        for (size_t i = pos + 1; i < tokens.size(); ++i) {
            if (tokens[i] == "--help" || tokens[i] == "-h") {
                print_command_usage(std::cout, cmd);
                return 0;
            }
        }

        Args args;
        try {
            cli_detail::parse_options(tokens, pos + 1, cmd.args, args, false);
            cli_detail::apply_defaults(cmd.args, args);
        } catch (const UsageError& e) {
            std::cerr << "Error: " << e.what() << "\n";
            print_command_usage(std::cerr, cmd);
            return 1;
        }
        // Command options shadow globals of the same name
        for (const auto& [name, value] : globals.named) {
            args.named.emplace(name, value);
        }

        try {
            return cmd.handler(args);
        } catch (const std::exception& e) {
            if (on_error_) return on_error_(e);
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    void print_usage(std::ostream& os) const {
        os << "Usage: " << program_name_ << " [global options] <command> [options]\n\nCommands:\n";
        size_t width = 0;
        for (const auto& entry : commands_) width = std::max(width, entry.first.size());
        for (const auto& [name, cmd] : commands_) {
            os << "  " << name << std::string(width - name.size() + 3, ' ') << cmd.description << "\n";
        }
        if (!globals_.empty()) {
            os << "\nGlobal options:\n";
            cli_detail::print_options(os, globals_);
        }
        os << "\n'" << program_name_ << " <command> --help' lists a command's options. Version "
           << version_ << ".\n";
    }

private:
    void print_command_usage(std::ostream& os, const Command& cmd) const {
        os << "Usage: " << program_name_ << " [global options] " << cmd.name;
        for (const auto& d : cmd.args) {
            if (d.required) os << " --" << d.name << " <value>";
        }
        os << " [options]\n\n" << cmd.description << "\n";
        if (!cmd.args.empty()) {
            os << "\nOptions:\n";
            cli_detail::print_options(os, cmd.args);
        }
    }

    std::string program_name_;
    std::string version_;
    std::map<std::string, Command> commands_;
    std::vector<ArgDef> globals_;
    ErrorHandler on_error_;
};

} // namespace netmap
