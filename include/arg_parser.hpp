#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Small command line parser for autodeploy.
 *
 * Long options are written `--flag`, `--opt value` or `--opt=value`. Only
 * options listed in `value_flags` consume the following argument, so a
 * boolean switch never swallows a positional argument. Single character
 * aliases (`-c file`, `-u`) map onto long names through `short_map`.
 * Anything not in `known_flags` is collected in `unknown_flags()`.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Option values keyed by flag
    std::vector<std::string> positional_;        ///< Positional arguments in order
    std::vector<std::string> unknown_flags_;     ///< Flags not present in known_flags
    std::vector<std::string> missing_values_;    ///< Value flags given without a value

    void store(const std::string& key, const std::string* value,
               const std::set<std::string>& known_flags) {
        if (!known_flags.count(key)) {
            unknown_flags_.push_back(key);
            return;
        }
        flags_.insert(key);
        if (value)
            options_[key] = *value;
    }

  public:
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags,
              const std::set<std::string>& value_flags,
              const std::map<char, std::string>& short_map = {}) {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            std::string key;
            if (arg.rfind("--", 0) == 0 && arg.size() > 2) {
                size_t eq = arg.find('=');
                if (eq != std::string::npos) {
                    std::string val = arg.substr(eq + 1);
                    store(arg.substr(0, eq), &val, known_flags);
                    continue;
                }
                key = arg;
            } else if (arg.size() == 2 && arg[0] == '-' && short_map.count(arg[1])) {
                key = short_map.at(arg[1]);
            } else if (arg.size() > 1 && arg[0] == '-') {
                unknown_flags_.push_back(arg);
                continue;
            } else {
                positional_.push_back(arg);
                continue;
            }
            if (value_flags.count(key)) {
                if (i + 1 < argc) {
                    std::string val = argv[++i];
                    store(key, &val, known_flags);
                } else {
                    missing_values_.push_back(key);
                }
            } else {
                store(key, nullptr, known_flags);
            }
        }
    }

    /**
     * @brief Check whether a flag was provided on the command line.
     *
     * @param flag Flag name including the leading `--`.
     */
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /**
     * @brief Retrieve the value associated with an option.
     *
     * @return Stored option value or empty string if missing.
     */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        if (it != options_.end())
            return it->second;
        return "";
    }

    const std::set<std::string>& flags() const { return flags_; }
    const std::vector<std::string>& positional() const { return positional_; }
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }
    const std::vector<std::string>& missing_values() const { return missing_values_; }
};

#endif // ARG_PARSER_HPP
