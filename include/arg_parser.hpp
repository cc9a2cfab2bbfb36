#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <string>
#include <set>
#include <vector>
#include <map>

/**
 * @brief Simple command line argument parser.
 *
 * Recognizes long options (`--flag`, `--opt value`, `--opt=value`) and short
 * aliases mapped to them (`-h`). Flags listed in @a switches never take a
 * value, so `--json-log repo` leaves `repo` positional. Everything that does
 * not start with `-` is positional; a lone `--` makes every following
 * argument positional.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Option values keyed by flag
    std::vector<std::string> positional_;        ///< Positional arguments in order
    std::vector<std::string> unknown_flags_;     ///< Flags not present in known_flags
    std::set<std::string> known_flags_;          ///< List of accepted flags
    std::set<std::string> switches_;             ///< Flags that never take a value
    std::map<char, std::string> short_map_;      ///< Mapping of short to long flags

    void record(const std::string& key, const std::string* value) {
        if (!known_flags_.empty() && !known_flags_.count(key)) {
            unknown_flags_.push_back(key);
            return;
        }
        flags_.insert(key);
        if (value)
            options_[key] = *value;
    }

    bool takes_value(const std::string& key) const { return !switches_.count(key); }

  public:
    /**
     * @brief Parse the given command line arguments.
     *
     * @param argc Argument count from `main`.
     * @param argv Argument vector from `main`.
     * @param known_flags Flags considered valid. If empty, all flags are known.
     * @param short_map Mapping from single character options (e.g. '-h') to
     *        their long form (e.g. '--help').
     * @param switches Flags that are plain on/off switches.
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::map<char, std::string>& short_map = {},
              const std::set<std::string>& switches = {})
        : known_flags_(known_flags), switches_(switches), short_map_(short_map) {
        bool only_positional = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (only_positional) {
                positional_.push_back(arg);
            } else if (arg == "--") {
                only_positional = true;
            } else if (arg.rfind("--", 0) == 0) {
                size_t eq = arg.find('=');
                if (eq != std::string::npos) {
                    std::string val = arg.substr(eq + 1);
                    record(arg.substr(0, eq), &val);
                } else if (takes_value(arg) && i + 1 < argc &&
                           std::string(argv[i + 1]).rfind("--", 0) != 0) {
                    std::string val = argv[++i];
                    record(arg, &val);
                } else {
                    record(arg, nullptr);
                }
            } else if (arg.size() == 2 && arg[0] == '-' && short_map_.count(arg[1])) {
                const std::string& key = short_map_.at(arg[1]);
                if (takes_value(key) && i + 1 < argc && argv[i + 1][0] != '-') {
                    std::string val = argv[++i];
                    record(key, &val);
                } else {
                    record(key, nullptr);
                }
            } else if (arg.size() > 1 && arg[0] == '-' && short_map_.count(arg[1]) &&
                       takes_value(short_map_.at(arg[1]))) {
                // -yconfig.yaml and -y=config.yaml
                std::string val = arg.substr(arg[2] == '=' ? 3 : 2);
                record(short_map_.at(arg[1]), &val);
            } else {
                positional_.push_back(arg);
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
     * @param opt Option name including the leading `--`.
     * @return Stored option value or empty string if missing.
     */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        if (it != options_.end())
            return it->second;
        return "";
    }

    /** @return Set of all flags found during parsing. */
    const std::set<std::string>& flags() const { return flags_; }

    /** @return Map of option names to their parsed values. */
    const std::map<std::string, std::string>& options() const { return options_; }

    /** @return Ordered list of positional arguments. */
    const std::vector<std::string>& positional() const { return positional_; }

    /** @return Flags that were not part of @a known_flags. */
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }
};

#endif // ARG_PARSER_HPP
