#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Command line argument parser.
 *
 * Recognizes long options (`--flag`, `--opt value`, `--opt=value`) and
 * single-character aliases (`-n 4`, `-n4`, bundled switches such as `-er`).
 * Options listed in @a switches never take a separate value, so
 * `--recursive ~/src` keeps `~/src` as a positional argument. Every other
 * known option consumes the next argument unless it starts with `-`.
 * A lone `--` ends option processing. Flags outside the known set are
 * collected in unknown_flags() so the caller can report them.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Last value given for each option
    std::map<std::string, std::vector<std::string>>
        multi_options_;                      ///< Every value of repeatable options
    std::vector<std::string> positional_;    ///< Positional arguments in order
    std::vector<std::string> unknown_flags_; ///< Flags not present in known_flags
    std::set<std::string> known_flags_;      ///< Accepted flags, empty accepts all
    std::map<char, std::string> short_map_;  ///< Short to long flag mapping
    std::set<std::string> switches_;         ///< Flags that never take a value

    bool accept(const std::string& key);
    void store(const std::string& key, const std::string& val);

  public:
    /**
     * @brief Parse the given command line arguments.
     *
     * @param argc Argument count from `main`.
     * @param argv Argument vector from `main`.
     * @param known_flags Accepted flags. If empty, all flags are accepted.
     * @param short_map Mapping from single character options to their long form.
     * @param switches Flags that are boolean and never consume a value.
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::map<char, std::string>& short_map = {},
              const std::set<std::string>& switches = {});

    /** @return `true` if @a flag (including the leading `--`) was given. */
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /**
     * @brief Retrieve the value of an option.
     *
     * @return The last value given, or an empty string when absent.
     */
    std::string get_option(const std::string& opt) const;

    /** @return Every value given for @a opt, in command line order. */
    std::vector<std::string> get_all_options(const std::string& opt) const;

    const std::set<std::string>& flags() const { return flags_; }
    const std::map<std::string, std::string>& options() const { return options_; }
    const std::vector<std::string>& positional() const { return positional_; }
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }
};

#endif // ARG_PARSER_HPP
