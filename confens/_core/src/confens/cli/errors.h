#pragma once

#include <stdexcept>
#include <string>

namespace confens {
namespace cli {

/**
 * Command line error. Rendered in the same "[ERROR] <category>: <message>"
 * layout as library errors, with an optional suggestion line.
 *
 * Usage errors exit with status 2, library errors raised by the commands
 * exit with status 1.
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg, const std::string& suggestion = "")
        : std::runtime_error(msg), suggestion_(suggestion) {
    }
    virtual int get_exit_code() const {
        return 2;
    }
    const std::string& suggestion() const {
        return suggestion_;
    }

    std::string formatted() const {
        std::string out = "[ERROR] Usage: " + std::string(what());
        if (!suggestion_.empty()) {
            out += "\n  Suggestion: " + suggestion_;
        }
        return out;
    }

private:
    std::string suggestion_;
};

// Malformed command line
class ParseError : public Error {
public:
    explicit ParseError(const std::string& msg, const std::string& suggestion = "")
        : Error(msg, suggestion) {
    }

    static ParseError unknown_option(const std::string& arg) {
        return ParseError("unknown option " + arg,
                          "Global flags such as --quiet go before the subcommand");
    }
    static ParseError unexpected_argument(const std::string& arg) {
        return ParseError("unexpected argument '" + arg + "'");
    }
    static ParseError bad_value(const std::string& option, const std::string& value) {
        return ParseError("cannot parse '" + value + "' for " + option);
    }
    static ParseError missing_subcommand() {
        return ParseError("a subcommand is required",
                          "One of build, info, occupancy, trim, refine, align");
    }
};

// Argument rejected by a validator (range, choice, existing path)
class ValidationError : public ParseError {
public:
    ValidationError(const std::string& option, const std::string& reason)
        : ParseError(option + ": " + reason) {
    }
};

// Required option, positional or option value not given
class MissingArgument : public ParseError {
public:
    explicit MissingArgument(const std::string& what)
        : ParseError("missing " + what) {
    }
};

// -h/--help (exit 0)
class CallForHelp : public Error {
public:
    CallForHelp() : Error("help requested") {
    }
    int get_exit_code() const override {
        return 0;
    }
};

}  // namespace cli
}  // namespace confens
