#include "app.h"
#include "formatter.h"
#include <iostream>

namespace confens {
namespace cli {

App::App(const std::string& name, const std::string& description)
    : name_(name), description_(description) {
}

App* App::add_subcommand(const std::string& name, const std::string& desc) {
    auto sub = std::make_unique<App>(name, desc);
    sub->parent_ = this;
    auto* ptr = sub.get();
    subcommands_.push_back(std::move(sub));
    return ptr;
}

void App::require_subcommand(bool value) {
    require_subcommand_ = value;
}

App* App::get_subcommand(const std::string& name) {
    for (auto& sub : subcommands_) {
        if (sub->name_ == name) {
            return sub.get();
        }
    }
    return nullptr;
}

const App* App::get_subcommand(const std::string& name) const {
    for (const auto& sub : subcommands_) {
        if (sub->name_ == name) {
            return sub.get();
        }
    }
    return nullptr;
}

void App::parse(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.push_back(argv[i]);
    }
    parse(args);
}

void App::parse(const std::vector<std::string>& args) {
    size_t i = 0;
    size_t positional_index = 0;

    while (i < args.size()) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            throw CallForHelp();
        }

        // Remaining arguments belong to the subcommand
        if (auto* sub = get_subcommand(arg)) {
            active_subcommand_ = sub;
            std::vector<std::string> remaining(args.begin() + i + 1, args.end());
            sub->parse(remaining);
            return;
        }

        bool matched = false;
        for (auto& opt : options_) {
            if (!opt->matches(arg)) {
                continue;
            }
            if (opt->has_embedded_value(arg)) {
                opt->parse(opt->extract_value(arg));
            } else if (opt->is_flag()) {
                opt->parse("true");
            } else {
                if (i + 1 >= args.size()) {
                    throw MissingArgument("value for " + arg);
                }
                opt->parse(args[++i]);
            }
            matched = true;
            break;
        }

        if (matched) {
            ++i;
            continue;
        }

        if (arg.size() > 1 && arg[0] == '-' && !(arg[1] >= '0' && arg[1] <= '9')) {
            throw ParseError::unknown_option(arg);
        }

        if (positional_index < positionals_.size()) {
            auto* positional = positionals_[positional_index].get();
            positional->parse(arg);
            if (!positional->consumes_remaining()) {
                ++positional_index;
            }
            ++i;
        } else {
            throw ParseError::unexpected_argument(arg);
        }
    }

    for (const auto& opt : options_) {
        if (!opt->is_satisfied()) {
            throw MissingArgument("required option " + opt->names());
        }
    }

    for (const auto& pos : positionals_) {
        if (!pos->is_satisfied()) {
            throw MissingArgument("required argument <" + pos->names() + ">");
        }
    }

    if (require_subcommand_ && !active_subcommand_) {
        throw ParseError::missing_subcommand();
    }
}

std::string App::help() const {
    return HelpFormatter::format(*this);
}

std::string App::full_name() const {
    if (parent_) {
        return parent_->full_name() + " " + name_;
    }
    return name_;
}

int App::exit(const Error& e) const {
    // Report against the innermost subcommand that was selected
    const App* target = this;
    while (target->active_subcommand_) {
        target = target->active_subcommand_;
    }

    if (dynamic_cast<const CallForHelp*>(&e)) {
        std::cout << target->help() << std::endl;
    } else {
        std::cerr << e.formatted() << std::endl;
        std::cerr << std::endl;
        std::cerr << target->help() << std::endl;
    }
    return e.get_exit_code();
}

}  // namespace cli
}  // namespace confens
