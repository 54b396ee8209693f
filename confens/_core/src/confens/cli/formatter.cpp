#include "formatter.h"
#include "app.h"
#include "option.h"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace confens {
namespace cli {

std::string HelpFormatter::format(const App& app) {
    std::ostringstream oss;

    oss << app.full_name();
    if (!app.description().empty()) {
        oss << " - " << app.description();
    }
    oss << "\n\n";

    oss << format_usage(app) << "\n\n";

    if (!app.get_subcommands().empty()) {
        oss << format_subcommands(app) << "\n\n";
    }

    if (!app.get_positionals().empty()) {
        std::vector<const Option*> positionals;
        for (const auto& pos : app.get_positionals()) {
            positionals.push_back(pos.get());
        }
        oss << format_positionals(positionals) << "\n";
    }

    std::vector<const Option*> options;
    for (const auto& opt : app.get_options()) {
        options.push_back(opt.get());
    }
    oss << format_options(options);

    return oss.str();
}

std::string HelpFormatter::format_usage(const App& app) {
    std::ostringstream oss;
    oss << "USAGE:\n  " << app.full_name();

    if (!app.get_subcommands().empty()) {
        oss << " <subcommand>";
    }

    for (const auto& pos : app.get_positionals()) {
        oss << " <" << pos->names() << (pos->consumes_remaining() ? "...>" : ">");
    }

    oss << " [options]";
    return oss.str();
}

std::string HelpFormatter::format_positionals(const std::vector<const Option*>& positionals) {
    std::ostringstream oss;
    oss << "ARGUMENTS:\n";

    for (const auto* pos : positionals) {
        oss << "  " << std::left << std::setw(28) << pos->help_text();
        oss << pos->description();
        if (pos->is_required()) {
            oss << " [REQUIRED]";
        }
        oss << "\n";
    }

    return oss.str();
}

std::string HelpFormatter::format_options(const std::vector<const Option*>& options) {
    std::ostringstream oss;
    oss << "OPTIONS:\n";
    oss << "  " << std::left << std::setw(28) << "-h,--help" << "Show this help message and exit\n";

    for (const auto* opt : options) {
        std::string head = opt->help_text();
        oss << "  " << std::left << std::setw(28) << head;
        if (head.size() >= 28) {
            oss << "\n  " << std::string(28, ' ');
        }
        oss << opt->description();
        if (opt->is_required()) {
            oss << " [REQUIRED]";
        }
        oss << "\n";
    }

    return oss.str();
}

std::string HelpFormatter::format_subcommands(const App& app) {
    std::ostringstream oss;
    oss << "SUBCOMMANDS:\n";

    size_t max_len = 0;
    for (const auto& sub : app.get_subcommands()) {
        max_len = std::max(max_len, sub->name().size());
    }

    for (const auto& sub : app.get_subcommands()) {
        oss << "  " << std::left << std::setw(static_cast<int>(max_len + 4)) << sub->name();
        oss << sub->description() << "\n";
    }

    oss << "\nUse \"" << app.full_name()
        << " <subcommand> --help\" for more information about a subcommand.";

    return oss.str();
}

}  // namespace cli
}  // namespace confens
