#pragma once

#include <string>
#include <vector>

namespace confens {
namespace cli {

class App;
class Option;

// Generates help text for applications and subcommands
class HelpFormatter {
public:
    static std::string format(const App& app);

private:
    static std::string format_usage(const App& app);
    static std::string format_positionals(const std::vector<const Option*>& positionals);
    static std::string format_options(const std::vector<const Option*>& options);
    static std::string format_subcommands(const App& app);
};

}  // namespace cli
}  // namespace confens
