#pragma once

// Minimal command line parser for confens
//
// Features:
// - Subcommands (confens <build|info|occupancy|trim|refine|align>)
// - Positional arguments, including one trailing multi-value positional
// - Named options (--subset calpha, --subset=calpha) and boolean flags
// - Type parsing (string, int, float, bool, comma-separated lists)
// - Validators (ExistingFile, ExistingDirectory, Range, OpenClosedRange, Choice)
// - Automatic help generation

#include "errors.h"
#include "types.h"
#include "validators.h"
#include "option.h"
#include "app.h"
#include "formatter.h"

namespace confens {
namespace cli {

// Parse + error handling in one statement
#define CONFENS_PARSE(app, argc, argv)       \
    try {                                    \
        app.parse(argc, argv);               \
    } catch (const confens::cli::Error& e) { \
        return app.exit(e);                  \
    }

}  // namespace cli
}  // namespace confens
