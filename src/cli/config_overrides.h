#pragma once

#include "cli/parser.h"
#include "core/run_config.h"

namespace nanoflow::cli {

// Effective run configuration: defaults, then the config file (--config, or
// ~/.nanoflow/config.json when present), then command-line overrides.
// Throws core::ConfigurationError for unreadable files or malformed overrides.
core::RunConfig resolve_run_config(const ParsedArgs& args);

// Apply command-line overrides on top of a loaded configuration
void apply_overrides(core::RunConfig& config, const ParsedArgs& args);

} // namespace nanoflow::cli
