#pragma once

#include <resmerge/cli/Options.hpp>
#include <resmerge/config/Settings.hpp>
#include <resmerge/link/RunConfig.hpp>

namespace resmerge::driver {

/// Settings file first, then command-line flags over it.
link::RunConfig effective_config(const cli::Options& opt, const config::Settings& settings);

int run(const cli::Options& opt);

} // namespace resmerge::driver
