#include <resmerge/driver/Driver.hpp>

#include <resmerge/link/Orchestrator.hpp>
#include <resmerge/log/Reporter.hpp>

namespace resmerge::driver {

link::RunConfig effective_config(const cli::Options& opt, const config::Settings& settings) {
    link::RunConfig cfg = opt.run;
    const auto& amb = opt.ambient;

    if (settings.aapt2) cfg.aapt2_path = *settings.aapt2;
    if (settings.cwebp) cfg.webp_binary = *settings.cwebp;
    if (settings.jobs) cfg.jobs = static_cast<unsigned>(*settings.jobs);
    if (settings.debug_root) cfg.debug_temp_dir = *settings.debug_root;
    if (settings.keep_workspace) cfg.keep_workspace = *settings.keep_workspace;
    cfg.ignored_stderr = settings.ignored_stderr;

    if (amb.aapt2) cfg.aapt2_path = *amb.aapt2;
    if (amb.cwebp) cfg.webp_binary = *amb.cwebp;
    if (amb.jobs) cfg.jobs = *amb.jobs;
    if (amb.debug_root) cfg.debug_temp_dir = *amb.debug_root;
    if (amb.keep_workspace) cfg.keep_workspace = *amb.keep_workspace;
    for (const auto& p : amb.ignored_stderr) cfg.ignored_stderr.push_back(p);
    return cfg;
}

int run(const cli::Options& opt) {
    log::Reporter reporter{};
    diag::Bag bag{};

    config::Settings settings{};
    if (opt.config_path && !config::load_settings(*opt.config_path, settings, bag)) {
        reporter.report(bag);
        return 1;
    }

    log::ColorMode color = log::ColorMode::kAuto;
    if (settings.color && !log::parse_color_mode(*settings.color, color)) {
        bag.warning(diag::Code::kConfigurationContradiction, opt.config_path->string(),
                    "ui.color must be auto, always or never; using auto");
    }
    if (opt.ambient.color) color = *opt.ambient.color;
    reporter.set_color(color);
    reporter.set_progress(opt.ambient.progress.value_or(settings.progress.value_or(true)));
    reporter.set_verbose(opt.ambient.verbose.value_or(settings.verbose.value_or(false)));

    link::Orchestrator orchestrator(effective_config(opt, settings), reporter);
    const bool ok = orchestrator.run(bag);
    reporter.report(bag);
    if (!ok) {
        reporter.fail("stopped after " + std::string(merge::state_name(orchestrator.tracker().state())) + " with " +
                      std::to_string(bag.error_count()) + " error(s)");
        return 1;
    }
    return 0;
}

} // namespace resmerge::driver
