#include <resmerge/Version.hpp>
#include <resmerge/cli/Options.hpp>
#include <resmerge/driver/Driver.hpp>
#include <resmerge/log/Reporter.hpp>

#include <iostream>

int main(int argc, char** argv) {
    const auto opt = resmerge::cli::parse_options(argc, argv);

    if (!opt.ok) {
        resmerge::log::Reporter reporter{};
        reporter.fail("error: " + opt.error);
        resmerge::cli::print_usage(std::cerr);
        return 1;
    }

    if (opt.mode == resmerge::cli::Mode::kVersion) {
        std::cout << resmerge::k_version_string << "\n";
        return 0;
    }

    if (opt.mode == resmerge::cli::Mode::kUsage) {
        resmerge::cli::print_usage(std::cout);
        return 0;
    }

    return resmerge::driver::run(opt);
}
