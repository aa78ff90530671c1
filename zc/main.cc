//
// zc - ZPL label compiler driver
//

#include <iostream>

#include "compiler.hh"
#include "compiler_options.hh"
#include "logger.hh"

namespace {
    zplc::driver::LogLevel log_level_for(const zplc::driver::CompilerOptions& opts) {
        using zplc::driver::LogLevel;
        if (opts.quiet) {
            return LogLevel::Quiet;
        }
        if (opts.debug) {
            return LogLevel::Debug;
        }
        return opts.verbose ? LogLevel::Verbose : LogLevel::Normal;
    }
}

int main(int argc, char* argv[]) {
    using namespace zplc::driver;

    CompilerOptions opts;
    try {
        // --help, --version and --list-backends exit from here
        opts = parse_command_line(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "zc: " << e.what() << "\n"
                  << "Try 'zc --help' for more information.\n";
        return 2;
    }

    Logger logger(log_level_for(opts), opts.color);
    // Keep stdout for the label or the ^GF command
    logger.use_stderr_only(opts.write_stdout || opts.output_mode == OutputMode::EncodeImage);

    Compiler compiler(opts, logger);
    return compiler.compile();
}
