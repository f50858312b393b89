#include <iostream>
#include <string>

#include "compiler.hh"
#include "compiler_options.hh"
#include "logger.hh"

int main(int argc, char* argv[]) {
    using namespace schemagen::driver;

    try {
        // Parse command-line options (handles --help, --version, --list-generators automatically)
        CompilerOptions opts = parse_command_line(argc, argv);

        LogLevel log_level = LogLevel::Normal;
        if (opts.quiet) log_level = LogLevel::Quiet;
        if (opts.verbose) log_level = LogLevel::Verbose;
        if (opts.debug) log_level = LogLevel::Debug;

        Logger logger(log_level, ColorMode::Auto);

        Compiler compiler(opts, logger);
        return compiler.compile();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
