#include <exception>
#include <iostream>

#include "compiler.hh"
#include "compiler_options.hh"
#include "logger.hh"

int main(int argc, char* argv[]) {
    using namespace typeshape::driver;

    CompilerOptions opts;
    try {
        opts = parse_command_line(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "tsh: " << e.what() << "\n"
                  << "Try '" << argv[0] << " --help' for more information.\n";
        return 1;
    }

    Logger logger(opts.verbosity, opts.color);
    Compiler compiler(opts, logger);
    return compiler.compile();
}
