#include "cli/utils.hpp"

#include <iostream>

namespace stencil::cli {

Result<lexer::Source, std::string> load_template_source(const std::string& arg) {
    if (arg.size() > 1 && arg[0] == '@') {
        return lexer::Source::from_file(arg.substr(1));
    }
    return lexer::Source::from_string(arg, StencilOptions::default_source_name);
}

void print_usage() {
    std::cout << "Stencil " << VERSION << "\n\n";
    std::cout << "Usage: stencil <command> [options] <template> [records]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  parse     Print the syntax tree of a template\n";
    std::cout << "  check     Compile a template against the commit keywords\n";
    std::cout << "  render    Render a template for each commit of a records file\n";
    std::cout << "\nA template argument starting with '@' names a file.\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --help, -h              Show this help\n";
    std::cout << "  --version, -V           Show version\n";
    std::cout << "  --config=<style.toml>   Label colors for render\n";
    std::cout << "  --color=<when>          always, never or auto (default)\n";
    std::cout << "  --syntax                parse: print the raw syntax tree\n";
    std::cout << "  --error-format=json     Emit diagnostics as JSON\n";
    std::cout << "  --log-level=<level>     trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=<spec>     Per-module levels, e.g. build=debug,*=warn\n";
    std::cout << "  --log-file=<path>       Also write logs to a file\n";
    std::cout << "  -v, -vv, -vvv, -q       Raise or lower log verbosity\n";
}

void print_version() {
    std::cout << "stencil " << VERSION << "\n";
}

} // namespace stencil::cli
