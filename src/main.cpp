#include "wrapindent/application/wrapindent_app.hpp"
#include "wrapindent/io/file_system.hpp"
#include "wrapindent/parsers/tree_dump_parser.hpp"

#include <iostream>
#include <memory>

int main(int argc, char* argv[]) {
    using namespace wrapindent;

    auto parsed = parse_args(argc, argv);
    switch (parsed.outcome) {
    case ArgsOutcome::HELP:
        std::cout << usage_text();
        return EXIT_CLEAN;
    case ArgsOutcome::ERROR:
        std::cerr << "Error: " << parsed.error_message << "\n\n" << usage_text();
        return EXIT_INPUT_ERROR;
    case ArgsOutcome::RUN:
        break;
    }

    WrapIndentApp app(std::make_unique<FileSystem>(), std::make_unique<TreeDumpParser>());
    return app.run(parsed.config);
}
