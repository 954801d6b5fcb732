#include "build_chain.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void print_usage(std::ostream& out, const char* program) {
    out << "Usage: " << program << " [SCHED...]\n"
        << "  Prints sequentially chained build targets for the given schedulers\n"
        << "  (default: all Rust schedulers) followed by the aggregate 'rust_scheds' target.\n"
        << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> scheds;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(std::cout, argv[0]);
            return 0;
        }
        scheds.push_back(arg);
    }
    if (scheds.empty()) {
        scheds = scxsync::default_rust_schedulers();
    }

    scxsync::BuildChainer chainer;
    try {
        for (const auto& sched : scheds) {
            chainer.add(scxsync::cargo_scheduler_target(sched));
        }
    } catch (const std::invalid_argument& ex) {
        std::cerr << "Chaining failed: " << ex.what() << std::endl;
        return 1;
    }

    std::vector<scxsync::BuildTarget> targets = chainer.targets();
    targets.push_back(chainer.aggregate("rust_scheds"));
    scxsync::write_declarations(std::cout, targets);

    return 0;
}
