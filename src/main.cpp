#include "enumerator.hpp"
#include "sync.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

void print_usage(std::ostream& out, const char* program) {
    out << "Usage: " << program << " KERNEL_TREE_TO_SYNC_TO\n"
        << "  Mirrors the tracked headers and scheduler sources of the current repository\n"
        << "  into KERNEL_TREE_TO_SYNC_TO/tools/sched_ext. Every destination must already exist.\n"
        << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> positional_args;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(std::cout, argv[0]);
            return 0;
        }
        positional_args.push_back(arg);
    }

    if (positional_args.size() != 1) {
        print_usage(std::cerr, argv[0]);
        return 1;
    }

    const std::filesystem::path kernel_tree = positional_args[0];

    try {
        scxsync::GitFileEnumerator enumerator(std::filesystem::current_path());
        scxsync::TreeSyncer syncer;
        scxsync::SyncStats stats = syncer.synchronize(enumerator, std::filesystem::current_path(), kernel_tree);
        scxsync::print_report(stats);
    } catch (const scxsync::MissingDestinationsError& ex) {
        std::cerr << "Synchronization aborted: " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Synchronization failed: " << ex.what() << std::endl;
        return 1;
    }

    return 0;
}
