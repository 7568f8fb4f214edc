#include <csignal>
#include <cstdlib>
#include <iostream>

#include <draftspace/web/DraftServer.hpp>

namespace {
void handle_signal(int) {
    DS::Serve::RequestDraftServerStop();
}
} // namespace

int main(int argc, char** argv) {
    auto options_opt = DS::Serve::ParseServeArguments(argc, argv);
    if (!options_opt) {
        return EXIT_FAILURE;
    }

    auto options = *options_opt;
    if (options.show_help) {
        DS::Serve::PrintServeUsage();
        return EXIT_SUCCESS;
    }

    auto services = DS::Serve::CreateDraftServices(options);
    if (!services) {
        std::cerr << "[draftspace] Failed to load effect catalog: " << DS::describeError(services.error()) << "\n";
        return EXIT_FAILURE;
    }

    DS::Serve::ResetDraftServerStopFlag();

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    return DS::Serve::RunDraftServer(**services, options);
}
