#include "easylogging++.h"

#include "PromptGuardApp.hpp"
#include "PromptGuardConfig.hpp"
#include "security/SecurityErrors.hpp"

#include <boost/program_options.hpp>

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#ifdef __GNUC__
#include <execinfo.h>
#include <unistd.h>
#endif

INITIALIZE_EASYLOGGINGPP

#ifdef __GNUC__
void SignalHandler(int sig);
#endif

int main(int argc, const char* argv[]) {
#ifdef __GNUC__
    signal(SIGSEGV, SignalHandler);
#endif

    PromptGuardConfig config;
    try {
        config = BuildConfiguration(argc, argv);
    } catch (const boost::program_options::error& e) {
        std::cerr << "Invalid option: " << e.what() << "\n";
        return EXIT_FAILURE;
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << "\n";
        return EXIT_FAILURE;
    }

    el::Loggers::setDefaultConfigurations(el::Configurations{config.loggerConfig}, true);
    START_EASYLOGGINGPP(argc, argv);

    try {
        PromptGuardApp app{config};
        app.Run(std::cin, std::cout);
    } catch (const security::ConfigurationException& e) {
        LOG(ERROR) << e.what();
        std::cerr << e.what() << "\n";
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

#ifdef __GNUC__
void SignalHandler(int sig) {
    const int BACKTRACE_LIMIT = 10;
    void *arr[BACKTRACE_LIMIT];
    auto size = backtrace(arr, BACKTRACE_LIMIT);

    fprintf(stderr, "Error: signal %d:\n", sig);
    backtrace_symbols_fd(arr, size, STDERR_FILENO);
    exit(1);
}
#endif
