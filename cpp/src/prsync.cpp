#include "prsync/errors.hpp"
#include "prsync/file_enumerator.hpp"
#include "prsync/logger.hpp"
#include "prsync/options.hpp"
#include "prsync/process.hpp"
#include "prsync/scheduler.hpp"
#include "prsync/transfer_executor.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

int main(int argc, char **argv) {
    const std::string program = argc > 0 ? argv[0] : "prsync";
    if (argc < 2) {
        std::cerr << prsync::usage(program);
        return EXIT_FAILURE;
    }

    try {
        prsync::Options opts = prsync::parse_options(std::vector<std::string>(argv + 1, argv + argc));
        if (opts.help) {
            std::cout << prsync::usage(program);
            return EXIT_SUCCESS;
        }

        auto rsync = prsync::find_executable(opts.rsync_binary);
        if (!rsync) {
            throw prsync::ConfigurationError("required program not found: " + opts.rsync_binary);
        }

        prsync::Logger logger(std::cerr);
        if (opts.log_file) {
            logger.open_file(*opts.log_file);
        }

        prsync::RsyncListingProvider lister(rsync->string());
        prsync::RsyncExecutor executor(rsync->string());
        prsync::Scheduler scheduler(std::move(opts), lister, executor, logger);
        return scheduler.run().exit_code();
    } catch (const prsync::Error &err) {
        std::cerr << "error: " << err.what() << std::endl;
        return EXIT_FAILURE;
    } catch (const std::exception &err) {
        // Resource failures such as std::bad_alloc or a thread that cannot be started.
        std::cerr << "error: " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
}
