#include "cli.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "preflight.hpp"
#include "process.hpp"
#include "signals.hpp"
#include "transfer.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    std::string program = argc > 0 ? argv[0] : "nc_wire";

    try {
        ncwire::install_signal_handlers();

        std::vector<std::string> config_warnings;
        ncwire::TransferConfig config = ncwire::load_config_from_env(config_warnings);
        ncwire::PosixCommandRunner runner;

        // Tools first, before anything acts on the arguments
        ncwire::check_dependencies(runner, config.tools);

        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }
        ncwire::TransferRequest request = ncwire::parse_args(args);
        ncwire::set_verbosity(request.verbosity);

        for (const auto& warning : config_warnings) {
            LOG_WARN(warning);
        }

        LOG_DEBUG("tools: nc=" << config.tools.nc << " ssh=" << config.tools.ssh
                  << " pv=" << config.tools.pv << " hash=" << config.tools.hash
                  << ", remote nc=" << config.tools.remote_nc << " hash=" << config.tools.remote_hash
                  << ", grace " << config.grace_period.count() << " ms");

        ncwire::TransferOutcome outcome = ncwire::execute_transfer(request, config, runner);

        LOG_INFO("Transfer completed successfully");
        return outcome.exit_code();

    } catch (const ncwire::TransferError& e) {
        if (e.kind() == ncwire::ErrorKind::InvalidInvocation) {
            std::cerr << "Error: " << e.what() << std::endl;
            ncwire::print_help(std::cout, program);
            return 1;
        }
        LOG_ERROR(e.what());
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR(e.what());
        return 1;
    }
}
