#include "../include/cli.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <iostream>

int main(int argc, char** argv) {
    try {
        CliOptions opts = parse_cli(argc, argv, config_from_env());
        if (opts.mode == RunMode::help) {
            print_usage(argv[0]);
            return 0;
        }
        run_cli(opts);
        return 0;
    } catch (const FetchError& e) {
        if (e.kind() == ErrorKind::usage) print_usage(argv[0]);
        if (!e.context().empty()) log_info("Response (last): " + e.context());
        log_error(std::string(error_kind_name(e.kind())) + ": " + e.what());
        return 1;
    } catch (const std::exception& e) {
        log_error(e.what());
        return 1;
    }
}
