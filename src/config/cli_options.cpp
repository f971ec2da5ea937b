#include "config/cli_options.hpp"

#include <format>

namespace logictest {

Result<CliOptions> parse_cli_args(const std::vector<std::string>& args) {
    using R = Result<CliOptions>;
    CliOptions options;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        // Flags that take a value
        std::optional<std::string>* target = nullptr;
        if (arg == "--config" || arg == "-c") target = &options.config_file;
        else if (arg == "--engine" || arg == "-e") target = &options.engine;
        else if (arg == "--connection") target = &options.connection_string;
        else if (arg == "--summary") target = &options.summary_file;
        else if (arg == "--log-level") target = &options.log_level;

        if (target) {
            if (i + 1 >= args.size()) {
                return R::error(ErrorCategory::CONFIG_ERROR,
                    std::format("{} requires a value", arg));
            }
            *target = args[++i];
            continue;
        }

        if (arg == "--generate") {
            options.generate = true;
        } else if (arg == "--truncate-queries") {
            options.truncate_queries = true;
        } else if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            return R::error(ErrorCategory::CONFIG_ERROR,
                std::format("unknown option '{}'", arg));
        } else {
            options.paths.push_back(arg);
        }
    }

    return R::ok(std::move(options));
}

void apply_cli_overrides(RunnerConfig& config, const CliOptions& cli) {
    if (cli.engine) config.engine = *cli.engine;
    if (cli.connection_string) config.connection_string = *cli.connection_string;
    if (cli.summary_file) config.summary_file = *cli.summary_file;
    if (cli.log_level) config.logging.level = *cli.log_level;
    if (cli.generate) config.generate = true;
    if (cli.truncate_queries) config.truncate_queries = true;
    if (!cli.paths.empty()) config.paths = cli.paths;
}

std::string usage_text(const std::string& program) {
    return std::format(
        "Usage: {} [options] PATH...\n"
        "\n"
        "Runs sqllogictest files (or every *.test file under a directory)\n"
        "against a database engine.\n"
        "\n"
        "Options:\n"
        "  -c, --config FILE      TOML config file\n"
        "  -e, --engine NAME      Engine under test (postgresql, mysql)\n"
        "      --connection STR   Engine connection string\n"
        "      --generate         Write <file>.generated with observed results\n"
        "      --truncate-queries Shorten long queries in result lines\n"
        "      --summary FILE     Write a JSON run summary\n"
        "      --log-level LEVEL  info, warn or error\n"
        "  -h, --help             Show this message\n",
        program);
}

} // namespace logictest
