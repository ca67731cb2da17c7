#pragma once

#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "common/cli/validators.hpp"
#include "common/logger.hpp"


namespace tickdb::tools::cli::etl {

struct Params {
    std::string mode        = "0";            // "0" one-shot | "1" continuous
    std::string config_path = "config.json";
    std::string log_level   = "info";

    [[nodiscard]] inline bool continuous() const noexcept { return mode == "1"; }

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  Mode      : " << (continuous() ? "continuous" : "one-shot") << "\n"
           << "  Config    : " << config_path << "\n"
           << "  Log Level : " << log_level << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("mode", params.mode, "0 = process new data once, 1 = keep tailing until SIGINT/SIGTERM")->check(mode_validator)->default_val(params.mode);
    app.add_option("-c,--config", params.config_path, "Configuration file (checkpoints are written back to it)")->default_val(params.config_path);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);

    app.footer(
        "Loads new Sierra Chart time and sales and market depth records\n"
        "of every configured contract into the SQLite store."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    set_log_level(params.log_level);
    return params;
}

} // namespace tickdb::tools::cli::etl
