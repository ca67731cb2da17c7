#pragma once

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "common/cli/validators.hpp"
#include "common/logger.hpp"


namespace tickdb::tools::cli::replay {

struct Params {
    std::string config_path = "config.json";
    std::string symbol;
    std::string date;
    int64_t from            = 0;
    std::optional<int64_t> to;
    bool follow             = false;
    std::string log_level   = "warn";

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  Config    : " << config_path << "\n"
           << "  Symbol    : " << symbol << "\n"
           << "  Date      : " << date << "\n"
           << "  From      : " << from << "\n"
           << "  To        : " << (to ? std::to_string(*to) : std::string("<end>")) << "\n"
           << "  Follow    : " << (follow ? "yes" : "no") << "\n"
           << "  Log Level : " << log_level << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("-c,--config", params.config_path, "Configuration file (for sc_root)")->default_val(params.config_path);
    app.add_option("-s,--symbol", params.symbol, "Contract (e.g. -s ESM25_FUT_CME)")->required();
    app.add_option("-d,--date", params.date, "Trading date of the depth file (YYYY-MM-DD)")->check(date_validator)->required();
    app.add_option("--from", params.from, "First timestamp (microseconds, Sierra Chart epoch)")->default_val(params.from);
    auto* to_opt = app.add_option("--to", "Last timestamp to print, inclusive (microseconds, Sierra Chart epoch)");
    app.add_flag("-f,--follow", params.follow, "Keep printing records as the files grow");
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);

    app.footer(
        "Prints the time-ordered merge of a contract's time and sales and\n"
        "market depth records for one trading date."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }
    if (to_opt->count() > 0) {
        params.to = to_opt->as<int64_t>();
    }

    set_log_level(params.log_level);
    return params;
}

} // namespace tickdb::tools::cli::replay
