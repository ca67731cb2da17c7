#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "tickdb/core/layout.hpp"


namespace tickdb::tools::cli {

// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::IsMember({"trace", "debug", "info", "warn", "error", "fatal", "off"});


// -------------------------------------------------------------
// Run mode validator (0 = one-shot, 1 = continuous)
// -------------------------------------------------------------
inline auto mode_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value == "0" || value == "1") {
            return {};
        }
        return "Mode must be 0 (one-shot) or 1 (continuous)";
    },
    "Run mode validator"
);


// -------------------------------------------------------------
// Trading date validator
// -------------------------------------------------------------
inline auto date_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (core::is_iso_date(value)) {
            return {};
        }
        return "Date must be in format YYYY-MM-DD (e.g. 2025-04-01)";
    },
    "Trading date validator"
);

} // namespace tickdb::tools::cli
