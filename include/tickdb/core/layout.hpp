#pragma once

#include <filesystem>
#include <string>
#include <string_view>


namespace tickdb::core {

// ============================================================================
// Sierra Chart data layout
// ----------------------------------------------------------------------------
//   {sc_root}/Data/{contract}.scid
//   {sc_root}/Data/MarketDepthData/{contract}.{YYYY-MM-DD}.depth
// ============================================================================

inline constexpr std::string_view DEPTH_SUFFIX = ".depth";
inline constexpr std::string_view TAS_SUFFIX   = ".scid";

[[nodiscard]] inline std::filesystem::path data_dir(const std::string& sc_root) {
    return std::filesystem::path(sc_root) / "Data";
}

[[nodiscard]] inline std::filesystem::path depth_dir(const std::string& sc_root) {
    return data_dir(sc_root) / "MarketDepthData";
}

[[nodiscard]] inline std::filesystem::path tas_path(const std::string& sc_root, std::string_view contract) {
    return data_dir(sc_root) / (std::string(contract) + std::string(TAS_SUFFIX));
}

[[nodiscard]] inline std::string depth_filename(std::string_view contract, std::string_view date) {
    std::string out;
    out.reserve(contract.size() + date.size() + DEPTH_SUFFIX.size() + 1);
    out.append(contract).append(".").append(date).append(DEPTH_SUFFIX);
    return out;
}

[[nodiscard]] inline std::filesystem::path depth_path(const std::string& sc_root, std::string_view contract, std::string_view date) {
    return depth_dir(sc_root) / depth_filename(contract, date);
}

// Fixed-width ISO date: 10 chars with '-' at 4 and 7.
// Lexicographic order of such strings is chronological order.
[[nodiscard]] inline bool is_iso_date(std::string_view s) noexcept {
    return s.size() == 10 && s[4] == '-' && s[7] == '-';
}

// Splits "{contract}.{YYYY-MM-DD}.depth" on its last '.' before the suffix.
// Returns false for any other name.
[[nodiscard]] inline bool parse_depth_filename(std::string_view name, std::string_view& contract, std::string_view& date) noexcept {
    if (name.size() <= DEPTH_SUFFIX.size()) return false;
    if (name.substr(name.size() - DEPTH_SUFFIX.size()) != DEPTH_SUFFIX) return false;
    std::string_view base = name.substr(0, name.size() - DEPTH_SUFFIX.size());
    auto dot = base.rfind('.');
    if (dot == std::string_view::npos) return false;
    std::string_view c = base.substr(0, dot);
    std::string_view d = base.substr(dot + 1);
    if (c.empty() || !is_iso_date(d)) return false;
    contract = c;
    date = d;
    return true;
}

} // namespace tickdb::core
