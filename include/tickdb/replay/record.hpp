#pragma once

#include <cstdint>
#include <ostream>
#include <variant>
#include <vector>

#include "tickdb/core/records.hpp"


namespace tickdb::replay {

// One element of the merged stream
using Record = std::variant<DepthRecord, TasRecord>;
using Records = std::vector<Record>;

[[nodiscard]] inline int64_t timestamp_of(const Record& r) noexcept {
    return std::visit([](const auto& rec) { return rec.timestamp; }, r);
}

[[nodiscard]] inline bool is_depth(const Record& r) noexcept {
    return std::holds_alternative<DepthRecord>(r);
}

[[nodiscard]] inline bool is_tas(const Record& r) noexcept {
    return std::holds_alternative<TasRecord>(r);
}

} // namespace tickdb::replay


namespace tickdb {

// Declared here so argument-dependent lookup on the variant finds it
inline std::ostream& operator<<(std::ostream& os, const replay::Record& r) {
    std::visit([&os](const auto& rec) { os << rec; }, r);
    return os;
}

} // namespace tickdb
