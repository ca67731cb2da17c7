#include "tickdb/core/config.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

#include "simdjson.h"

#include "lcr/json.hpp"
#include "lcr/log/logger.hpp"


namespace tickdb::core {

namespace {

// ------------------------------------------------------------
// Field helpers: false = present with the wrong type
// ------------------------------------------------------------
[[nodiscard]] bool read_string_(const simdjson::dom::object& obj, const char* key, std::string& out, bool& present) noexcept {
    present = false;
    auto field = obj[key];
    if (field.error()) return true;
    std::string_view sv;
    if (field.get_string().get(sv)) return false;
    out.assign(sv.data(), sv.size());
    present = true;
    return true;
}

[[nodiscard]] bool read_double_(const simdjson::dom::object& obj, const char* key, double& out) noexcept {
    auto field = obj[key];
    if (field.error()) return true;
    return !field.get_double().get(out);
}

[[nodiscard]] bool read_int_(const simdjson::dom::object& obj, const char* key, int64_t& out) noexcept {
    auto field = obj[key];
    if (field.error()) return true;
    return !field.get_int64().get(out);
}

// Accepts true/false and the 0/1 integers older configs use
[[nodiscard]] bool read_flag_(const simdjson::dom::object& obj, const char* key, bool& out) noexcept {
    auto field = obj[key];
    if (field.error()) return true;
    bool b = false;
    if (!field.get_bool().get(b)) {
        out = b;
        return true;
    }
    int64_t i = 0;
    if (!field.get_int64().get(i)) {
        out = (i != 0);
        return true;
    }
    return false;
}

[[nodiscard]] Status parse_contract_(std::string_view id, const simdjson::dom::element& elem, ContractConfig& out) {
    simdjson::dom::object obj;
    if (elem.get_object().get(obj)) {
        TDB_ERROR("[Config] Contract '" << id << "' must be an object");
        return Status::CONFIG_INVALID;
    }
    out.id.assign(id.data(), id.size());
    if (!read_flag_(obj, "tas", out.tas_enabled) ||
        !read_flag_(obj, "depth", out.depth_enabled) ||
        !read_double_(obj, "price_adj", out.price_adj) ||
        !read_int_(obj, "checkpoint_tas", out.checkpoint_tas)) {
        TDB_ERROR("[Config] Contract '" << id << "' has a field of the wrong type");
        return Status::CONFIG_INVALID;
    }
    if (out.checkpoint_tas < 0) {
        TDB_ERROR("[Config] Contract '" << id << "': checkpoint_tas must not be negative");
        return Status::CONFIG_INVALID;
    }

    auto cp = obj["checkpoint_depth"];
    if (!cp.error()) {
        simdjson::dom::object cp_obj;
        if (cp.get_object().get(cp_obj)) {
            TDB_ERROR("[Config] Contract '" << id << "': checkpoint_depth must be an object");
            return Status::CONFIG_INVALID;
        }
        bool present = false;
        if (!read_string_(cp_obj, "date", out.checkpoint_depth.date, present) ||
            !read_int_(cp_obj, "rec", out.checkpoint_depth.rec) ||
            out.checkpoint_depth.rec < 0) {
            TDB_ERROR("[Config] Contract '" << id << "': invalid checkpoint_depth");
            return Status::CONFIG_INVALID;
        }
    }
    return Status::OK;
}

} // namespace


Status Config::parse(std::string_view json, Config& out) {
    out = Config{};
    simdjson::dom::parser parser;
    simdjson::padded_string padded(json);
    simdjson::dom::element root;
    if (auto err = parser.parse(padded).get(root)) {
        TDB_ERROR("[Config] Malformed JSON: " << simdjson::error_message(err));
        return Status::CONFIG_INVALID;
    }
    simdjson::dom::object obj;
    if (root.get_object().get(obj)) {
        TDB_ERROR("[Config] Root must be an object");
        return Status::CONFIG_INVALID;
    }

    bool present = false;
    if (!read_string_(obj, "sc_root", out.sc_root, present) || !present || out.sc_root.empty()) {
        TDB_ERROR("[Config] 'sc_root' missing or invalid");
        return Status::CONFIG_INVALID;
    }
    if (!read_string_(obj, "db_path", out.db_path, present) || !present || out.db_path.empty()) {
        TDB_ERROR("[Config] 'db_path' missing or invalid");
        return Status::CONFIG_INVALID;
    }
    if (!read_double_(obj, "sleep_int", out.sleep_int) || out.sleep_int < 0.0) {
        TDB_ERROR("[Config] 'sleep_int' must be a non-negative number");
        return Status::CONFIG_INVALID;
    }

    simdjson::dom::object contracts;
    if (obj["contracts"].get_object().get(contracts)) {
        TDB_ERROR("[Config] 'contracts' missing or not an object");
        return Status::CONFIG_INVALID;
    }
    for (auto field : contracts) {
        ContractConfig c;
        Status status = parse_contract_(field.key, field.value, c);
        if (status != Status::OK) return status;
        out.contracts.push_back(std::move(c));
    }
    return Status::OK;
}

Status Config::load(const std::string& path, Config& out) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        TDB_ERROR("[Config] Configuration file not found: " << path);
        return Status::CONFIG_NOT_FOUND;
    }
    simdjson::padded_string content;
    if (auto err = simdjson::padded_string::load(path).get(content)) {
        TDB_ERROR("[Config] Failed reading " << path << ": " << simdjson::error_message(err));
        return Status::CONFIG_NOT_FOUND;
    }
    TDB_INFO("[Config] Loading configuration from: " << path);
    return parse(std::string_view(content.data(), content.size()), out);
}

std::string Config::to_json() const {
    using namespace lcr::json;
    std::string out;
    out += "{\n";
    indent(out, 1); append_string(out, "sc_root");   out += ": "; append_string(out, sc_root); out += ",\n";
    indent(out, 1); append_string(out, "sleep_int"); out += ": "; append(out, sleep_int);      out += ",\n";
    indent(out, 1); append_string(out, "db_path");   out += ": "; append_string(out, db_path); out += ",\n";
    indent(out, 1); append_string(out, "contracts"); out += ": {";
    for (std::size_t i = 0; i < contracts.size(); ++i) {
        const auto& c = contracts[i];
        out += (i == 0) ? "\n" : ",\n";
        indent(out, 2); append_string(out, c.id); out += ": {\n";
        indent(out, 3); append_string(out, "tas");            out += ": "; append(out, c.tas_enabled);    out += ",\n";
        indent(out, 3); append_string(out, "depth");          out += ": "; append(out, c.depth_enabled);  out += ",\n";
        indent(out, 3); append_string(out, "price_adj");      out += ": "; append(out, c.price_adj);      out += ",\n";
        indent(out, 3); append_string(out, "checkpoint_tas"); out += ": "; append(out, static_cast<std::int64_t>(c.checkpoint_tas)); out += ",\n";
        indent(out, 3); append_string(out, "checkpoint_depth"); out += ": {\n";
        indent(out, 4); append_string(out, "date"); out += ": "; append_string(out, c.checkpoint_depth.date); out += ",\n";
        indent(out, 4); append_string(out, "rec");  out += ": "; append(out, static_cast<std::int64_t>(c.checkpoint_depth.rec)); out += "\n";
        indent(out, 3); out += "}\n";
        indent(out, 2); out += "}";
    }
    if (!contracts.empty()) {
        out += "\n";
        indent(out, 1);
    }
    out += "}\n}\n";
    return out;
}

Status Config::save(const std::string& path) const {
    const std::string tmp = path + ".tmp";
    {
        std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
        if (!os) {
            TDB_ERROR("[Config] Cannot open " << tmp << " for writing");
            return Status::CONFIG_WRITE_FAILED;
        }
        os << to_json();
        os.flush();
        if (!os) {
            TDB_ERROR("[Config] Failed writing " << tmp);
            return Status::CONFIG_WRITE_FAILED;
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        TDB_ERROR("[Config] Failed replacing " << path << ": " << ec.message());
        std::filesystem::remove(tmp, ec);
        return Status::CONFIG_WRITE_FAILED;
    }
    return Status::OK;
}

ContractConfig* Config::find(std::string_view id) noexcept {
    for (auto& c : contracts) {
        if (c.id == id) return &c;
    }
    return nullptr;
}

const ContractConfig* Config::find(std::string_view id) const noexcept {
    for (const auto& c : contracts) {
        if (c.id == id) return &c;
    }
    return nullptr;
}

} // namespace tickdb::core
