#include "persist/cycle_config_loader.hpp"

#include <cctype>
#include <charconv>
#include <fstream>
#include <limits>
#include <optional>
#include <vector>

namespace persist {
namespace {

class JsonCursor {
public:
    explicit JsonCursor(std::string_view s) : src_(s) {}

    void skip_ws() const noexcept {
        while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_]))) {
            ++pos_;
        }
    }

    bool consume(char c) noexcept {
        skip_ws();
        if (pos_ < src_.size() && src_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool expect(char c) noexcept {
        skip_ws();
        if (pos_ >= src_.size() || src_[pos_] != c) {
            return false;
        }
        ++pos_;
        return true;
    }

    std::optional<std::string> parse_string(std::string& err) noexcept {
        skip_ws();
        if (pos_ >= src_.size() || src_[pos_] != '"') {
            err = "Expected string";
            return std::nullopt;
        }
        ++pos_; // skip opening quote
        std::string out;
        while (pos_ < src_.size()) {
            const char c = src_[pos_++];
            if (c == '"') {
                return out;
            }
            if (c == '\\') {
                if (pos_ >= src_.size()) {
                    err = "Invalid escape";
                    return std::nullopt;
                }
                const char esc = src_[pos_++];
                switch (esc) {
                    case '"': out.push_back('"'); break;
                    case '\\': out.push_back('\\'); break;
                    case '/': out.push_back('/'); break;
                    case 'b': out.push_back('\b'); break;
                    case 'f': out.push_back('\f'); break;
                    case 'n': out.push_back('\n'); break;
                    case 'r': out.push_back('\r'); break;
                    case 't': out.push_back('\t'); break;
                    default:
                        err = "Unsupported escape sequence";
                        return std::nullopt;
                }
            } else {
                out.push_back(c);
            }
        }
        err = "Unterminated string";
        return std::nullopt;
    }

    std::optional<std::uint64_t> parse_uint64(std::string& err) noexcept {
        skip_ws();
        const std::size_t start = pos_;
        while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) {
            ++pos_;
        }
        if (start == pos_) {
            err = "Expected integer";
            return std::nullopt;
        }
        std::uint64_t value = 0;
        const auto conv = std::from_chars(src_.data() + start, src_.data() + pos_, value);
        if (conv.ec != std::errc()) {
            err = "Invalid integer";
            return std::nullopt;
        }
        return value;
    }

    // JSON number, possibly signed, fractional or with exponent.
    std::optional<double> parse_double(std::string& err) noexcept {
        skip_ws();
        const std::size_t start = pos_;
        while (pos_ < src_.size()) {
            const char c = src_[pos_];
            if (std::isdigit(static_cast<unsigned char>(c)) || c == '-' || c == '+' || c == '.' ||
                c == 'e' || c == 'E') {
                ++pos_;
            } else {
                break;
            }
        }
        if (start == pos_) {
            err = "Expected number";
            return std::nullopt;
        }
        const char* first = src_.data() + start;
        const char* last = src_.data() + pos_;
        if (*first == '+') {
            ++first;
        }
        double value = 0.0;
        const auto conv = std::from_chars(first, last, value);
        if (conv.ec != std::errc() || conv.ptr != last) {
            err = "Invalid number";
            return std::nullopt;
        }
        return value;
    }

    std::optional<bool> parse_bool(std::string& err) noexcept {
        skip_ws();
        if (src_.substr(pos_).rfind("true", 0) == 0) { pos_ += 4; return true; }
        if (src_.substr(pos_).rfind("false", 0) == 0) { pos_ += 5; return false; }
        err = "Expected true or false";
        return std::nullopt;
    }

    bool eof() const noexcept {
        skip_ws();
        return pos_ >= src_.size();
    }

private:
    mutable std::size_t pos_{0};
    std::string_view src_;
};

// Walks "{ "key": value, ... }" and hands every key to `on_key`, which must consume the value.
template <typename Fn>
bool parse_object(JsonCursor& cur, std::string& error, Fn&& on_key) noexcept {
    if (!cur.expect('{')) { error = "Expected object"; return false; }
    while (true) {
        cur.skip_ws();
        if (cur.consume('}')) {
            return true;
        }
        std::string kerr;
        auto key = cur.parse_string(kerr);
        if (!key) { error = kerr; return false; }
        if (!cur.expect(':')) { error = "Expected ':'"; return false; }
        if (!on_key(*key)) {
            return false;
        }
        cur.skip_ws();
        if (cur.consume('}')) {
            return true;
        }
        if (!cur.consume(',')) { error = "Expected ','"; return false; }
    }
}

bool read_string(JsonCursor& cur, std::string& out, std::string& error) noexcept {
    auto v = cur.parse_string(error);
    if (!v) return false;
    out = std::move(*v);
    return true;
}

bool read_path(JsonCursor& cur, std::filesystem::path& out, std::string& error) noexcept {
    auto v = cur.parse_string(error);
    if (!v) return false;
    out = std::move(*v);
    return true;
}

bool read_bool(JsonCursor& cur, bool& out, std::string& error) noexcept {
    auto v = cur.parse_bool(error);
    if (!v) return false;
    out = *v;
    return true;
}

bool read_double(JsonCursor& cur, double& out, std::string& error) noexcept {
    auto v = cur.parse_double(error);
    if (!v) return false;
    out = *v;
    return true;
}

bool read_string_array(JsonCursor& cur, std::vector<std::string>& out, std::string& error) noexcept {
    if (!cur.expect('[')) { error = "Expected array"; return false; }
    std::vector<std::string> values;
    while (true) {
        cur.skip_ws();
        if (cur.consume(']')) break;
        auto v = cur.parse_string(error);
        if (!v) return false;
        values.push_back(std::move(*v));
        cur.skip_ws();
        if (cur.consume(']')) break;
        if (!cur.consume(',')) { error = "Expected ','"; return false; }
    }
    out = std::move(values);
    return true;
}

bool parse_bbox(JsonCursor& cur, core::BoundingBox& bbox, std::string& error) noexcept {
    return parse_object(cur, error, [&](const std::string& key) {
        if (key == "xmin") return read_double(cur, bbox.xmin, error);
        if (key == "xmax") return read_double(cur, bbox.xmax, error);
        if (key == "ymin") return read_double(cur, bbox.ymin, error);
        if (key == "ymax") return read_double(cur, bbox.ymax, error);
        error = "Unknown bbox field: " + key;
        return false;
    });
}

bool parse_paths(JsonCursor& cur, core::PathConfig& paths, std::string& error) noexcept {
    return parse_object(cur, error, [&](const std::string& key) {
        if (key == "engine") return read_path(cur, paths.engine, error);
        if (key == "engine_work_dir") return read_path(cur, paths.engine_work_dir, error);
        if (key == "precip") return read_path(cur, paths.precip, error);
        if (key == "ingest") return read_path(cur, paths.ingest, error);
        if (key == "states") return read_path(cur, paths.states, error);
        if (key == "store") return read_path(cur, paths.store, error);
        if (key == "template") return read_path(cur, paths.control_template, error);
        if (key == "output") return read_path(cur, paths.output, error);
        if (key == "data") return read_path(cur, paths.data, error);
        error = "Unknown paths field: " + key;
        return false;
    });
}

bool parse_nowcast(JsonCursor& cur, core::NowcastConfig& nc, std::string& error) noexcept {
    return parse_object(cur, error, [&](const std::string& key) {
        if (key == "model") return read_string(cur, nc.model, error);
        if (key == "command") return read_string(cur, nc.command, error);
        if (key == "max_unresolved_gaps") {
            auto v = cur.parse_uint64(error);
            if (!v) return false;
            nc.max_unresolved_gaps = static_cast<std::size_t>(*v);
            return true;
        }
        error = "Unknown nowcast field: " + key;
        return false;
    });
}

bool parse_hindcast(JsonCursor& cur, core::HindcastConfig& hc, std::string& error) noexcept {
    return parse_object(cur, error, [&](const std::string& key) {
        if (key == "enabled") return read_bool(cur, hc.enabled, error);
        if (key == "timestamp") return read_string(cur, hc.timestamp, error);
        error = "Unknown hindcast field: " + key;
        return false;
    });
}

bool parse_alerts(JsonCursor& cur, core::AlertConfig& ac, std::string& error) noexcept {
    return parse_object(cur, error, [&](const std::string& key) {
        if (key == "enabled") return read_bool(cur, ac.enabled, error);
        if (key == "recipients") return read_string_array(cur, ac.recipients, error);
        if (key == "smtp_server") return read_string(cur, ac.smtp_server, error);
        if (key == "smtp_port") {
            auto v = cur.parse_uint64(error);
            if (!v) return false;
            if (*v == 0 || *v > std::numeric_limits<std::uint16_t>::max()) {
                error = "smtp_port out of range";
                return false;
            }
            ac.smtp_port = static_cast<std::uint16_t>(*v);
            return true;
        }
        if (key == "account") return read_string(cur, ac.account, error);
        if (key == "password") return read_string(cur, ac.password, error);
        if (key == "sender") return read_string(cur, ac.sender, error);
        error = "Unknown alerts field: " + key;
        return false;
    });
}

bool parse_remote(JsonCursor& cur, core::RemoteConfig& rc, std::string& error) noexcept {
    return parse_object(cur, error, [&](const std::string& key) {
        if (key == "base_url") return read_string(cur, rc.base_url, error);
        if (key == "credential") return read_string(cur, rc.credential, error);
        if (key == "raster_tool") return read_string(cur, rc.raster_tool, error);
        error = "Unknown remote field: " + key;
        return false;
    });
}

bool parse_policy(JsonCursor& cur, core::ErrorPolicy& policy, std::string& error) noexcept {
    return parse_object(cur, error, [&](const std::string& key) {
        if (key == "abort_on_prep_failure") return read_bool(cur, policy.abort_on_prep_failure, error);
        error = "Unknown policy field: " + key;
        return false;
    });
}

bool parse_log(JsonCursor& cur, core::LogConfig& lc, std::string& error) noexcept {
    return parse_object(cur, error, [&](const std::string& key) {
        if (key == "file") return read_string(cur, lc.file, error);
        if (key == "level") return read_string(cur, lc.level, error);
        error = "Unknown log field: " + key;
        return false;
    });
}

bool load_file(const std::filesystem::path& path, std::string& out, std::string& error) noexcept {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "Failed to open file: " + path.string();
        return false;
    }
    in.seekg(0, std::ios::end);
    const auto len = in.tellg();
    if (len < 0) {
        error = "Failed to size file: " + path.string();
        return false;
    }
    out.resize(static_cast<std::size_t>(len));
    in.seekg(0, std::ios::beg);
    if (!in.read(out.data(), static_cast<std::streamsize>(out.size()))) {
        error = "Failed to read file: " + path.string();
        return false;
    }
    return true;
}

} // namespace

bool parse_cycle_config(std::string_view json,
                        core::CycleConfig& out,
                        std::string& error) noexcept {
    JsonCursor cur(json);
    core::CycleConfig cfg;
    bool seen_domain = false;
    bool seen_subdomain = false;
    bool seen_states = false;
    const bool ok = parse_object(cur, error, [&](const std::string& key) {
        if (key == "domain") { seen_domain = true; return read_string(cur, cfg.domain, error); }
        if (key == "subdomain") { seen_subdomain = true; return read_string(cur, cfg.subdomain, error); }
        if (key == "system_model") return read_string(cur, cfg.system_model, error);
        if (key == "bbox") return parse_bbox(cur, cfg.bbox, error);
        if (key == "paths") return parse_paths(cur, cfg.paths, error);
        if (key == "state_variables") {
            seen_states = true;
            return read_string_array(cur, cfg.state_variables, error);
        }
        if (key == "nowcast") return parse_nowcast(cur, cfg.nowcast, error);
        if (key == "hindcast") return parse_hindcast(cur, cfg.hindcast, error);
        if (key == "alerts") return parse_alerts(cur, cfg.alerts, error);
        if (key == "remote") return parse_remote(cur, cfg.remote, error);
        if (key == "policy") return parse_policy(cur, cfg.policy, error);
        if (key == "log") return parse_log(cur, cfg.log, error);
        error = "Unknown field: " + key;
        return false;
    });
    if (!ok) {
        return false;
    }
    if (!cur.eof()) {
        error = "Trailing content after config object";
        return false;
    }
    if (!(seen_domain && seen_subdomain && seen_states)) {
        error = "Missing required fields (domain, subdomain, state_variables)";
        return false;
    }
    if (!core::validate_config(cfg, error)) {
        return false;
    }
    out = std::move(cfg);
    return true;
}

bool load_cycle_config(const std::filesystem::path& path,
                       core::CycleConfig& out,
                       std::string& error) noexcept {
    std::string contents;
    if (!load_file(path, contents, error)) {
        return false;
    }
    if (!parse_cycle_config(contents, out, error)) {
        error = path.string() + ": " + error;
        return false;
    }
    return true;
}

} // namespace persist
