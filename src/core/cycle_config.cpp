#include "core/cycle_config.hpp"

#include <algorithm>
#include <cctype>

#include "util/time.hpp"

namespace core {
namespace {

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

} // namespace

std::string system_name(const CycleConfig& cfg) {
    return upper(cfg.system_model) + " " + upper(cfg.domain) + " " + upper(cfg.subdomain);
}

std::string control_file_name(const CycleConfig& cfg) {
    return cfg.domain + "_" + cfg.subdomain + "_" + cfg.system_model + ".txt";
}

bool validate_config(const CycleConfig& cfg, std::string& error) {
    if (cfg.domain.empty() || cfg.subdomain.empty() || cfg.system_model.empty()) {
        error = "domain, subdomain and system_model are required";
        return false;
    }
    if (cfg.paths.engine.empty()) {
        error = "paths.engine is required";
        return false;
    }
    if (cfg.paths.control_template.empty()) {
        error = "paths.template is required";
        return false;
    }
    if (cfg.state_variables.empty()) {
        error = "state_variables must list at least one variable";
        return false;
    }
    for (const auto& v : cfg.state_variables) {
        if (v.empty()) {
            error = "state_variables contains an empty name";
            return false;
        }
    }
    if (!(cfg.bbox.xmin < cfg.bbox.xmax) || !(cfg.bbox.ymin < cfg.bbox.ymax)) {
        error = "bbox requires xmin < xmax and ymin < ymax";
        return false;
    }
    if (cfg.hindcast.enabled && !util::parse_human_stamp(cfg.hindcast.timestamp)) {
        error = "hindcast.timestamp must be \"YYYY-MM-DD HH:MM\", got \"" + cfg.hindcast.timestamp + "\"";
        return false;
    }
    if (cfg.alerts.enabled && cfg.alerts.recipients.empty()) {
        error = "alerts.enabled requires at least one recipient";
        return false;
    }
    return true;
}

} // namespace core
