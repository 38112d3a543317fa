#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/stage_error.hpp"

namespace core {

struct BoundingBox {
    double xmin{-21.4};
    double xmax{30.4};
    double ymin{-2.9};
    double ymax{33.1};
};

struct PathConfig {
    std::filesystem::path engine{};
    std::filesystem::path engine_work_dir{"."};
    std::filesystem::path precip{"precip/"};             // working precip archive
    std::filesystem::path ingest{"precipEF5/"};          // engine ingestion folder
    std::filesystem::path states{"states/"};
    std::filesystem::path store{"qpf_store/"};           // durable forecast store
    std::filesystem::path control_template{};
    std::filesystem::path output{"outputs/tmp_output_crest/"};
    std::filesystem::path data{"outputs/"};
};

struct NowcastConfig {
    std::string model{"convlstm"};
    std::string command{};                               // empty: persistence only
    std::size_t max_unresolved_gaps{2};
};

struct HindcastConfig {
    bool enabled{false};
    std::string timestamp{};                             // "YYYY-MM-DD HH:MM" UTC
};

struct AlertConfig {
    bool enabled{false};
    std::vector<std::string> recipients;
    std::string smtp_server{"smtp.gmail.com"};
    std::uint16_t smtp_port{587};
    std::string account{};
    std::string password{};
    std::string sender{"Real Time Model Alert"};
};

struct RemoteConfig {
    std::string base_url{"https://jsimpsonhttps.pps.eosdis.nasa.gov/imerg/gis/early/"};
    std::string credential{};                            // used as both user and password
    std::string raster_tool{"gdalwarp"};                 // empty: keep raw download
};

struct LogConfig {
    std::string file{};
    std::string level{"info"};
};

// Everything one forecast cycle needs. Passed by value into the cycle driver.
struct CycleConfig {
    std::string domain;
    std::string subdomain;
    std::string system_model{"crest"};
    BoundingBox bbox{};
    PathConfig paths{};
    std::vector<std::string> state_variables;
    NowcastConfig nowcast{};
    HindcastConfig hindcast{};
    AlertConfig alerts{};
    RemoteConfig remote{};
    ErrorPolicy policy{};
    LogConfig log{};
};

// "<MODEL> <DOMAIN> <SUBDOMAIN>" upper-cased, as used in alert subjects.
[[nodiscard]] std::string system_name(const CycleConfig& cfg);

// "<domain>_<subdomain>_<model>.txt"
[[nodiscard]] std::string control_file_name(const CycleConfig& cfg);

// Semantic checks not covered by parsing (required fields, bbox ordering, hindcast stamp).
bool validate_config(const CycleConfig& cfg, std::string& error);

} // namespace core
