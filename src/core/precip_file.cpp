#include "core/precip_file.hpp"

#include <system_error>

namespace core {
namespace {

constexpr std::string_view kProduct = "imerg";
constexpr std::string_view kSuffix = ".30minAccum.tif";

// Splits "a.b.c" into its dot separated tokens.
std::vector<std::string_view> split_dots(std::string_view s) {
    std::vector<std::string_view> out;
    std::size_t start = 0;
    while (true) {
        const auto pos = s.find('.', start);
        if (pos == std::string_view::npos) {
            out.push_back(s.substr(start));
            break;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

} // namespace

std::string precip_file_name(PrecipKind kind, TimePoint ts) {
    std::string name(kProduct);
    name += '.';
    name += kind_name(kind);
    name += '.';
    name += util::stamp12(ts);
    name += kSuffix;
    return name;
}

std::optional<PrecipFile> classify_precip(const std::filesystem::path& path) {
    const std::string name = path.filename().string();
    const auto tokens = split_dots(name);
    // imerg . qpe . YYYYMMDDHHMM . 30minAccum . tif
    if (tokens.size() < 4 || tokens.back() != "tif") {
        return std::nullopt;
    }
    PrecipFile pf{};
    if (tokens[1] == "qpe") {
        pf.kind = PrecipKind::Observed;
    } else if (tokens[1] == "qpf") {
        pf.kind = PrecipKind::Forecast;
    } else {
        return std::nullopt;
    }
    const auto ts = util::parse_stamp12(tokens[2]);
    if (!ts || !util::on_cadence(*ts)) {
        return std::nullopt;
    }
    pf.timestamp = *ts;
    pf.path = path;
    return pf;
}

std::string to_observed_name(std::string_view file_name) {
    std::string out(file_name);
    const auto parsed = classify_precip(std::filesystem::path(out));
    if (!parsed || parsed->kind != PrecipKind::Forecast) {
        return out;
    }
    const auto first_dot = out.find('.');
    out.replace(first_dot + 1, 3, kind_name(PrecipKind::Observed));
    return out;
}

bool scan_precip_dir(const std::filesystem::path& dir,
                     std::vector<PrecipFile>& out,
                     std::string& error) {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        error = "cannot list " + dir.string() + ": " + ec.message();
        return false;
    }
    for (const auto end = std::filesystem::directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            error = "listing " + dir.string() + " interrupted: " + ec.message();
            return false;
        }
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) {
            continue;
        }
        if (auto pf = classify_precip(it->path())) {
            out.push_back(std::move(*pf));
        }
    }
    return true;
}

std::string state_file_name(std::string_view variable, TimePoint ts) {
    std::string name(variable);
    name += '_';
    name += util::state_stamp(ts);
    name += ".tif";
    return name;
}

bool is_non_zero_file(const std::filesystem::path& p) noexcept {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(p, ec) || ec) {
        return false;
    }
    const auto size = std::filesystem::file_size(p, ec);
    return !ec && size > 0;
}

} // namespace core
