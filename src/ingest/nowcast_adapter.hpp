#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "core/cycle_clock.hpp"
#include "core/cycle_config.hpp"
#include "core/stage_error.hpp"
#include "persist/file_ops.hpp"

namespace ingest {

using util::TimePoint;

struct PredictRequest {
    std::string model;
    std::filesystem::path input_dir;
    std::filesystem::path output_dir;
    TimePoint start{};   // first forecast frame
    TimePoint end{};     // last forecast frame
    core::BoundingBox bbox{};
};

struct PredictResult {
    bool ok{false};
    std::string error;
};

class INowcastPredictor {
public:
    virtual ~INowcastPredictor() = default;
    virtual PredictResult predict(const PredictRequest& req) = 0;
};

// Runs `<command> --model .. --input .. --output .. --start .. --end .. --bbox xmin xmax ymin ymax`.
// The command string is split on whitespace; an empty command always fails.
class CommandNowcastPredictor : public INowcastPredictor {
public:
    explicit CommandNowcastPredictor(std::string command, std::filesystem::path log_path = {});

    PredictResult predict(const PredictRequest& req) override;

    std::vector<std::string> command_line(const PredictRequest& req) const;

private:
    std::string command_;
    std::filesystem::path log_path_;
};

struct NowcastSettings {
    std::string model;
    std::size_t max_unresolved_gaps{2};
    core::BoundingBox bbox{};
};

struct NowcastReport {
    bool predictor_skipped{false};
    bool predictor_ok{false};
    std::string predictor_error;
    std::uint64_t persisted{0};            // frames written by duplication
    std::vector<TimePoint> unresolved;
    core::StageErrors errors;

    bool used_persistence() const noexcept { return persisted != 0; }
};

// Produces forecast frames for [current, current + 2.5h] and guarantees a complete
// 30-minute cadence from the gap-fill span start to the end of the nowcast.
class NowcastAdapter {
public:
    NowcastAdapter(NowcastSettings settings,
                   std::filesystem::path precip_dir,
                   std::unique_ptr<INowcastPredictor> predictor,
                   std::unique_ptr<persist::IFileOps> ops = nullptr);

    NowcastReport run(const core::CycleClock& clock, TimePoint span_start, std::size_t unresolved_gaps);

private:
    bool frames_complete(TimePoint first, TimePoint last, std::string& missing) const;
    void fill_by_persistence(TimePoint first, TimePoint last, NowcastReport& report);

    NowcastSettings settings_;
    std::filesystem::path precip_dir_;
    std::unique_ptr<INowcastPredictor> predictor_;
    std::unique_ptr<persist::IFileOps> ops_;
};

} // namespace ingest
