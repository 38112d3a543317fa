#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace core {

enum class StageErrorKind : std::uint8_t {
    TransientGap,       // a precip timestep could not be found anywhere
    RemoteUnavailable,  // archive listing or download failed
    MissingState,       // no complete snapshot set inside the search window
    FileOpFailure,      // one file operation failed; the pass continued
    RunFailure,         // engine exited non-zero, was signalled, or never launched
    PrepFailure         // a stage could not do its job at all
};

enum class Stage : std::uint8_t {
    Reconcile,
    GapFill,
    Nowcast,
    States,
    Prepare,
    Execute
};

struct StageError {
    Stage stage{Stage::Reconcile};
    StageErrorKind kind{StageErrorKind::PrepFailure};
    std::string detail;
};

using StageErrors = std::vector<StageError>;

inline const char* kind_name(StageErrorKind k) noexcept {
    switch (k) {
    case StageErrorKind::TransientGap: return "TransientGap";
    case StageErrorKind::RemoteUnavailable: return "RemoteUnavailable";
    case StageErrorKind::MissingState: return "MissingState";
    case StageErrorKind::FileOpFailure: return "FileOpFailure";
    case StageErrorKind::RunFailure: return "RunFailure";
    case StageErrorKind::PrepFailure: return "PrepFailure";
    }
    return "Unknown";
}

inline const char* stage_name(Stage s) noexcept {
    switch (s) {
    case Stage::Reconcile: return "reconcile";
    case Stage::GapFill: return "gapfill";
    case Stage::Nowcast: return "nowcast";
    case Stage::States: return "states";
    case Stage::Prepare: return "prepare";
    case Stage::Execute: return "execute";
    }
    return "unknown";
}

inline bool has_kind(const StageErrors& errors, StageErrorKind kind) noexcept {
    for (const auto& e : errors) {
        if (e.kind == kind) {
            return true;
        }
    }
    return false;
}

enum class Decision : std::uint8_t { Proceed, Abort };

struct ErrorPolicy {
    bool abort_on_prep_failure{false};
};

// What the cycle driver does after a stage reported `errors`.
// Data stages (reconcile, gapfill, nowcast) only abort on PrepFailure when the policy says so;
// a PrepFailure of the prepare stage always aborts because there is no control file to run.
[[nodiscard]] inline Decision decide(const ErrorPolicy& policy, Stage stage, const StageErrors& errors) noexcept {
    for (const auto& e : errors) {
        if (e.kind != StageErrorKind::PrepFailure) {
            continue;
        }
        if (stage == Stage::Prepare || policy.abort_on_prep_failure) {
            return Decision::Abort;
        }
    }
    return Decision::Proceed;
}

} // namespace core
