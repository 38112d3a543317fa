#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>

#include "core/cycle_clock.hpp"
#include "core/stage_error.hpp"
#include "persist/file_ops.hpp"

namespace persist {

struct ArchivePaths {
    std::filesystem::path working;   // rolling precip archive
    std::filesystem::path store;     // durable store of superseded forecasts
    std::filesystem::path ingest;    // engine ingestion folder
};

struct ReconcileCounters {
    std::uint64_t expired_observed{0};
    std::uint64_t migrated_forecasts{0};
    std::uint64_t duplicate_observed{0};
    std::uint64_t expired_store{0};
    std::uint64_t staged{0};
    std::uint64_t renamed{0};
    std::uint64_t purged{0};
    std::uint64_t file_failures{0};
};

struct ReconcileReport {
    ReconcileCounters counters{};
    core::StageErrors errors;
};

// Sole owner of deletions and relocations inside the precip archive and durable store.
// Every per-file operation is guarded independently: a failure is recorded as a
// FileOpFailure and the pass moves on to the next file.
class ArchiveReconciler {
public:
    explicit ArchiveReconciler(ArchivePaths paths, std::unique_ptr<IFileOps> ops = nullptr);

    // Steps 1-5: classify, expire old observed, migrate expired forecasts to the store,
    // purge probable duplicate observed files, expire store entries.
    ReconcileReport reconcile(const core::CycleClock& clock);

    // Step 6: empty the ingestion folder, copy the working folder into it and give every
    // file the observed naming convention.
    ReconcileReport stage_for_ingestion();

    // Empties the ingestion folder once the engine is done with it.
    ReconcileReport purge_ingestion();

    const ArchivePaths& paths() const noexcept { return paths_; }

private:
    void record_failure(ReconcileReport& report, const char* op,
                        const std::filesystem::path& p, const std::error_code& ec);

    ArchivePaths paths_;
    std::unique_ptr<IFileOps> ops_;
};

} // namespace persist
