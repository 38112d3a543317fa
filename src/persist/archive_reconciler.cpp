#include "persist/archive_reconciler.hpp"

#include <string>
#include <utility>
#include <vector>

#include "core/precip_file.hpp"
#include "util/log.hpp"

namespace persist {

using core::PrecipFile;
using core::PrecipKind;

ArchiveReconciler::ArchiveReconciler(ArchivePaths paths, std::unique_ptr<IFileOps> ops)
    : paths_(std::move(paths)), ops_(std::move(ops)) {
    if (!ops_) {
        ops_ = std::make_unique<PosixFileOps>();
    }
}

void ArchiveReconciler::record_failure(ReconcileReport& report, const char* op,
                                       const std::filesystem::path& p, const std::error_code& ec) {
    ++report.counters.file_failures;
    const std::string detail = std::string(op) + " " + p.string() + ": " + ec.message();
    util::log(util::LogLevel::Warn, "ArchiveReconciler: %s", detail.c_str());
    report.errors.push_back({core::Stage::Reconcile, core::StageErrorKind::FileOpFailure, detail});
}

ReconcileReport ArchiveReconciler::reconcile(const core::CycleClock& clock) {
    ReconcileReport report{};

    std::vector<PrecipFile> files;
    std::string err;
    if (!core::scan_precip_dir(paths_.working, files, err)) {
        util::log(util::LogLevel::Error, "ArchiveReconciler: %s", err.c_str());
        report.errors.push_back({core::Stage::Reconcile, core::StageErrorKind::PrepFailure, err});
        return report;
    }

    std::vector<PrecipFile> observed;
    std::vector<PrecipFile> forecasts;
    for (auto& f : files) {
        (f.kind == PrecipKind::Observed ? observed : forecasts).push_back(std::move(f));
    }

    const auto observed_expiry = clock.observed_expiry();
    util::log(util::LogLevel::Info, "Deleting observed files older than %s",
              util::human_stamp(observed_expiry).c_str());
    std::vector<PrecipFile> kept_observed;
    for (auto& f : observed) {
        if (f.timestamp < observed_expiry) {
            const auto r = ops_->remove(f.path);
            if (r.ok) {
                ++report.counters.expired_observed;
                continue;
            }
            record_failure(report, "remove", f.path, r.error);
        }
        kept_observed.push_back(std::move(f));
    }

    util::log(util::LogLevel::Info, "Moving forecast files older than %s into %s",
              util::human_stamp(clock.current).c_str(), paths_.store.string().c_str());
    const auto store_ready = ops_->ensure_dir(paths_.store);
    if (!store_ready.ok) {
        record_failure(report, "mkdir", paths_.store, store_ready.error);
    }
    for (const auto& f : forecasts) {
        if (f.timestamp >= clock.current) {
            continue;
        }
        const auto dest = paths_.store / f.path.filename();
        const auto copied = ops_->copy_overwrite(f.path, dest);
        if (!copied.ok) {
            // Keep the only copy rather than lose a forecast frame.
            record_failure(report, "copy", f.path, copied.error);
            continue;
        }
        const auto removed = ops_->remove(f.path);
        if (!removed.ok) {
            record_failure(report, "remove", f.path, removed.error);
            continue;
        }
        ++report.counters.migrated_forecasts;
    }

    const auto dup_bound = clock.duplicate_bound();
    util::log(util::LogLevel::Info, "Deleting observed files newer than %s (probable duplicates)",
              util::human_stamp(dup_bound).c_str());
    for (const auto& f : kept_observed) {
        if (f.timestamp <= dup_bound) {
            continue;
        }
        const auto r = ops_->remove(f.path);
        if (r.ok) {
            ++report.counters.duplicate_observed;
        } else {
            record_failure(report, "remove", f.path, r.error);
        }
    }

    const auto store_expiry = clock.store_expiry();
    util::log(util::LogLevel::Info, "Deleting store files older than %s",
              util::human_stamp(store_expiry).c_str());
    std::vector<PrecipFile> stored;
    if (!core::scan_precip_dir(paths_.store, stored, err)) {
        ++report.counters.file_failures;
        util::log(util::LogLevel::Warn, "ArchiveReconciler: %s", err.c_str());
        report.errors.push_back({core::Stage::Reconcile, core::StageErrorKind::FileOpFailure, err});
    }
    for (const auto& f : stored) {
        if (f.timestamp >= store_expiry) {
            continue;
        }
        const auto r = ops_->remove(f.path);
        if (r.ok) {
            ++report.counters.expired_store;
        } else {
            record_failure(report, "remove", f.path, r.error);
        }
    }

    util::log(util::LogLevel::Info,
              "Reconcile done: expired=%llu migrated=%llu duplicates=%llu store_expired=%llu failures=%llu",
              static_cast<unsigned long long>(report.counters.expired_observed),
              static_cast<unsigned long long>(report.counters.migrated_forecasts),
              static_cast<unsigned long long>(report.counters.duplicate_observed),
              static_cast<unsigned long long>(report.counters.expired_store),
              static_cast<unsigned long long>(report.counters.file_failures));
    return report;
}

ReconcileReport ArchiveReconciler::stage_for_ingestion() {
    ReconcileReport report{};

    const auto ready = ops_->ensure_dir(paths_.ingest);
    if (!ready.ok) {
        const std::string detail = "mkdir " + paths_.ingest.string() + ": " + ready.error.message();
        util::log(util::LogLevel::Error, "ArchiveReconciler: %s", detail.c_str());
        report.errors.push_back({core::Stage::Reconcile, core::StageErrorKind::PrepFailure, detail});
        return report;
    }

    // The folder must mirror the working archive; frames left by an interrupted cycle go first.
    const auto leftovers = purge_ingestion();
    if (leftovers.counters.purged != 0) {
        util::log(util::LogLevel::Warn, "Removed %llu leftover files from %s",
                  static_cast<unsigned long long>(leftovers.counters.purged), paths_.ingest.string().c_str());
    }
    report.counters.file_failures += leftovers.counters.file_failures;
    report.errors.insert(report.errors.end(), leftovers.errors.begin(), leftovers.errors.end());

    std::vector<PrecipFile> files;
    std::string err;
    if (!core::scan_precip_dir(paths_.working, files, err)) {
        util::log(util::LogLevel::Error, "ArchiveReconciler: %s", err.c_str());
        report.errors.push_back({core::Stage::Reconcile, core::StageErrorKind::PrepFailure, err});
        return report;
    }
    for (const auto& f : files) {
        const auto dest = paths_.ingest / f.path.filename();
        const auto r = ops_->copy_overwrite(f.path, dest);
        if (r.ok) {
            ++report.counters.staged;
        } else {
            record_failure(report, "copy", f.path, r.error);
        }
    }

    std::vector<PrecipFile> staged;
    if (!core::scan_precip_dir(paths_.ingest, staged, err)) {
        util::log(util::LogLevel::Error, "ArchiveReconciler: %s", err.c_str());
        report.errors.push_back({core::Stage::Reconcile, core::StageErrorKind::PrepFailure, err});
        return report;
    }
    for (const auto& f : staged) {
        if (f.kind != PrecipKind::Forecast) {
            continue;
        }
        const auto dest = paths_.ingest / core::to_observed_name(f.path.filename().string());
        const auto r = ops_->rename(f.path, dest);
        if (r.ok) {
            ++report.counters.renamed;
        } else {
            record_failure(report, "rename", f.path, r.error);
        }
    }
    util::log(util::LogLevel::Info, "Staged %llu precip files into %s (%llu renamed)",
              static_cast<unsigned long long>(report.counters.staged), paths_.ingest.string().c_str(),
              static_cast<unsigned long long>(report.counters.renamed));
    return report;
}

ReconcileReport ArchiveReconciler::purge_ingestion() {
    ReconcileReport report{};
    std::error_code ec;
    std::filesystem::directory_iterator it(paths_.ingest, ec);
    if (ec) {
        // Nothing staged means nothing to purge.
        return report;
    }
    std::vector<std::filesystem::path> victims;
    for (const auto end = std::filesystem::directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            victims.push_back(it->path());
        }
    }
    for (const auto& p : victims) {
        const auto r = ops_->remove(p);
        if (r.ok) {
            ++report.counters.purged;
        } else {
            record_failure(report, "remove", p, r.error);
        }
    }
    return report;
}

} // namespace persist
