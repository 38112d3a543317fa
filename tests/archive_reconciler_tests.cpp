#include <gtest/gtest.h>

#include <algorithm>
#include <memory>

#include "persist/archive_reconciler.hpp"
#include "tests/harness/temp_tree.hpp"

namespace {

using core::PrecipKind;
using test::utc;

struct ArchiveFixture {
    explicit ArchiveFixture(const std::string& name)
        : tree(name),
          working(tree.dir("precip")),
          store(tree.dir("qpf_store")),
          ingest(tree.root() / "precipEF5") {}

    persist::ArchivePaths paths() const { return {working, store, ingest}; }

    test::TempTree tree;
    std::filesystem::path working;
    std::filesystem::path store;
    std::filesystem::path ingest;
};

bool contains(const std::vector<std::string>& names, const std::string& n) {
    return std::find(names.begin(), names.end(), n) != names.end();
}

// current = 09:00, failTime = 03:00, observed expiry = 23:30 the day before, duplicate bound = 05:00
TEST(ArchiveReconcilerTest, ReconcilePostConditions) {
    ArchiveFixture fx("reconcile_post");
    const auto clock = core::plan_cycle(utc(2024, 7, 4, 9, 0));

    test::put_precip(fx.working, PrecipKind::Observed, utc(2024, 7, 3, 23, 0));   // expired
    test::put_precip(fx.working, PrecipKind::Observed, utc(2024, 7, 3, 23, 30));  // kept (boundary)
    test::put_precip(fx.working, PrecipKind::Observed, utc(2024, 7, 4, 5, 0));    // kept (boundary)
    test::put_precip(fx.working, PrecipKind::Observed, utc(2024, 7, 4, 5, 30));   // duplicate
    test::put_precip(fx.working, PrecipKind::Forecast, utc(2024, 7, 4, 8, 30));   // migrated
    test::put_precip(fx.working, PrecipKind::Forecast, utc(2024, 7, 4, 9, 0));    // kept
    test::write_file(fx.working / "notes.txt");
    test::put_precip(fx.store, PrecipKind::Forecast, utc(2024, 7, 4, 4, 30));     // store expired
    test::put_precip(fx.store, PrecipKind::Forecast, utc(2024, 7, 4, 5, 0));      // store kept

    persist::ArchiveReconciler rec(fx.paths());
    const auto report = rec.reconcile(clock);

    EXPECT_TRUE(report.errors.empty());
    EXPECT_EQ(report.counters.expired_observed, 1u);
    EXPECT_EQ(report.counters.migrated_forecasts, 1u);
    EXPECT_EQ(report.counters.duplicate_observed, 1u);
    EXPECT_EQ(report.counters.expired_store, 1u);

    const auto working = test::list_names(fx.working);
    EXPECT_EQ(working, (std::vector<std::string>{
                           "imerg.qpe.202407032330.30minAccum.tif",
                           "imerg.qpe.202407040500.30minAccum.tif",
                           "imerg.qpf.202407040900.30minAccum.tif",
                           "notes.txt",
                       }));
    const auto store = test::list_names(fx.store);
    EXPECT_EQ(store, (std::vector<std::string>{
                         "imerg.qpf.202407040500.30minAccum.tif",
                         "imerg.qpf.202407040830.30minAccum.tif",
                     }));
}

TEST(ArchiveReconcilerTest, MigrationOverwritesStoreCopy) {
    ArchiveFixture fx("reconcile_overwrite");
    const auto clock = core::plan_cycle(utc(2024, 7, 4, 9, 0));
    test::put_precip(fx.working, PrecipKind::Forecast, utc(2024, 7, 4, 8, 0), "new");
    test::put_precip(fx.store, PrecipKind::Forecast, utc(2024, 7, 4, 8, 0), "old");

    persist::ArchiveReconciler rec(fx.paths());
    const auto report = rec.reconcile(clock);

    EXPECT_EQ(report.counters.migrated_forecasts, 1u);
    EXPECT_EQ(test::read_file(fx.store / "imerg.qpf.202407040800.30minAccum.tif"), "new");
    EXPECT_TRUE(test::list_names(fx.working).empty());
}

// One failing operation is recorded and the pass continues with the other files
TEST(ArchiveReconcilerTest, FileOpFailureIsIsolated) {
    ArchiveFixture fx("reconcile_failure");
    const auto clock = core::plan_cycle(utc(2024, 7, 4, 9, 0));
    test::put_precip(fx.working, PrecipKind::Observed, utc(2024, 7, 3, 20, 0));
    test::put_precip(fx.working, PrecipKind::Observed, utc(2024, 7, 3, 21, 0));
    test::put_precip(fx.working, PrecipKind::Forecast, utc(2024, 7, 4, 7, 0));
    test::put_precip(fx.working, PrecipKind::Forecast, utc(2024, 7, 4, 7, 30));

    auto ops = std::make_unique<test::ScriptedFileOps>();
    ops->fail_remove.insert("imerg.qpe.202407032000.30minAccum.tif");
    ops->fail_copy.insert("imerg.qpf.202407040700.30minAccum.tif");
    persist::ArchiveReconciler rec(fx.paths(), std::move(ops));
    const auto report = rec.reconcile(clock);

    EXPECT_EQ(report.counters.file_failures, 2u);
    ASSERT_EQ(report.errors.size(), 2u);
    for (const auto& e : report.errors) {
        EXPECT_EQ(e.kind, core::StageErrorKind::FileOpFailure);
        EXPECT_EQ(e.stage, core::Stage::Reconcile);
    }
    EXPECT_EQ(report.counters.expired_observed, 1u);
    EXPECT_EQ(report.counters.migrated_forecasts, 1u);

    const auto working = test::list_names(fx.working);
    EXPECT_TRUE(contains(working, "imerg.qpe.202407032000.30minAccum.tif"));
    EXPECT_FALSE(contains(working, "imerg.qpe.202407032100.30minAccum.tif"));
    // A forecast whose copy failed stays in the working folder
    EXPECT_TRUE(contains(working, "imerg.qpf.202407040700.30minAccum.tif"));
    EXPECT_FALSE(contains(working, "imerg.qpf.202407040730.30minAccum.tif"));
    EXPECT_TRUE(contains(test::list_names(fx.store), "imerg.qpf.202407040730.30minAccum.tif"));
}

TEST(ArchiveReconcilerTest, MissingWorkingFolderIsPrepFailure) {
    test::TempTree tree("reconcile_missing");
    persist::ArchiveReconciler rec({tree.root() / "absent", tree.root() / "store", tree.root() / "ingest"});
    const auto report = rec.reconcile(core::plan_cycle(utc(2024, 7, 4, 9, 0)));

    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_EQ(report.errors[0].kind, core::StageErrorKind::PrepFailure);
}

// Staging copies the archive and gives every file the observed name
TEST(ArchiveReconcilerTest, StageForIngestionUnifiesNames) {
    ArchiveFixture fx("stage_ingest");
    test::put_precip(fx.working, PrecipKind::Observed, utc(2024, 7, 4, 5, 0));
    test::put_precip(fx.working, PrecipKind::Forecast, utc(2024, 7, 4, 9, 0), "forecast");
    test::put_precip(fx.working, PrecipKind::Forecast, utc(2024, 7, 4, 9, 30));
    test::write_file(fx.working / "stray.tif");
    // A stale observed copy from a previous run does not survive staging
    test::put_precip(fx.ingest, PrecipKind::Observed, utc(2024, 7, 4, 9, 0), "stale");

    persist::ArchiveReconciler rec(fx.paths());
    const auto report = rec.stage_for_ingestion();

    EXPECT_TRUE(report.errors.empty());
    EXPECT_EQ(report.counters.staged, 3u);
    EXPECT_EQ(report.counters.renamed, 2u);
    EXPECT_EQ(test::list_names(fx.ingest), (std::vector<std::string>{
                                               "imerg.qpe.202407040500.30minAccum.tif",
                                               "imerg.qpe.202407040900.30minAccum.tif",
                                               "imerg.qpe.202407040930.30minAccum.tif",
                                           }));
    EXPECT_EQ(test::read_file(fx.ingest / "imerg.qpe.202407040900.30minAccum.tif"), "forecast");
    // The working folder keeps its own naming
    EXPECT_EQ(test::list_names(fx.working).size(), 4u);
}

TEST(ArchiveReconcilerTest, StagingClearsLeftoversFromAbortedCycle) {
    ArchiveFixture fx("stage_leftovers");
    test::put_precip(fx.working, PrecipKind::Observed, utc(2024, 7, 4, 5, 0));
    test::put_precip(fx.ingest, PrecipKind::Observed, utc(2024, 7, 3, 20, 0), "old");
    test::put_precip(fx.ingest, PrecipKind::Forecast, utc(2024, 7, 3, 23, 0), "old");

    persist::ArchiveReconciler rec(fx.paths());
    const auto report = rec.stage_for_ingestion();

    EXPECT_TRUE(report.errors.empty());
    EXPECT_EQ(report.counters.staged, 1u);
    EXPECT_EQ(report.counters.renamed, 0u);
    EXPECT_EQ(test::list_names(fx.ingest),
              (std::vector<std::string>{"imerg.qpe.202407040500.30minAccum.tif"}));
}

TEST(ArchiveReconcilerTest, PurgeIngestionEmptiesFolder) {
    ArchiveFixture fx("purge_ingest");
    test::put_precip(fx.working, PrecipKind::Observed, utc(2024, 7, 4, 5, 0));
    persist::ArchiveReconciler rec(fx.paths());
    ASSERT_TRUE(rec.stage_for_ingestion().errors.empty());
    test::write_file(fx.ingest / "extra.bin");

    const auto report = rec.purge_ingestion();

    EXPECT_EQ(report.counters.purged, 2u);
    EXPECT_TRUE(test::list_names(fx.ingest).empty());
    EXPECT_EQ(test::list_names(fx.working).size(), 1u);
}

} // namespace
