#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <set>

#include "persist/gap_filler.hpp"
#include "tests/harness/fake_remote_archive.hpp"
#include "tests/harness/temp_tree.hpp"

namespace {

using namespace std::chrono_literals;
using core::PrecipKind;
using test::utc;

struct GapFixture {
    explicit GapFixture(const std::string& name)
        : tree(name), working(tree.dir("precip")), store(tree.dir("qpf_store")) {
        auto fake = std::make_unique<test::FakeRemoteArchive>();
        remote = fake.get();
        filler = std::make_unique<persist::GapFiller>(working, store, std::move(fake));
    }

    test::TempTree tree;
    std::filesystem::path working;
    std::filesystem::path store;
    test::FakeRemoteArchive* remote{nullptr};
    std::unique_ptr<persist::GapFiller> filler;
};

void publish(test::FakeRemoteArchive& remote, util::TimePoint first, util::TimePoint last) {
    for (const auto ts : core::cadence_grid(first, last)) {
        remote.published.insert(ts);
    }
}

// No two files share a timestamp
void expect_unique_timestamps(const std::filesystem::path& dir) {
    const auto stamps = test::precip_timestamps(dir);
    const std::set<util::TimePoint> unique(stamps.begin(), stamps.end());
    EXPECT_EQ(unique.size(), stamps.size());
}

// Empty archive: one bulk request for [current - 9.5h, current - 3.5h]
TEST(GapFillerTest, EmptyFolderRequestsFullSpan) {
    GapFixture fx("gap_empty");
    publish(*fx.remote, utc(2024, 7, 3, 12, 0), utc(2024, 7, 4, 8, 30));
    const auto clock = core::plan_cycle(utc(2024, 7, 4, 9, 0));

    const auto report = fx.filler->fill(clock);

    EXPECT_EQ(report.tier, persist::FillTier::FullSpan);
    ASSERT_EQ(fx.remote->range_calls.size(), 1u);
    EXPECT_EQ(fx.remote->range_calls[0].first, utc(2024, 7, 3, 23, 30));
    EXPECT_EQ(fx.remote->range_calls[0].last, utc(2024, 7, 4, 5, 30));
    ASSERT_TRUE(report.bulk_request.has_value());
    EXPECT_EQ(*report.bulk_request, fx.remote->range_calls[0]);
    EXPECT_TRUE(report.unresolved.empty());
    EXPECT_TRUE(fx.remote->list_calls.empty());
    EXPECT_EQ(test::precip_timestamps(fx.working).size(), 13u);
    expect_unique_timestamps(fx.working);
}

// Latest observed 05:00, horizon 05:30: a small patch [05:00, 05:30]
TEST(GapFillerTest, SmallPatch) {
    GapFixture fx("gap_small");
    test::put_precip(fx.working, PrecipKind::Observed, utc(2024, 7, 4, 4, 30));
    test::put_precip(fx.working, PrecipKind::Observed, utc(2024, 7, 4, 5, 0));
    publish(*fx.remote, utc(2024, 7, 4, 0, 0), utc(2024, 7, 4, 8, 30));

    const auto report = fx.filler->fill(core::plan_cycle(utc(2024, 7, 4, 9, 0)));

    EXPECT_EQ(report.tier, persist::FillTier::SmallPatch);
    ASSERT_EQ(fx.remote->range_calls.size(), 1u);
    EXPECT_EQ(fx.remote->range_calls[0].first, utc(2024, 7, 4, 5, 0));
    EXPECT_EQ(fx.remote->range_calls[0].last, utc(2024, 7, 4, 5, 30));
    EXPECT_TRUE(report.unresolved.empty());
    EXPECT_TRUE(std::filesystem::exists(fx.working / "imerg.qpe.202407040530.30minAccum.tif"));
    expect_unique_timestamps(fx.working);
}

// A stray off-cadence frame neither shifts the grid nor counts as the latest observation
TEST(GapFillerTest, OffCadenceFileIsIgnored) {
    GapFixture fx("gap_off_cadence");
    test::put_precip(fx.working, PrecipKind::Observed, utc(2024, 7, 4, 4, 30));
    test::put_precip(fx.working, PrecipKind::Observed, utc(2024, 7, 4, 5, 15));
    publish(*fx.remote, utc(2024, 7, 4, 0, 0), utc(2024, 7, 4, 8, 30));

    const auto report = fx.filler->fill(core::plan_cycle(utc(2024, 7, 4, 9, 0)));

    EXPECT_EQ(report.tier, persist::FillTier::SmallPatch);
    EXPECT_EQ(report.span_start, utc(2024, 7, 4, 4, 30));
    ASSERT_EQ(fx.remote->range_calls.size(), 1u);
    EXPECT_EQ(fx.remote->range_calls[0].first, utc(2024, 7, 4, 4, 30));
    EXPECT_TRUE(report.unresolved.empty());
    EXPECT_TRUE(std::filesystem::exists(fx.working / "imerg.qpe.202407040500.30minAccum.tif"));
    EXPECT_TRUE(std::filesystem::exists(fx.working / "imerg.qpe.202407040530.30minAccum.tif"));
}

TEST(GapFillerTest, LargePatchAndUpToDate) {
    {
        GapFixture fx("gap_large");
        test::put_precip(fx.working, PrecipKind::Observed, utc(2024, 7, 4, 2, 0));
        publish(*fx.remote, utc(2024, 7, 4, 0, 0), utc(2024, 7, 4, 8, 30));

        const auto report = fx.filler->fill(core::plan_cycle(utc(2024, 7, 4, 9, 0)));

        EXPECT_EQ(report.tier, persist::FillTier::LargePatch);
        ASSERT_EQ(fx.remote->range_calls.size(), 1u);
        EXPECT_EQ(fx.remote->range_calls[0].first, utc(2024, 7, 4, 2, 0));
        EXPECT_EQ(test::precip_timestamps(fx.working).size(), 8u);
    }
    {
        GapFixture fx("gap_uptodate");
        test::put_precip(fx.working, PrecipKind::Observed, utc(2024, 7, 4, 5, 30));

        const auto report = fx.filler->fill(core::plan_cycle(utc(2024, 7, 4, 9, 0)));

        EXPECT_EQ(report.tier, persist::FillTier::UpToDate);
        EXPECT_FALSE(report.bulk_request.has_value());
        EXPECT_TRUE(fx.remote->range_calls.empty());
        EXPECT_TRUE(fx.remote->list_calls.empty());
    }
}

// Holes left by the bulk pass are fetched individually, then taken from the store
TEST(GapFillerTest, PerTimestepThenStoreFallback) {
    GapFixture fx("gap_fallback");
    test::put_precip(fx.working, PrecipKind::Observed, utc(2024, 7, 4, 3, 30));
    publish(*fx.remote, utc(2024, 7, 4, 4, 0), utc(2024, 7, 4, 4, 30));
    fx.remote->published.insert(utc(2024, 7, 4, 5, 0));
    fx.remote->fetch_fails.insert(utc(2024, 7, 4, 5, 0));
    test::put_precip(fx.store, PrecipKind::Forecast, utc(2024, 7, 4, 5, 0), "stored");
    test::put_precip(fx.store, PrecipKind::Forecast, utc(2024, 7, 4, 5, 30), "stored");

    const auto report = fx.filler->fill(core::plan_cycle(utc(2024, 7, 4, 9, 0)));

    EXPECT_EQ(report.tier, persist::FillTier::LargePatch);
    EXPECT_TRUE(report.remote_filled.empty());
    EXPECT_EQ(report.store_filled, (std::vector<util::TimePoint>{utc(2024, 7, 4, 5, 0), utc(2024, 7, 4, 5, 30)}));
    EXPECT_TRUE(report.unresolved.empty());
    EXPECT_FALSE(report.remote_unavailable);
    EXPECT_EQ(test::read_file(fx.working / "imerg.qpf.202407040500.30minAccum.tif"), "stored");
    expect_unique_timestamps(fx.working);
}

TEST(GapFillerTest, PerTimestepDownloadAfterFailedBulk) {
    GapFixture fx("gap_per_step");
    test::put_precip(fx.working, PrecipKind::Observed, utc(2024, 7, 4, 4, 30));
    publish(*fx.remote, utc(2024, 7, 4, 5, 0), utc(2024, 7, 4, 5, 30));
    fx.remote->bulk_fails = true;

    const auto report = fx.filler->fill(core::plan_cycle(utc(2024, 7, 4, 9, 0)));

    EXPECT_EQ(report.remote_filled, (std::vector<util::TimePoint>{utc(2024, 7, 4, 5, 0), utc(2024, 7, 4, 5, 30)}));
    EXPECT_TRUE(core::has_kind(report.errors, core::StageErrorKind::RemoteUnavailable));
    EXPECT_FALSE(report.remote_unavailable);
    EXPECT_TRUE(report.unresolved.empty());
}

// The first listing failure disables the remote for the rest of the pass
TEST(GapFillerTest, ListingFailureFallsBackToStoreOnly) {
    GapFixture fx("gap_listing");
    test::put_precip(fx.working, PrecipKind::Observed, utc(2024, 7, 4, 3, 30));
    fx.remote->listing_fails = true;
    test::put_precip(fx.store, PrecipKind::Forecast, utc(2024, 7, 4, 4, 30));

    const auto report = fx.filler->fill(core::plan_cycle(utc(2024, 7, 4, 9, 0)));

    EXPECT_TRUE(report.remote_unavailable);
    EXPECT_EQ(fx.remote->list_calls.size(), 1u);
    EXPECT_TRUE(fx.remote->fetch_calls.empty());
    EXPECT_EQ(report.store_filled, (std::vector<util::TimePoint>{utc(2024, 7, 4, 4, 30)}));
    EXPECT_EQ(report.unresolved, (std::vector<util::TimePoint>{utc(2024, 7, 4, 4, 0), utc(2024, 7, 4, 5, 0),
                                                              utc(2024, 7, 4, 5, 30)}));
    EXPECT_TRUE(core::has_kind(report.errors, core::StageErrorKind::TransientGap));
}

// Filled timestamps are exactly the grid minus the reported unresolved gaps
TEST(GapFillerTest, FilledEqualsGridMinusUnresolved) {
    GapFixture fx("gap_property");
    test::put_precip(fx.working, PrecipKind::Observed, utc(2024, 7, 4, 1, 0));
    publish(*fx.remote, utc(2024, 7, 4, 1, 30), utc(2024, 7, 4, 3, 0));
    fx.remote->fetch_fails.insert(utc(2024, 7, 4, 2, 0));
    test::put_precip(fx.store, PrecipKind::Forecast, utc(2024, 7, 4, 4, 0));

    const auto clock = core::plan_cycle(utc(2024, 7, 4, 9, 0));
    const auto report = fx.filler->fill(clock);

    const auto grid = core::cadence_grid(report.span_start, clock.horizon());
    const auto stamps = test::precip_timestamps(fx.working);
    const std::set<util::TimePoint> present(stamps.begin(), stamps.end());
    for (const auto ts : grid) {
        const bool unresolved =
            std::find(report.unresolved.begin(), report.unresolved.end(), ts) != report.unresolved.end();
        EXPECT_NE(present.count(ts) != 0, unresolved) << util::human_stamp(ts);
    }
    EXPECT_EQ(report.unresolved.size(), 5u);  // 02:00, 03:30, 04:30, 05:00, 05:30
    expect_unique_timestamps(fx.working);
}

// A timestamp already covered by a forecast file is not filled again
TEST(GapFillerTest, ForecastCoverageCountsAsPresent) {
    GapFixture fx("gap_forecast_cover");
    test::put_precip(fx.working, PrecipKind::Observed, utc(2024, 7, 4, 4, 30));
    test::put_precip(fx.working, PrecipKind::Forecast, utc(2024, 7, 4, 5, 0));
    publish(*fx.remote, utc(2024, 7, 4, 4, 0), utc(2024, 7, 4, 6, 0));
    fx.remote->bulk_fails = true;

    const auto report = fx.filler->fill(core::plan_cycle(utc(2024, 7, 4, 9, 0)));

    EXPECT_EQ(fx.remote->fetch_calls, (std::vector<util::TimePoint>{utc(2024, 7, 4, 5, 30)}));
    EXPECT_EQ(report.remote_filled.size(), 1u);
    expect_unique_timestamps(fx.working);
}

TEST(GapFillerTest, MissingWorkingFolderIsPrepFailure) {
    test::TempTree tree("gap_missing");
    persist::GapFiller filler(tree.root() / "absent", tree.root() / "store",
                              std::make_unique<test::FakeRemoteArchive>());
    const auto report = filler.fill(core::plan_cycle(utc(2024, 7, 4, 9, 0)));
    ASSERT_EQ(report.errors.size(), 1u);
    EXPECT_EQ(report.errors[0].kind, core::StageErrorKind::PrepFailure);
}

} // namespace
