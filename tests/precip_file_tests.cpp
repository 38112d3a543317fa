#include <gtest/gtest.h>

#include "core/precip_file.hpp"
#include "tests/harness/temp_tree.hpp"

namespace {

using core::PrecipKind;
using test::utc;

TEST(PrecipFileTest, CanonicalNames) {
    const auto t = utc(2024, 7, 4, 5, 30);
    EXPECT_EQ(core::precip_file_name(PrecipKind::Observed, t), "imerg.qpe.202407040530.30minAccum.tif");
    EXPECT_EQ(core::precip_file_name(PrecipKind::Forecast, t), "imerg.qpf.202407040530.30minAccum.tif");
    EXPECT_EQ(core::state_file_name("crest_SM", t), "crest_SM_20240704_0530.tif");
}

TEST(PrecipFileTest, ClassifiesObservedAndForecast) {
    const auto qpe = core::classify_precip("/data/precip/imerg.qpe.202407040530.30minAccum.tif");
    ASSERT_TRUE(qpe.has_value());
    EXPECT_EQ(qpe->kind, PrecipKind::Observed);
    EXPECT_EQ(qpe->timestamp, utc(2024, 7, 4, 5, 30));

    const auto qpf = core::classify_precip("imerg.qpf.202407041100.30minAccum.tif");
    ASSERT_TRUE(qpf.has_value());
    EXPECT_EQ(qpf->kind, PrecipKind::Forecast);
    EXPECT_EQ(qpf->timestamp, utc(2024, 7, 4, 11, 0));
}

// Stray downloads and unrelated names are ignored
TEST(PrecipFileTest, RejectsUnparseableNames) {
    EXPECT_FALSE(core::classify_precip("3B-HHR-E.MS.MRG.3IMERG.20240704-S083000-E085959.0510.V07B.30min.tif"));
    EXPECT_FALSE(core::classify_precip("imerg.qpx.202407040530.30minAccum.tif"));
    EXPECT_FALSE(core::classify_precip("imerg.qpe.2024070405.30minAccum.tif"));
    EXPECT_FALSE(core::classify_precip("imerg.qpe.202407040530.30minAccum.tif.part"));
    EXPECT_FALSE(core::classify_precip("notes.txt"));
    // Off the 30-minute grid
    EXPECT_FALSE(core::classify_precip("imerg.qpe.202407040515.30minAccum.tif"));
    EXPECT_FALSE(core::classify_precip("imerg.qpf.202407041101.30minAccum.tif"));
}

TEST(PrecipFileTest, ToObservedName) {
    EXPECT_EQ(core::to_observed_name("imerg.qpf.202407041100.30minAccum.tif"),
              "imerg.qpe.202407041100.30minAccum.tif");
    EXPECT_EQ(core::to_observed_name("imerg.qpe.202407041100.30minAccum.tif"),
              "imerg.qpe.202407041100.30minAccum.tif");
    EXPECT_EQ(core::to_observed_name("readme.md"), "readme.md");
}

TEST(PrecipFileTest, ScanSkipsDirectoriesAndForeignFiles) {
    test::TempTree tree("precip_scan");
    const auto dir = tree.dir("precip");
    test::put_precip(dir, PrecipKind::Observed, utc(2024, 7, 4, 5, 0));
    test::put_precip(dir, PrecipKind::Forecast, utc(2024, 7, 4, 9, 30));
    test::write_file(dir / "stray.tif");
    std::filesystem::create_directories(dir / "imerg.qpe.202407040600.30minAccum.tif");

    std::vector<core::PrecipFile> files;
    std::string err;
    ASSERT_TRUE(core::scan_precip_dir(dir, files, err)) << err;
    EXPECT_EQ(files.size(), 2u);
}

TEST(PrecipFileTest, ScanOfMissingDirFails) {
    test::TempTree tree("precip_scan_missing");
    std::vector<core::PrecipFile> files;
    std::string err;
    EXPECT_FALSE(core::scan_precip_dir(tree.root() / "nope", files, err));
    EXPECT_FALSE(err.empty());
}

TEST(PrecipFileTest, NonZeroFile) {
    test::TempTree tree("non_zero");
    test::write_file(tree.root() / "full.tif", "data");
    test::write_file(tree.root() / "empty.tif", "");

    EXPECT_TRUE(core::is_non_zero_file(tree.root() / "full.tif"));
    EXPECT_FALSE(core::is_non_zero_file(tree.root() / "empty.tif"));
    EXPECT_FALSE(core::is_non_zero_file(tree.root() / "missing.tif"));
    EXPECT_FALSE(core::is_non_zero_file(tree.root()));
}

} // namespace
