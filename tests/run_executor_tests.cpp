#include <gtest/gtest.h>

#include <string>

#include "api/run_executor.hpp"
#include "tests/harness/temp_tree.hpp"

namespace {

// /bin/sh stands in for the engine: the control file is the script it runs.
api::RunRequest sh_run(const test::TempTree& tree, const std::string& script) {
    const auto out = tree.dir("out");
    test::write_file(out / "control.txt", script);
    return {"/bin/sh", tree.root(), out / "control.txt", api::engine_log_path(out)};
}

TEST(RunExecutorTest, SuccessfulRunWritesLog) {
    test::TempTree tree("exec_ok");
    const auto req = sh_run(tree, "echo engine started\ntouch marker\nexit 0\n");

    api::RunExecutor exec;
    const auto outcome = exec.execute(req);

    EXPECT_TRUE(outcome.submitted);
    EXPECT_TRUE(outcome.ok());
    EXPECT_EQ(req.log_path.filename(), "ef5.log");
    const auto log = test::read_file(req.log_path);
    EXPECT_NE(log.find("engine started"), std::string::npos);
    // The engine runs inside the work directory
    EXPECT_TRUE(std::filesystem::exists(tree.root() / "marker"));
}

TEST(RunExecutorTest, NonZeroExitIsRunFailure) {
    test::TempTree tree("exec_fail");
    const auto req = sh_run(tree, "echo boom >&2\nexit 3\n");

    const auto outcome = api::RunExecutor{}.execute(req);

    EXPECT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.process.exit_code, 3);
    EXPECT_NE(test::read_file(req.log_path).find("boom"), std::string::npos);

    const auto err = api::RunExecutor::to_error(outcome);
    EXPECT_EQ(err.kind, core::StageErrorKind::RunFailure);
    EXPECT_EQ(err.stage, core::Stage::Execute);
    EXPECT_EQ(err.detail, "exit=3");
}

TEST(RunExecutorTest, MissingEngineFailsToLaunch) {
    test::TempTree tree("exec_missing");
    auto req = sh_run(tree, "exit 0\n");
    req.engine_path = tree.root() / "no_such_engine";

    const auto outcome = api::RunExecutor{}.execute(req);

    EXPECT_TRUE(outcome.submitted);
    EXPECT_FALSE(outcome.process.launched);
    EXPECT_FALSE(outcome.ok());
    EXPECT_NE(api::RunExecutor::to_error(outcome).detail.find("launch failed"), std::string::npos);
}

} // namespace
