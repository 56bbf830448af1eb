#include "diagpack/collect/orchestrator.hpp"
#include "diagpack/collect/report.hpp"
#include "testing.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <thread>

namespace fs = std::filesystem;

namespace diagpack {
namespace {

using namespace std::chrono_literals;

constexpr std::time_t kFixedTime = 1709622540;
constexpr const char* kArchiveName = "HOST01_CollectedData_03_05_2024_07_09_UTC.zip";

class OrchestratorTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    RunContext ctx;
    std::vector<RunEvent> events;

    void SetUp() override {
        fs::create_directories(Source());
        ctx.SetEventTap([this](const RunEvent& e) { events.push_back(e); });
    }

    fs::path Source() const { return fs::path(tmp.Path()) / "source"; }
    fs::path Staging() const { return fs::path(tmp.Path()) / "staging"; }
    fs::path Output() const { return fs::path(tmp.Path()) / "out"; }

    CollectionOrchestrator::Options MakeOptions() const {
        CollectionOrchestrator::Options opt;
        opt.staging_dir = Staging().string();
        opt.output_dir = Output().string();
        opt.host_id = "HOST01";
        opt.command_timeout = 10s;
        return opt;
    }

    std::unique_ptr<CollectionOrchestrator> MakeOrchestrator(
        std::shared_ptr<const IProcessLauncher> launcher = nullptr) {
        auto o = std::make_unique<CollectionOrchestrator>(MakeOptions(), std::move(launcher));
        o->SetArchiveClock([] { return kFixedTime; });
        return o;
    }

    Package FilePackage(const std::string& id, const std::string& file) {
        const fs::path p = Source() / file;
        testutil::WriteTextFile(p.string(), id + ":" + file);
        Package pkg;
        pkg.id = id;
        FileAction a;
        a.path_pattern = p.string();
        pkg.actions.files.push_back(a);
        return pkg;
    }

    std::vector<RunState> States() const {
        std::vector<RunState> out;
        for (const auto& e : events) {
            if (e.type == RunEvent::Type::StateChanged)
                out.push_back(e.state);
        }
        return out;
    }
};

TEST_F(OrchestratorTests, EmptyActionSetsStillProduceArchive) {
    Manifest m;
    m.packages.push_back(Package{"A", {}});
    m.packages.push_back(Package{"B", {}});

    auto orch = MakeOrchestrator();
    const CollectionResult res = orch->Run(ctx, m);

    EXPECT_EQ(res.outcome, RunOutcome::Success);
    EXPECT_FALSE(res.cancelled);
    ASSERT_TRUE(res.archive_path.has_value());
    EXPECT_EQ(*res.archive_path, (Output() / kArchiveName).string());
    EXPECT_TRUE(fs::exists(*res.archive_path));
    EXPECT_EQ(res.archive_sha256.size(), 64u);
    EXPECT_EQ(res.per_package.size(), 2u);
    EXPECT_EQ(res.ErrorCount(), 0u);
    EXPECT_FALSE(fs::exists(Staging()));
}

TEST_F(OrchestratorTests, ConfiguredHostIdIsSanitized) {
    auto opt = MakeOptions();
    opt.host_id = "lab/ws:7";
    CollectionOrchestrator orch(std::move(opt));
    orch.SetArchiveClock([] { return kFixedTime; });
    EXPECT_EQ(orch.HostId(), "lab_ws_7");

    Manifest m;
    m.packages.push_back(Package{"A", {}});
    const CollectionResult res = orch.Run(ctx, m);
    ASSERT_EQ(res.outcome, RunOutcome::Success) << res.fatal_error.value_or("");
    ASSERT_TRUE(res.archive_path.has_value());
    EXPECT_EQ(*res.archive_path,
              (Output() / "lab_ws_7_CollectedData_03_05_2024_07_09_UTC.zip").string());
}

TEST_F(OrchestratorTests, FullRunFromManifestSource) {
    testutil::WriteTextFile((Source() / "app.log").string(), "log line\n");
    MemoryManifestSource source(R"(<Packages xmlns="urn:example:diagnostics">
  <Package ID="App">
    <Files><File Team="Dev">)" + (Source() / "*.log").string() + R"(</File></Files>
    <Commands>
      <Command OutputFileName="greeting">echo hi</Command>
      <Command OutputFileName="skip">echo discarded</Command>
    </Commands>
  </Package>
</Packages>)");

    auto orch = MakeOrchestrator();
    const CollectionResult res = orch->Run(ctx, source);

    ASSERT_EQ(res.outcome, RunOutcome::Success) << res.fatal_error.value_or("");
    ASSERT_TRUE(res.archive_path.has_value());
    const auto& app = res.per_package.at("App");
    EXPECT_EQ(app.files_collected, 1);
    EXPECT_EQ(app.commands_collected, 1);
    EXPECT_TRUE(app.errors.empty());

    const auto entries = testutil::ReadZipEntries(*res.archive_path);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries.at("App/Files/Dev/HOST01_app.log"), "log line\n");
    EXPECT_EQ(entries.at("App/Commands/General/HOST01_greeting.txt"), "hi\n");

    const std::vector<RunState> expected = {
        RunState::Preparing, RunState::RunningPackages, RunState::Archiving, RunState::Finished};
    EXPECT_EQ(States(), expected);
    EXPECT_EQ(ctx.State(), RunState::Finished);
    EXPECT_EQ(ctx.Outcome(), RunOutcome::Success);
    EXPECT_FALSE(fs::exists(Staging()));
}

TEST_F(OrchestratorTests, ProgressIsMonotonicAndEndsAtHundred) {
    Manifest m;
    m.packages.push_back(FilePackage("P1", "a.txt"));
    m.packages.push_back(FilePackage("P2", "b.txt"));
    m.packages.push_back(FilePackage("P3", "c.txt"));

    auto orch = MakeOrchestrator();
    const CollectionResult res = orch->Run(ctx, m);
    ASSERT_EQ(res.outcome, RunOutcome::Success);

    int last = -1;
    int progress_events = 0;
    for (const auto& e : events) {
        if (e.type != RunEvent::Type::Progress)
            continue;
        ++progress_events;
        EXPECT_GT(e.percent, last);
        last = e.percent;
    }
    EXPECT_GE(progress_events, 5);
    EXPECT_EQ(last, 100);
    EXPECT_EQ(ctx.Progress(), 100);
}

TEST_F(OrchestratorTests, CancelAfterFirstPackage) {
    Manifest m;
    m.packages.push_back(FilePackage("P1", "a.txt"));
    m.packages.push_back(FilePackage("P2", "b.txt"));
    m.packages.push_back(FilePackage("P3", "c.txt"));

    ctx.SetEventTap([this](const RunEvent& e) {
        events.push_back(e);
        if (e.type == RunEvent::Type::PackageFinished && e.package_index == 0)
            ctx.RequestCancel();
    });

    auto orch = MakeOrchestrator();
    const CollectionResult res = orch->Run(ctx, m);

    EXPECT_EQ(res.outcome, RunOutcome::Cancelled);
    EXPECT_TRUE(res.cancelled);
    EXPECT_FALSE(res.archive_path.has_value());
    ASSERT_EQ(res.per_package.size(), 1u);
    EXPECT_EQ(res.per_package.at("P1").files_collected, 1);
    EXPECT_FALSE(fs::exists(Staging()));
    EXPECT_FALSE(fs::exists(Output() / kArchiveName));
    EXPECT_EQ(ctx.State(), RunState::Finished);
    EXPECT_EQ(ctx.Outcome(), RunOutcome::Cancelled);

    for (const auto& e : events) {
        if (e.type == RunEvent::Type::PackageStarted)
            EXPECT_EQ(e.package_id, "P1");
    }
}

TEST_F(OrchestratorTests, CancelBeforeStartRunsNothing) {
    Manifest m;
    m.packages.push_back(FilePackage("P1", "a.txt"));
    ctx.RequestCancel();

    auto orch = MakeOrchestrator();
    const CollectionResult res = orch->Run(ctx, m);

    EXPECT_EQ(res.outcome, RunOutcome::Cancelled);
    EXPECT_TRUE(res.per_package.empty());
    EXPECT_FALSE(fs::exists(Output() / kArchiveName));
}

TEST_F(OrchestratorTests, CancelFromAnotherThread) {
    Manifest m;
    Package pkg;
    pkg.id = "Slow";
    CommandAction first;
    first.text = "sleep 1";
    first.output_name = "first";
    CommandAction second;
    second.text = "echo never";
    second.output_name = "second";
    pkg.actions.commands = {first, second};
    m.packages.push_back(pkg);

    ctx.SetEventTap(nullptr);
    auto orch = MakeOrchestrator();
    CollectionResult res;
    std::thread worker([&] { res = orch->Run(ctx, m); });

    bool finished = false;
    bool cancel_sent = false;
    while (!finished) {
        auto ev = ctx.WaitForEvent(100ms);
        if (!ev)
            continue;
        if (ev->type == RunEvent::Type::PackageStarted && !cancel_sent) {
            ctx.RequestCancel();
            cancel_sent = true;
        }
        finished = ev->type == RunEvent::Type::StateChanged && ev->state == RunState::Finished;
    }
    worker.join();

    EXPECT_EQ(res.outcome, RunOutcome::Cancelled);
    // The command in flight when the request lands is allowed to finish.
    EXPECT_LE(res.per_package.at("Slow").commands_collected, 1);
    EXPECT_FALSE(res.archive_path.has_value());
}

TEST_F(OrchestratorTests, ManifestErrorFailsRun) {
    MemoryManifestSource source("<Packages><Package ID='A'></Packages>");

    auto orch = MakeOrchestrator();
    const CollectionResult res = orch->Run(ctx, source);

    EXPECT_EQ(res.outcome, RunOutcome::Failed);
    ASSERT_TRUE(res.fatal_error.has_value());
    EXPECT_NE(res.fatal_error->find("Syntax Error"), std::string::npos);
    EXPECT_FALSE(res.archive_path.has_value());
    EXPECT_FALSE(fs::exists(Staging()));

    const std::vector<RunState> expected = {RunState::Preparing, RunState::Finished};
    EXPECT_EQ(States(), expected);
    EXPECT_EQ(ctx.Outcome(), RunOutcome::Failed);
}

TEST_F(OrchestratorTests, ArchiveFailureKeepsPartialResults) {
    // The output "directory" is a regular file.
    fs::create_directories(Output().parent_path());
    testutil::WriteTextFile(Output().string(), "not a directory");

    Manifest m;
    m.packages.push_back(FilePackage("P1", "a.txt"));

    auto orch = MakeOrchestrator();
    const CollectionResult res = orch->Run(ctx, m);

    EXPECT_EQ(res.outcome, RunOutcome::Failed);
    EXPECT_FALSE(res.archive_path.has_value());
    ASSERT_TRUE(res.fatal_error.has_value());
    EXPECT_EQ(res.per_package.at("P1").files_collected, 1);
    EXPECT_FALSE(fs::exists(Staging()));
}

TEST_F(OrchestratorTests, DuplicatePackageIdsShareOneEntry) {
    Manifest m;
    m.packages.push_back(FilePackage("Dup", "a.txt"));
    m.packages.push_back(FilePackage("Dup", "b.txt"));

    auto orch = MakeOrchestrator();
    const CollectionResult res = orch->Run(ctx, m);

    ASSERT_EQ(res.outcome, RunOutcome::Success);
    ASSERT_EQ(res.per_package.size(), 1u);
    EXPECT_EQ(res.per_package.at("Dup").files_collected, 2);

    const auto entries = testutil::ReadZipEntries(*res.archive_path);
    EXPECT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries.count("Dup/Files/General/HOST01_a.txt"), 1u);
    EXPECT_EQ(entries.count("Dup/Files/General/HOST01_b.txt"), 1u);
}

TEST_F(OrchestratorTests, ActionErrorsAreRecordedNotFatal) {
    auto launcher = std::make_shared<testutil::FakeProcessLauncher>(
        [](const std::vector<std::string>& argv) -> std::expected<ProcessOutput, std::string> {
            return std::unexpected("executable not found: " + argv[0]);
        });

    Manifest m;
    Package pkg = FilePackage("Reg", "a.txt");
    RegistryAction key;
    key.key_path = "HKLM\\Software\\Vendor";
    key.output_name = "Vendor";
    pkg.actions.registries.push_back(key);
    m.packages.push_back(pkg);

    auto orch = MakeOrchestrator(launcher);
    const CollectionResult res = orch->Run(ctx, m);

    EXPECT_EQ(res.outcome, RunOutcome::Success);
    const auto& r = res.per_package.at("Reg");
    EXPECT_EQ(r.files_collected, 1);
    EXPECT_EQ(r.registries_collected, 0);
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].kind, ActionKind::Registry);
    EXPECT_EQ(res.ErrorCount(), 1u);

    ASSERT_EQ(launcher->Calls().size(), 1u);
    EXPECT_EQ(launcher->Calls()[0][0], "reg");
    EXPECT_EQ(launcher->LastTimeout(), 10s);
}

TEST_F(OrchestratorTests, ReportDescribesRun) {
    Manifest m;
    m.packages.push_back(FilePackage("P1", "a.txt"));

    auto orch = MakeOrchestrator();
    const CollectionResult res = orch->Run(ctx, m);
    ASSERT_EQ(res.outcome, RunOutcome::Success);

    const std::string report_path = tmp.Path() + "/report.json";
    auto w = WriteReportFile(res, report_path);
    ASSERT_TRUE(w.ok) << w.msg;
    EXPECT_FALSE(fs::exists(report_path + ".tmp"));

    const auto j = nlohmann::json::parse(testutil::ReadTextFile(report_path));
    EXPECT_EQ(j["outcome"], "Success");
    EXPECT_EQ(j["cancelled"], false);
    EXPECT_EQ(j["archive"], *res.archive_path);
    EXPECT_EQ(j["sha256"], res.archive_sha256);
    EXPECT_TRUE(j["error"].is_null());
    EXPECT_EQ(j["packages"]["P1"]["files"], 1);
    EXPECT_TRUE(j["packages"]["P1"]["errors"].empty());
}

TEST(ReportTest, FailedRunHasNullArchive) {
    CollectionResult res;
    res.outcome = RunOutcome::Failed;
    res.fatal_error = "manifest: Empty manifest";
    CollectionError e;
    e.kind = ActionKind::Command;
    e.team = "Ops";
    e.target = "sleep 30";
    e.message = "command timed out";
    res.per_package["P"].errors.push_back(e);

    const auto j = ReportToJson(res);
    EXPECT_EQ(j["outcome"], "Failed");
    EXPECT_TRUE(j["archive"].is_null());
    EXPECT_TRUE(j["sha256"].is_null());
    EXPECT_EQ(j["error"], "manifest: Empty manifest");
    ASSERT_EQ(j["packages"]["P"]["errors"].size(), 1u);
    EXPECT_EQ(j["packages"]["P"]["errors"][0]["kind"], "Command");
    EXPECT_EQ(j["packages"]["P"]["errors"][0]["target"], "sleep 30");
}

TEST(ReportTest, InvalidUtf8TextIsWrittenWithReplacement) {
    testutil::TemporaryDirectory tmp;
    CollectionResult res;
    res.outcome = RunOutcome::Success;
    CollectionError e;
    e.kind = ActionKind::Registry;
    e.team = "Ops";
    e.target = "HKLM\\Soft\xe9";
    e.message = "registry export exited with status 1: \xff\xfe";
    res.per_package["P\xff"].errors.push_back(e);

    const std::string report_path = tmp.Path() + "/report.json";
    auto w = WriteReportFile(res, report_path);
    ASSERT_TRUE(w.ok) << w.msg;
    EXPECT_FALSE(fs::exists(report_path + ".tmp"));

    const auto j = nlohmann::json::parse(testutil::ReadTextFile(report_path));
    ASSERT_EQ(j["packages"].size(), 1u);
    const auto& errors = j["packages"].begin().value()["errors"];
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0]["message"],
              "registry export exited with status 1: \xEF\xBF\xBD\xEF\xBF\xBD");
}

} // namespace
} // namespace diagpack
