#include <gtest/gtest.h>
#include <managers/tool_bridge.hpp>
#include <managers/result_extractor.hpp>
#include <core/config.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

// Stand-in for the external deploy CLI: records its argv, then prints
// whatever FAKE_MODE asks for.
static const char* FAKE_TOOL = R"(#!/bin/sh
printf '%s\n' "$@" > "$DIPOLE_FAKE_ARGS"
case "$FAKE_MODE" in
  success)
    echo "Building..."
    echo "Uploading..."
    echo '{"type":"Success","url":"myapp.vercel.app"}'
    ;;
  fail)
    echo "Building..."
    echo "npm ERR! missing script: build" 1>&2
    exit 1
    ;;
  dry)
    echo "Dry run, nothing uploaded"
    echo '{"type":"Success","url":null,"dryRun":true}'
    ;;
  nested)
    echo 'analysing {"partial": true} project'
    echo '{"type":"Plan","steps":{"build":{"cmd":"npm run build"}}}'
    ;;
  raw)
    echo "no json here"
    ;;
  many)
    i=1
    while [ $i -le 12 ]; do echo "step $i"; i=$((i+1)); done
    echo '{"type":"Success","url":"https://many.netlify.app"}'
    ;;
  undeploy)
    echo '{"type":"UndeploySuggestions","id":"rec-1","steps":["netlify sites:delete"]}'
    ;;
  deep)
    echo "Building..."
    s=""
    i=0
    while [ $i -lt 1100 ]; do s="$s{\"a\":"; i=$((i+1)); done
    printf '%s1\n' "$s"
    exit 1
    ;;
esac
)";

class ToolBridgeTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path args_file;
    BridgeSettings settings;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "dipole_bridge_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir / "state" / "logs");
        args_file = test_dir / "args.txt";

        std::ofstream(test_dir / "fake_tool.sh") << FAKE_TOOL;

        settings.tool_command = {"/bin/sh", (test_dir / "fake_tool.sh").string()};
        settings.tool_root = test_dir;
        settings.history_file = test_dir / "state" / "deployments.json";
        settings.environment = {{"DIPOLE_FAKE_ARGS", args_file.string()}, {"FAKE_MODE", "success"}};
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void mode(const std::string& m) { settings.environment["FAKE_MODE"] = m; }

    std::vector<std::string> recorded_args() {
        std::vector<std::string> args;
        std::ifstream in(args_file);
        std::string line;
        while (std::getline(in, line)) args.push_back(line);
        return args;
    }
};

// ── Deploy ──────────────────────────────────────────────────

TEST_F(ToolBridgeTest, DeploySuccessWithUrl) {
    ToolBridge bridge(settings);
    SessionContext ctx;

    auto r = bridge.deploy(ctx, {test_dir.string()});
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& out = r.value;

    EXPECT_TRUE(out.success());
    EXPECT_STREQ(out.status(), "success");
    ASSERT_TRUE(out.record.has_value());
    EXPECT_EQ((*out.record)["url"].asString(), "myapp.vercel.app");
    EXPECT_EQ(ctx.preview_url.value_or(""), "https://myapp.vercel.app");
    EXPECT_EQ(ctx.progress.state().step, STEP_PREVIEW);
    EXPECT_EQ(ctx.progress.state().status, ProgressStatus::Completed);

    ASSERT_EQ(ctx.log.size(), 3u);
    EXPECT_EQ(ctx.log.lines()[0], "Building...");
    EXPECT_EQ(ctx.log.lines()[2], "{\"type\":\"Success\",\"url\":\"myapp.vercel.app\"}");
}

TEST_F(ToolBridgeTest, DeployFailureWithoutRecord) {
    mode("fail");
    ToolBridge bridge(settings);
    SessionContext ctx;

    auto r = bridge.deploy(ctx, {test_dir.string()});
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& out = r.value;

    EXPECT_EQ(out.exit_code, 1);
    EXPECT_STREQ(out.status(), "failed");
    ASSERT_TRUE(out.record.has_value());
    EXPECT_EQ((*out.record)["type"].asString(), "Error");
    EXPECT_EQ((*out.record)["message"].asString(), "Deploy finished but no JSON record captured.");
    EXPECT_FALSE(ctx.preview_url.has_value());
    EXPECT_EQ(describe(ctx.progress.state()), "3:verify-completed");

    // stderr lands in the same buffer
    ASSERT_EQ(ctx.log.size(), 2u);
    EXPECT_EQ(ctx.log.lines()[1], "npm ERR! missing script: build");
}

TEST_F(ToolBridgeTest, DeployWithDeeplyNestedNoiseStillVerifies) {
    mode("deep");
    ToolBridge bridge(settings);
    SessionContext ctx;

    Result<InvocationOutcome> r = Result<InvocationOutcome>::Err("not run");
    ASSERT_NO_THROW(r = bridge.deploy(ctx, {test_dir.string()}));
    ASSERT_TRUE(r.is_ok()) << r.error;

    EXPECT_STREQ(r.value.status(), "failed");
    ASSERT_TRUE(r.value.record.has_value());
    EXPECT_EQ((*r.value.record)["message"].asString(), "Deploy finished but no JSON record captured.");
    EXPECT_EQ(describe(ctx.progress.state()), "3:verify-completed");
}

TEST_F(ToolBridgeTest, PlanWithDeeplyNestedNoiseReturnsRaw) {
    mode("deep");
    ToolBridge bridge(settings);
    SessionContext ctx;

    Result<InvocationOutcome> r = Result<InvocationOutcome>::Err("not run");
    ASSERT_NO_THROW(r = bridge.plan(ctx, test_dir.string()));
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_FALSE(r.value.record.has_value());
    EXPECT_EQ(r.value.reply, r.value.raw_output);
}

TEST_F(ToolBridgeTest, DryRunHasNoUrl) {
    mode("dry");
    ToolBridge bridge(settings);
    SessionContext ctx;

    DeployOptions opts;
    opts.path = test_dir.string();
    opts.dry_run = true;
    auto r = bridge.deploy(ctx, opts);
    ASSERT_TRUE(r.is_ok()) << r.error;

    EXPECT_TRUE((*r.value.record)["dryRun"].asBool());
    EXPECT_FALSE(ctx.preview_url.has_value());
    EXPECT_EQ(describe(ctx.progress.state()), "3:verify-completed");

    auto args = recorded_args();
    EXPECT_NE(std::find(args.begin(), args.end(), "--dry-run"), args.end());
}

TEST_F(ToolBridgeTest, DeployArgsUsePrefsAndSession) {
    ToolBridge bridge(settings);
    SessionContext ctx(SessionStore("s-0badcafe"));
    SessionPrefs prefs;
    prefs.provider = "netlify";
    prefs.method = "cli";
    bridge.modify_preferences(ctx, prefs);

    ASSERT_TRUE(bridge.deploy(ctx, {"/srv/my site"}).is_ok());
    EXPECT_EQ(recorded_args(), (std::vector<std::string>{
        "deploy", "--path", "/srv/my site", "--provider", "netlify", "--method", "cli",
        "--session", "s-0badcafe", "--yes", "--non-interactive"}));
}

TEST_F(ToolBridgeTest, RefreshCadence) {
    mode("many");
    settings.refresh_every = 5;
    ToolBridge bridge(settings);
    SessionContext ctx;

    std::vector<size_t> refreshes;
    auto r = bridge.deploy(ctx, {test_dir.string()}, [&](const LogBuffer& log) {
        refreshes.push_back(log.size());
    });
    ASSERT_TRUE(r.is_ok()) << r.error;

    // 13 lines: every 5th line plus the final flush
    EXPECT_EQ(refreshes, (std::vector<size_t>{5, 10, 13}));
    EXPECT_EQ(ctx.log.size(), 13u);
    EXPECT_EQ(ctx.preview_url.value_or(""), "https://many.netlify.app");
}

TEST_F(ToolBridgeTest, NewDeployResetsBuffer) {
    ToolBridge bridge(settings);
    SessionContext ctx;
    ASSERT_TRUE(bridge.deploy(ctx, {test_dir.string()}).is_ok());
    ASSERT_TRUE(bridge.deploy(ctx, {test_dir.string()}).is_ok());
    EXPECT_EQ(ctx.log.size(), 3u);
    EXPECT_EQ(ctx.progress.invocation(), 2);
}

TEST_F(ToolBridgeTest, SpawnFailureFailsDeployStep) {
    settings.tool_command = {"/nonexistent/dipole-tool"};
    ToolBridge bridge(settings);
    SessionContext ctx;

    auto r = bridge.deploy(ctx, {test_dir.string()});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(describe(ctx.progress.state()), "2:deploy-failed");
    EXPECT_FALSE(ctx.preview_url.has_value());
}

// ── Plan ────────────────────────────────────────────────────

TEST_F(ToolBridgeTest, PlanReturnsRecord) {
    mode("nested");
    ToolBridge bridge(settings);
    SessionContext ctx(SessionStore("s-00000001"));

    auto r = bridge.plan(ctx, "/work/app");
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_TRUE(r.value.record.has_value());
    EXPECT_EQ((*r.value.record)["steps"]["build"]["cmd"].asString(), "npm run build");
    EXPECT_EQ(r.value.reply, serialize_record(*r.value.record));
    EXPECT_EQ(describe(ctx.progress.state()), "1:plan-completed");

    EXPECT_EQ(recorded_args(), (std::vector<std::string>{
        "plan", "--path", "/work/app", "--json-only", "--session", "s-00000001"}));
}

TEST_F(ToolBridgeTest, PlanFallsBackToRawText) {
    mode("raw");
    ToolBridge bridge(settings);
    SessionContext ctx;

    auto r = bridge.plan(ctx, ".");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_FALSE(r.value.record.has_value());
    EXPECT_EQ(r.value.reply, "no json here\n");
    EXPECT_EQ(describe(ctx.progress.state()), "1:plan-active");
}

TEST_F(ToolBridgeTest, PlanOverridesAndNoLlm) {
    settings.no_llm = true;
    ToolBridge bridge(settings);
    SessionContext ctx(SessionStore("s-00000002"));
    SessionPrefs prefs;
    prefs.provider = "netlify";
    bridge.modify_preferences(ctx, prefs);

    RequestOverrides o;
    o.provider = "vercel";
    o.method = "api";
    ASSERT_TRUE(bridge.plan(ctx, "/p", o).is_ok());
    EXPECT_EQ(recorded_args(), (std::vector<std::string>{
        "plan", "--path", "/p", "--json-only", "--provider", "vercel", "--method", "api",
        "--session", "s-00000002", "--no-llm"}));

    // Overrides do not touch the session's own preferences
    EXPECT_EQ(ctx.session.prefs().provider.value_or(""), "netlify");
}

TEST_F(ToolBridgeTest, PlanSpawnFailureFailsPlanStep) {
    settings.tool_command = {"/nonexistent/dipole-tool"};
    ToolBridge bridge(settings);
    SessionContext ctx;

    EXPECT_TRUE(bridge.plan(ctx, ".").is_err());
    EXPECT_EQ(describe(ctx.progress.state()), "1:plan-failed");
}

// ── Diagnose / Undeploy ─────────────────────────────────────

TEST_F(ToolBridgeTest, DiagnoseWithoutInputsNeverSpawns) {
    ToolBridge bridge(settings);
    SessionContext ctx;

    auto r = bridge.diagnose(ctx, {});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "Provide either a log path or a record id.");
    EXPECT_FALSE(fs::exists(args_file));
    EXPECT_EQ(ctx.progress.state(), ProgressState{});
}

TEST_F(ToolBridgeTest, DiagnoseByRecordId) {
    mode("raw");
    ToolBridge bridge(settings);
    SessionContext ctx;

    DiagnoseOptions opts;
    opts.record_id = "rec-9";
    auto r = bridge.diagnose(ctx, opts);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.reply, "no json here\n");
    EXPECT_EQ(recorded_args(), (std::vector<std::string>{"diagnose", "--json-only", "--id", "rec-9"}));
}

TEST_F(ToolBridgeTest, LineCallbackSeesPlanDiagnoseUndeployOutput) {
    mode("nested");
    std::vector<std::string> seen;
    ToolBridge bridge(settings);
    bridge.set_line_callback([&seen](const std::string& line) { seen.push_back(line); });
    SessionContext ctx;

    ASSERT_TRUE(bridge.plan(ctx, test_dir.string()).is_ok());
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], "analysing {\"partial\": true} project");

    DiagnoseOptions opts;
    opts.record_id = "rec-1";
    ASSERT_TRUE(bridge.diagnose(ctx, opts).is_ok());
    EXPECT_EQ(seen.size(), 4u);

    ASSERT_TRUE(bridge.undeploy(ctx, "rec-1").is_ok());
    EXPECT_EQ(seen.size(), 6u);

    // Deploy output goes to the session log instead
    seen.clear();
    ASSERT_TRUE(bridge.deploy(ctx, {test_dir.string()}).is_ok());
    EXPECT_TRUE(seen.empty());
    EXPECT_FALSE(ctx.log.empty());
}

TEST_F(ToolBridgeTest, UndeployRequiresId) {
    ToolBridge bridge(settings);
    SessionContext ctx;

    auto r = bridge.undeploy(ctx, "  ");
    ASSERT_TRUE(r.is_err());
    EXPECT_FALSE(fs::exists(args_file));
}

TEST_F(ToolBridgeTest, UndeployReturnsSuggestions) {
    mode("undeploy");
    ToolBridge bridge(settings);
    SessionContext ctx;

    auto r = bridge.undeploy(ctx, "rec-1");
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_TRUE(r.value.record.has_value());
    EXPECT_EQ((*r.value.record)["type"].asString(), "UndeploySuggestions");
    EXPECT_EQ(recorded_args(), (std::vector<std::string>{"undeploy", "--id", "rec-1", "--json-only"}));
}

// ── TailLogs ────────────────────────────────────────────────

TEST_F(ToolBridgeTest, TailLogsUnknownIdReadsNoLog) {
    // b2's log does not exist; touching it would report LogFileMissing
    std::ofstream(settings.history_file)
        << R"([{"id":"a1","logsPath":"state/logs/a1.log"},)"
        << R"({"id":"b2","logsPath":"state/logs/gone.log"}])";
    std::ofstream(test_dir / "state/logs/a1.log") << "hello\n";
    ToolBridge bridge(settings);
    SessionContext ctx;

    auto r = bridge.tail_logs(ctx, "missing-id");
    EXPECT_EQ(r.status, TailStatus::RecordNotFound);
    EXPECT_EQ(r.text, "No record found for id missing-id");
    EXPECT_FALSE(fs::exists(test_dir / "state/logs/gone.log"));

    auto gone = bridge.tail_logs(ctx, "b2");
    EXPECT_EQ(gone.status, TailStatus::LogFileMissing);

    auto found = bridge.tail_logs(ctx, "a1");
    EXPECT_TRUE(found.ok());
    EXPECT_EQ(found.text, "hello");
}

// ── Preferences / preview ───────────────────────────────────

TEST_F(ToolBridgeTest, ModifyPreferencesSequence) {
    ToolBridge bridge(settings);
    SessionContext ctx;

    SessionPrefs a;
    a.provider = "netlify";
    SessionPrefs b;
    b.method = "cli";
    SessionPrefs c;
    c.provider = "vercel";

    bridge.modify_preferences(ctx, a);
    bridge.modify_preferences(ctx, b);
    auto update = bridge.modify_preferences(ctx, c);

    EXPECT_EQ(update.prefs.provider.value_or(""), "vercel");
    EXPECT_EQ(update.prefs.method.value_or(""), "cli");

    auto reply = parse_json(update.reply);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ((*reply)["type"].asString(), "PrefsUpdated");
    EXPECT_EQ((*reply)["provider"].asString(), "vercel");
    EXPECT_EQ((*reply)["method"].asString(), "cli");
    EXPECT_FALSE(reply->isMember("domain"));
}

TEST_F(ToolBridgeTest, ShowPreviewNormalizesAndCaches) {
    ToolBridge bridge(settings);
    SessionContext ctx;

    EXPECT_EQ(bridge.show_preview(ctx, "//site.example.com"), "https://site.example.com");
    EXPECT_EQ(ctx.preview_url.value_or(""), "https://site.example.com");
    EXPECT_EQ(bridge.show_preview(ctx, " http://localhost:8080 "), "http://localhost:8080");
    EXPECT_EQ(ctx.preview_url.value_or(""), "http://localhost:8080");
}

TEST(BridgeSettings, FromConfigDefaults) {
    auto cfg = Config::defaults(fs::path("/srv/project"));
    auto s = BridgeSettings::from_config(cfg);
    EXPECT_EQ(s.tool_command, cfg.tool().command);
    EXPECT_EQ(s.history_file, fs::path("/srv/project/state/deployments.json"));
    EXPECT_EQ(s.refresh_every, 5);
    EXPECT_FALSE(s.no_llm);
}
