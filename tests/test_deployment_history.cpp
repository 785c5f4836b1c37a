#include <gtest/gtest.h>
#include <managers/deployment_history.hpp>
#include <managers/log_buffer.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

class DeploymentHistoryTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path history_file;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "dipole_history_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir / "state" / "logs");
        history_file = test_dir / "state" / "deployments.json";
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_history(const std::string& json) {
        std::ofstream(history_file) << json;
    }

    void write_log(const std::string& rel, int lines) {
        std::ofstream out(test_dir / rel);
        for (int i = 1; i <= lines; i++) out << "line " << i << "\n";
    }
};

TEST_F(DeploymentHistoryTest, NoHistoryFile) {
    DeploymentHistory history(history_file, test_dir);
    auto r = history.tail_logs("any", 200);
    EXPECT_EQ(r.status, TailStatus::NoHistory);
    EXPECT_EQ(r.text, "No deployments.json found.");
}

TEST_F(DeploymentHistoryTest, UnknownRecord) {
    write_history(R"([{"id":"a1","logsPath":"state/logs/a1.log"}])");
    DeploymentHistory history(history_file, test_dir);

    auto r = history.tail_logs("zz9", 200);
    EXPECT_EQ(r.status, TailStatus::RecordNotFound);
    EXPECT_EQ(r.text, "No record found for id zz9");
}

TEST_F(DeploymentHistoryTest, LogFileMissing) {
    write_history(R"([{"id":"a1","logsPath":"state/logs/a1.log"}])");
    DeploymentHistory history(history_file, test_dir);

    auto r = history.tail_logs("a1", 200);
    EXPECT_EQ(r.status, TailStatus::LogFileMissing);
    EXPECT_EQ(r.text, "No logs found at state/logs/a1.log");
}

TEST_F(DeploymentHistoryTest, NullLogsPath) {
    write_history(R"([{"id":"dry","logsPath":null,"url":null}])");
    DeploymentHistory history(history_file, test_dir);
    EXPECT_EQ(history.tail_logs("dry", 200).status, TailStatus::LogFileMissing);
}

TEST_F(DeploymentHistoryTest, MalformedHistory) {
    write_history("[{\"id\": ");
    DeploymentHistory history(history_file, test_dir);

    auto r = history.tail_logs("a1", 200);
    EXPECT_EQ(r.status, TailStatus::ReadError);
    EXPECT_EQ(r.text.rfind("Error: ", 0), 0u);
}

TEST_F(DeploymentHistoryTest, TailReturnsLastLines) {
    write_log("state/logs/a1.log", 250);
    write_history(R"([{"id":"a1","logsPath":"state/logs/a1.log","provider":"netlify"}])");
    DeploymentHistory history(history_file, test_dir);

    auto r = history.tail_logs("a1", 200);
    ASSERT_TRUE(r.ok()) << r.text;

    std::istringstream in(r.text);
    std::string first, line, last;
    std::getline(in, first);
    int count = 1;
    last = first;
    while (std::getline(in, line)) {
        last = line;
        count++;
    }
    EXPECT_EQ(count, 200);
    EXPECT_EQ(first, "line 51");
    EXPECT_EQ(last, "line 250");
}

TEST_F(DeploymentHistoryTest, NewestDuplicateWins) {
    write_log("state/logs/old.log", 1);
    std::ofstream(test_dir / "state/logs/new.log") << "newest\n";
    write_history(R"([
        {"id":"dup","logsPath":"state/logs/old.log"},
        {"id":"other","logsPath":"x"},
        {"id":"dup","logsPath":"state/logs/new.log","status":"success"}
    ])");
    DeploymentHistory history(history_file, test_dir);

    auto found = history.find_latest("dup");
    ASSERT_TRUE(found.is_ok());
    ASSERT_TRUE(found.value.has_value());
    EXPECT_EQ(found.value->status, "success");
    EXPECT_EQ(history.tail_logs("dup", 200).text, "newest");
}

TEST_F(DeploymentHistoryTest, AbsoluteLogsPath) {
    auto abs = test_dir / "abs.log";
    std::ofstream(abs) << "absolute\n";
    write_history("[{\"id\":\"abs\",\"logsPath\":\"" + abs.string() + "\"}]");
    DeploymentHistory history(history_file, fs::path("/nonexistent-root"));
    EXPECT_EQ(history.tail_logs("abs", 200).text, "absolute");
}

// ── LogBuffer ───────────────────────────────────────────────

TEST(LogBuffer, AppendAndSnapshot) {
    LogBuffer log;
    log.append("Building...");
    log.append("");
    log.append("Done");
    EXPECT_EQ(log.size(), 3u);
    EXPECT_EQ(log.text(), "Building...\n\nDone\n");
    EXPECT_EQ(log.tail(2), "\nDone");

    log.reset();
    EXPECT_TRUE(log.empty());
    EXPECT_EQ(log.text(), "");
}

TEST_F(DeploymentHistoryTest, LogBufferSave) {
    LogBuffer log;
    log.append("one");
    log.append("two");

    auto path = test_dir / "export" / "deploy.log";
    auto r = log.save_to(path);
    ASSERT_TRUE(r.is_ok()) << r.error;

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    EXPECT_EQ(ss.str(), "one\ntwo\n");
}
