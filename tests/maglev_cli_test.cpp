#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "maglev.hpp"
#include "maglev_cli_runner.hpp"

namespace {

const std::string WEEKDAYS = "--nodes=Monday,Tuesday,Wednesday,Thursday,Friday,Saturday,Sunday";

struct CliResult {
    int status;
    std::string out;
    std::string err;
};

CliResult runCli(const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    argv.push_back("maglev_cli");
    for (const std::string& arg : args) {
        argv.push_back(arg.c_str());
    }
    std::ostringstream out, err;
    int status = runMaglevCli(static_cast<int>(argv.size()), argv.data(), out, err);
    return CliResult{status, out.str(), err.str()};
}

std::string writeConfig(const std::string& name, const std::string& content) {
    std::string path = testing::TempDir() + name;
    std::ofstream file(path, std::ofstream::out | std::ofstream::trunc);
    file << content;
    file.close();
    return path;
}

bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

} // namespace

TEST(MaglevCliTest, LooksUpKeys) {
    CliResult result = runCli({WEEKDAYS, "--keys=alice,bob"});
    EXPECT_EQ(result.status, 0) << result.err;
    EXPECT_TRUE(contains(result.out, "hasher: siphash13\n"));
    EXPECT_TRUE(contains(result.out, "capacity: 701\n"));
    EXPECT_TRUE(contains(result.out, "alice -> Friday\n"));
    EXPECT_TRUE(contains(result.out, "bob -> Wednesday\n"));
}

TEST(MaglevCliTest, PrintsSlotStats) {
    CliResult result = runCli({WEEKDAYS, "--stats"});
    EXPECT_EQ(result.status, 0) << result.err;
    EXPECT_TRUE(contains(result.out, "Monday: 101 slots\n"));
    EXPECT_TRUE(contains(result.out, "Sunday: 100 slots\n"));
}

TEST(MaglevCliTest, EmptyNodeSetReportsNone) {
    std::string path = writeConfig("maglev_cli_empty.json", "{\"nodes\": [], \"keys\": [\"alice\"]}");
    CliResult result = runCli({"--conf=" + path});
    EXPECT_EQ(result.status, 0) << result.err;
    EXPECT_TRUE(contains(result.out, "capacity: 0\n"));
    EXPECT_TRUE(contains(result.out, "alice -> (none)\n"));
}

TEST(MaglevCliTest, NodesOptionOverridesConfig) {
    std::string path = writeConfig("maglev_cli_override.json",
        "{\"nodes\": [\"x\", \"y\"], \"capacity\": 11, \"keys\": [\"alice\", \"bob\"]}");
    CliResult fromConfig = runCli({"--conf=" + path});
    EXPECT_EQ(fromConfig.status, 0) << fromConfig.err;
    EXPECT_TRUE(contains(fromConfig.out, "capacity: 11\n"));

    CliResult overridden = runCli({"--conf=" + path, WEEKDAYS, "--capacity=700"});
    EXPECT_EQ(overridden.status, 0) << overridden.err;
    EXPECT_TRUE(contains(overridden.out, "capacity: 701\n"));
    EXPECT_TRUE(contains(overridden.out, "alice -> Friday\n"));
    EXPECT_TRUE(contains(overridden.out, "bob -> Wednesday\n"));
}

TEST(MaglevCliTest, RemoveRebuildsAtSameCapacity) {
    CliResult kept = runCli({WEEKDAYS, "--keys=alice,bob", "--remove=Tuesday,Thursday"});
    EXPECT_EQ(kept.status, 0) << kept.err;
    EXPECT_TRUE(contains(kept.out, "alice -> Friday => Friday\n"));
    EXPECT_TRUE(contains(kept.out, "bob -> Wednesday => Wednesday\n"));
    EXPECT_TRUE(contains(kept.out, "moved: 0/2\n"));

    CliResult moved = runCli({WEEKDAYS, "--keys=alice,bob", "--remove=Thursday,Friday"});
    EXPECT_EQ(moved.status, 0) << moved.err;
    EXPECT_TRUE(contains(moved.out, "alice -> Friday => Saturday\n"));
    EXPECT_TRUE(contains(moved.out, "moved: 1/2\n"));
}

TEST(MaglevCliTest, InvalidInputExitsWithOne) {
    EXPECT_EQ(runCli({"--bogus"}).status, 1);
    EXPECT_EQ(runCli({WEEKDAYS, "--capacity=many"}).status, 1);
    EXPECT_EQ(runCli({WEEKDAYS, "--hasher=md5"}).status, 1);

    CliResult missing = runCli({"--conf=" + testing::TempDir() + "maglev_cli_missing.json"});
    EXPECT_EQ(missing.status, 1);
    EXPECT_TRUE(contains(missing.err, "Failed to open config file"));

    std::string path = writeConfig("maglev_cli_bad.json", "{\"nodes\": 3}");
    EXPECT_EQ(runCli({"--conf=" + path}).status, 1);
}

TEST(MaglevCliTest, ReportRemoval) {
    Maglev<std::string> maglev(std::vector<std::string>{"Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday"});
    RemovalReport report = reportRemoval(maglev, {"Thursday", "Friday"}, {"alice", "bob"});
    EXPECT_EQ(report.capacity, 701u);
    EXPECT_EQ(report.remaining.size(), 5u);
    ASSERT_EQ(report.keys.size(), 2u);
    EXPECT_EQ(report.keys[0].before, "Friday");
    EXPECT_EQ(report.keys[0].after, "Saturday");
    EXPECT_EQ(report.keys[1].before, "Wednesday");
    EXPECT_EQ(report.keys[1].after, "Wednesday");
    EXPECT_EQ(report.moved, 1);

    Maglev<std::string> empty(std::vector<std::string>{});
    RemovalReport emptyReport = reportRemoval(empty, {}, {"alice"});
    EXPECT_EQ(emptyReport.capacity, 0u);
    EXPECT_EQ(emptyReport.keys[0].before, "(none)");
    EXPECT_EQ(emptyReport.moved, 0);
}
