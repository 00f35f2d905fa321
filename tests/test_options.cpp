#include <gtest/gtest.h>
#include "batchfetch/errors.hpp"
#include "batchfetch/options.hpp"

#include <sstream>
#include <vector>

using batchfetch::ConfigError;
using batchfetch::Options;

namespace {

Options parse(std::vector<const char*> args) {
    args.insert(args.begin(), "batchfetch");
    return batchfetch::parseCommandLine(static_cast<int>(args.size()), args.data());
}

} // namespace

TEST(OptionsTest, Defaults) {
    const auto options = parse({});
    EXPECT_EQ(options.save_dir.string(), "nuscenes");
    EXPECT_EQ(options.threads, 3);
    EXPECT_EQ(options.retries, 3);
    EXPECT_EQ(options.cooldown_seconds, 2);
    EXPECT_EQ(options.timeout_seconds, 30);
    EXPECT_EQ(options.chunk_size, 1024u * 1024u);
    EXPECT_TRUE(options.url_file.empty());
    EXPECT_FALSE(options.verbose);
    EXPECT_FALSE(options.show_help);
}

TEST(OptionsTest, ParsesEveryFlag) {
    const auto options = parse({"--save-dir", "/data/nuscenes", "--threads", "8", "--retries", "5",
                                "--cooldown", "0", "--timeout", "60", "--url-file", "urls.txt",
                                "--log-file", "fetch.log", "-v"});
    EXPECT_EQ(options.save_dir.string(), "/data/nuscenes");
    EXPECT_EQ(options.threads, 8);
    EXPECT_EQ(options.retries, 5);
    EXPECT_EQ(options.cooldown_seconds, 0);
    EXPECT_EQ(options.timeout_seconds, 60);
    EXPECT_EQ(options.url_file.string(), "urls.txt");
    EXPECT_EQ(options.log_file.string(), "fetch.log");
    EXPECT_TRUE(options.verbose);
}

TEST(OptionsTest, HelpStopsParsing) {
    EXPECT_TRUE(parse({"--help"}).show_help);
    EXPECT_TRUE(parse({"--threads", "4", "-h", "--bogus"}).show_help);
}

TEST(OptionsTest, RejectsBadValues) {
    EXPECT_THROW(parse({"--threads", "0"}), ConfigError);
    EXPECT_THROW(parse({"--threads", "65"}), ConfigError);
    EXPECT_THROW(parse({"--threads", "three"}), ConfigError);
    EXPECT_THROW(parse({"--threads", "3x"}), ConfigError);
    EXPECT_THROW(parse({"--retries", "-1"}), ConfigError);
    EXPECT_THROW(parse({"--timeout", "0"}), ConfigError);
    EXPECT_THROW(parse({"--save-dir", ""}), ConfigError);
}

TEST(OptionsTest, RejectsUnknownOptionAndMissingValue) {
    EXPECT_THROW(parse({"--parallel", "4"}), ConfigError);
    EXPECT_THROW(parse({"--threads"}), ConfigError);
    EXPECT_THROW(parse({"nuscenes"}), ConfigError);
}

TEST(OptionsTest, ComponentSlices) {
    const auto options = parse({"--save-dir", "/data/nuscenes", "--threads", "6",
                                "--retries", "2", "--cooldown", "7", "--timeout", "45"});

    const auto dispatch = options.dispatchOptions();
    EXPECT_EQ(dispatch.save_dir.string(), "/data/nuscenes");
    EXPECT_EQ(dispatch.concurrency, 6);

    const auto policy = options.retryPolicy();
    EXPECT_EQ(policy.max_rounds, 2);
    EXPECT_EQ(policy.cooldown, std::chrono::seconds(7));

    const auto transfer = options.transferOptions();
    EXPECT_EQ(transfer.connect_timeout, std::chrono::seconds(45));
    EXPECT_EQ(transfer.stall_timeout, std::chrono::seconds(45));
    EXPECT_EQ(transfer.chunk_size, 1024u * 1024u);
}

TEST(OptionsTest, UsageListsFlags) {
    std::ostringstream out;
    batchfetch::printUsage(out, "batchfetch");
    const auto text = out.str();
    for (const char* flag : {"--save-dir", "--threads", "--retries", "--cooldown", "--timeout",
                             "--url-file", "--log-file", "--help"}) {
        EXPECT_NE(text.find(flag), std::string::npos) << flag;
    }
}

TEST(OptionsTest, ConfigErrorIsPrintedWithUsage) {
    std::ostringstream out;
    batchfetch::printConfigError(out, ConfigError("Duplicate file name data.tgz"), "batchfetch");
    const auto text = out.str();
    EXPECT_EQ(text.rfind("Error: Duplicate file name data.tgz\n", 0), 0u);
    EXPECT_NE(text.find("Usage: batchfetch [options]"), std::string::npos);
    EXPECT_NE(text.find("--url-file"), std::string::npos);
}
