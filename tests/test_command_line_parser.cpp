/**
 * @file test_command_line_parser.cpp
 * @brief Option, flag and subcommand parsing
 */

#include "test_helpers.hpp"
#include "cli/SimpleCommandLineParser.hpp"
#include "cli/CommandLineInterface.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace relay;
using namespace relay::testing;

namespace {

/// Owns argv storage for a parse call
class Argv {
public:
    Argv(std::initializer_list<std::string> args) : storage_(args) {
        storage_.insert(storage_.begin(), "media-relay");
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
    }

    int argc() const { return static_cast<int>(pointers_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

SimpleCommandLineParser make_parser() {
    SimpleCommandLineParser parser("media-relay", "test parser");
    parser.add_option("url", "u", "Remote URL");
    parser.add_option("workers", "w", "Worker count", "4");
    parser.add_flag("no-parallel", "", "Disable parallel upload");
    parser.add_flag("once", "", "Single iteration");
    return parser;
}

} // namespace

TEST(SimpleCommandLineParserTest, ParsesOptionsFlagsAndPositionals) {
    auto parser = make_parser();
    Argv args{"upload", "--url", "https://host/put", "--no-parallel", "extra"};
    ASSERT_TRUE(parser.parse(args.argc(), args.argv()));

    EXPECT_EQ(parser.get("url"), std::optional<std::string>("https://host/put"));
    EXPECT_TRUE(parser.get_flag("no-parallel"));
    EXPECT_FALSE(parser.get_flag("once"));
    ASSERT_EQ(parser.get_positional().size(), 2u);
    EXPECT_EQ(parser.get_positional()[0], "upload");
    EXPECT_EQ(parser.get_positional()[1], "extra");
}

TEST(SimpleCommandLineParserTest, InlineValuesAndShortNames) {
    auto parser = make_parser();
    Argv args{"download", "--url=https://host/a=b", "-w", "8"};
    ASSERT_TRUE(parser.parse(args.argc(), args.argv()));

    EXPECT_EQ(parser.get("url").value(), "https://host/a=b");
    EXPECT_EQ(parser.get_as<unsigned>("workers"), std::optional<unsigned>(8));
}

TEST(SimpleCommandLineParserTest, DefaultsApplyWhenAbsent) {
    auto parser = make_parser();
    Argv args{"status"};
    ASSERT_TRUE(parser.parse(args.argc(), args.argv()));

    EXPECT_EQ(parser.get_as<unsigned>("workers"), std::optional<unsigned>(4));
    EXPECT_FALSE(parser.get("url").has_value());
}

TEST(SimpleCommandLineParserTest, NonNumericValueYieldsNothing) {
    auto parser = make_parser();
    Argv args{"upload", "--workers", "many"};
    ASSERT_TRUE(parser.parse(args.argc(), args.argv()));
    EXPECT_FALSE(parser.get_as<unsigned>("workers").has_value());
}

TEST(SimpleCommandLineParserTest, UnknownOrIncompleteOptionsFail) {
    {
        auto parser = make_parser();
        Argv args{"upload", "--bogus"};
        EXPECT_FALSE(parser.parse(args.argc(), args.argv()));
    }
    {
        auto parser = make_parser();
        Argv args{"upload", "-z"};
        EXPECT_FALSE(parser.parse(args.argc(), args.argv()));
    }
    {
        auto parser = make_parser();
        Argv args{"upload", "--url"};
        EXPECT_FALSE(parser.parse(args.argc(), args.argv()));
    }
}

TEST(CommandLineInterfaceTest, DownloadNeedsUrlAndOutput) {
    CommandLineInterface cli;
    Argv args{"download", "--url", "https://host/media/1"};
    EXPECT_FALSE(cli.parse_arguments(args.argc(), args.argv()));
    EXPECT_EQ(cli.parse_exit_code(), kExitUsage);
}

TEST(CommandLineInterfaceTest, UploadNeedsExactlyOneDestination) {
    CommandLineInterface cli;
    Argv args{"upload", "--input", "a.bin", "--url", "https://host/put", "--dest-dir", "/tmp"};
    EXPECT_FALSE(cli.parse_arguments(args.argc(), args.argv()));
    EXPECT_EQ(cli.parse_exit_code(), kExitUsage);
}

TEST(CommandLineInterfaceTest, CopyOntoItselfIsUsageError) {
    TempDir dir;
    const std::string path = (dir / "clip.mp4").string();
    write_text(path, "payload");

    CommandLineInterface cli;
    Argv args{"copy", "--input", path, "--output", (dir.path() / "." / "clip.mp4").string()};
    EXPECT_FALSE(cli.parse_arguments(args.argc(), args.argv()));
    EXPECT_EQ(cli.parse_exit_code(), kExitUsage);
    EXPECT_EQ(read_text(path), "payload");
}

TEST(CommandLineInterfaceTest, UploadIntoInputDirectoryIsUsageError) {
    TempDir dir;
    const std::string path = (dir / "clip.mp4").string();
    write_text(path, "payload");

    CommandLineInterface cli;
    Argv args{"upload", "--input", path, "--dest-dir", dir.path().string()};
    EXPECT_FALSE(cli.parse_arguments(args.argc(), args.argv()));
    EXPECT_EQ(cli.parse_exit_code(), kExitUsage);
    EXPECT_EQ(read_text(path), "payload");
}

TEST(CommandLineInterfaceTest, UnknownCommandIsUsageError) {
    CommandLineInterface cli;
    Argv args{"teleport"};
    EXPECT_FALSE(cli.parse_arguments(args.argc(), args.argv()));
    EXPECT_EQ(cli.parse_exit_code(), kExitUsage);
}

TEST(CommandLineInterfaceTest, OverridesReachTheConfiguration) {
    CommandLineInterface cli;
    Argv args{"copy", "--input", "in.bin", "--output", "out.bin", "--chunk-size", "131072",
              "--workers", "2", "--no-evict", "--no-crash-handler", "--log-level", "5"};
    ASSERT_TRUE(cli.parse_arguments(args.argc(), args.argv()));

    EXPECT_EQ(cli.command(), "copy");
    const RelayConfig& config = cli.get_config();
    EXPECT_EQ(config.transfer.chunk_size, 131072u);
    EXPECT_EQ(config.upload.workers, 2u);
    EXPECT_FALSE(config.transfer.evict_page_cache);
    EXPECT_FALSE(config.monitor.install_crash_handler);
    EXPECT_EQ(config.log.level, 5);
}
