//! # CLI Unit Tests
//!
//! Tests for argument parsing, the query command handlers, and the
//! top-level dispatcher, run against catalog files in a temp directory.

#include "cli/commands/cmd_query.hpp"
#include "cli/driver.hpp"
#include "cli/utils.hpp"
#include "log/log.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

using namespace reqtree;
using namespace reqtree::cli;

namespace {

/// Owns argv storage for a command line.
class Args {
public:
    Args(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& arg : storage_) {
            argv_.push_back(arg.data());
        }
        argv_.push_back(nullptr);
    }

    int argc() const {
        return static_cast<int>(storage_.size());
    }

    char** argv() {
        return argv_.data();
    }

private:
    std::vector<std::string> storage_;
    std::vector<char*> argv_;
};

const char* const LINEAR_CATALOG = R"(# c requires b requires a
[[resource]]
id = "a"
name = "A"
sdesc = "Resource A"
ldesc = "The first resource in the alphabetical order"
category = "example"
requires = []

[[resource]]
id = "b"
name = "B"
sdesc = "Resource B"
ldesc = "The second resource, dependent on A"
category = "example"
requires = ["a"]

[[resource]]
id = "c"
name = "C"
sdesc = "Resource C"
ldesc = "The third resource, dependent on B"
category = "example"
requires = ["b"]
)";

} // namespace

// ============================================================================
// Argument Parsing
// ============================================================================

TEST(ParseCountTest, AcceptsDecimalCounts) {
    EXPECT_EQ(parse_count("0"), 0u);
    EXPECT_EQ(parse_count("42"), 42u);
}

TEST(ParseCountTest, RejectsMalformedCounts) {
    EXPECT_FALSE(parse_count("").has_value());
    EXPECT_FALSE(parse_count("-1").has_value());
    EXPECT_FALSE(parse_count("12x").has_value());
    EXPECT_FALSE(parse_count("ten").has_value());
}

TEST(ParseQueryArgsTest, AllOptions) {
    Args args{"reqtree", "chains", "c",           "--catalog=deps.toml", "--first-only",
              "-vv",     "--max-depth=5", "--max-paths=9"};

    auto parsed = parse_query_args(args.argc(), args.argv(), 2);
    ASSERT_TRUE(is_ok(parsed)) << unwrap_err(parsed);

    const QueryOptions& options = unwrap(parsed);
    EXPECT_EQ(options.args, (std::vector<std::string>{"c"}));
    EXPECT_EQ(options.catalog_path, fs::path("deps.toml"));
    EXPECT_EQ(options.graph.branch_policy, graph::BranchPolicy::FirstRequirement);
    EXPECT_EQ(options.graph.max_depth, 5u);
    EXPECT_EQ(options.graph.max_paths, 9u);
}

TEST(ParseQueryArgsTest, Defaults) {
    Args args{"reqtree", "order", "z"};

    auto parsed = parse_query_args(args.argc(), args.argv(), 2);
    ASSERT_TRUE(is_ok(parsed));
    EXPECT_TRUE(unwrap(parsed).catalog_path.empty());
    EXPECT_EQ(unwrap(parsed).graph.branch_policy, graph::BranchPolicy::AllBranches);
    EXPECT_EQ(unwrap(parsed).graph.max_depth, 0u);
    EXPECT_EQ(unwrap(parsed).graph.max_paths, 0u);
}

TEST(ParseQueryArgsTest, Errors) {
    Args bad_depth{"reqtree", "chains", "c", "--max-depth=abc"};
    auto depth = parse_query_args(bad_depth.argc(), bad_depth.argv(), 2);
    ASSERT_TRUE(is_err(depth));
    EXPECT_EQ(unwrap_err(depth), "Invalid value for --max-depth: abc");

    Args unknown{"reqtree", "chains", "c", "--bogus"};
    auto option = parse_query_args(unknown.argc(), unknown.argv(), 2);
    ASSERT_TRUE(is_err(option));
    EXPECT_EQ(unwrap_err(option), "Unknown option: --bogus");

    Args empty_catalog{"reqtree", "list", "--catalog="};
    auto catalog = parse_query_args(empty_catalog.argc(), empty_catalog.argv(), 2);
    ASSERT_TRUE(is_err(catalog));
    EXPECT_EQ(unwrap_err(catalog), "Missing path for --catalog");
}

// ============================================================================
// Query Commands
// ============================================================================

class QueryCommandTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("reqtree_cli_" +
               std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
        log::Logger::init(log::LogConfig{});
    }

    QueryOptions options_for(const std::string& content, std::vector<std::string> args) {
        fs::path path = dir / "catalog.toml";
        std::ofstream(path) << content;

        QueryOptions options;
        options.catalog_path = path;
        options.args = std::move(args);
        return options;
    }
};

TEST_F(QueryCommandTest, Show) {
    std::ostringstream out;
    EXPECT_EQ(run_show(options_for(LINEAR_CATALOG, {"a"}), out), 0);
    EXPECT_EQ(out.str(), "Resource: a\nName: A\nShort Description: Resource A\n"
                         "Long Description: The first resource in the alphabetical order\n"
                         "Category: example\nRequirements: []\n");
}

TEST_F(QueryCommandTest, ChainsTreeOrder) {
    std::ostringstream chains;
    std::ostringstream tree;
    std::ostringstream order;

    EXPECT_EQ(run_chains(options_for(LINEAR_CATALOG, {"c"}), chains), 0);
    EXPECT_EQ(run_tree(options_for(LINEAR_CATALOG, {"c"}), tree), 0);
    EXPECT_EQ(run_order(options_for(LINEAR_CATALOG, {"c"}), order), 0);

    EXPECT_EQ(chains.str(), "c\nc -> b\nc -> b -> a\n");
    EXPECT_EQ(tree.str(), "c <- b <- a\n");
    EXPECT_EQ(order.str(), "a\nb\nc\n");
}

TEST_F(QueryCommandTest, UnknownResourceReported) {
    std::ostringstream out;
    testing::internal::CaptureStderr();
    int code = run_chains(options_for(LINEAR_CATALOG, {"x"}), out);
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, 1);
    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(err, "error[UnknownResource]: Unknown resource: x\n");
}

TEST_F(QueryCommandTest, CycleReported) {
    std::ostringstream out;
    testing::internal::CaptureStderr();
    int code = run_order(options_for("[[resource]]\nid = \"a\"\nrequires = [\"b\"]\n"
                                     "[[resource]]\nid = \"b\"\nrequires = [\"a\"]\n",
                                     {"a"}),
                         out);
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, 1);
    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(err, "error[CyclicDependency]: Circular dependency detected: a -> b -> a\n");
}

TEST_F(QueryCommandTest, WrongArgumentCount) {
    std::ostringstream out;
    testing::internal::CaptureStderr();
    int code = run_tree(options_for(LINEAR_CATALOG, {}), out);
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, 1);
    EXPECT_EQ(err, "Usage: reqtree tree <id> [options]\n");
}

TEST_F(QueryCommandTest, MissingCatalogFile) {
    QueryOptions options;
    options.catalog_path = dir / "absent.toml";
    options.args = {"a"};

    std::ostringstream out;
    testing::internal::CaptureStderr();
    int code = run_show(options, out);
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, 1);
    EXPECT_EQ(err, "error: Catalog file not found: " + options.catalog_path.string() + "\n");
}

TEST_F(QueryCommandTest, ReverseDependenciesAndList) {
    const char* diamond = "[[resource]]\nid = \"base\"\n"
                          "[[resource]]\nid = \"left\"\nrequires = [\"base\"]\n"
                          "[[resource]]\nid = \"right\"\nrequires = [\"base\"]\n"
                          "[[resource]]\nid = \"top\"\nrequires = [\"left\", \"right\"]\n";

    std::ostringstream rdeps;
    EXPECT_EQ(run_rdeps(options_for(diamond, {"base"}), rdeps), 0);
    EXPECT_EQ(rdeps.str(), "left\nright\n");

    std::ostringstream list;
    EXPECT_EQ(run_list(options_for(diamond, {}), list), 0);
    EXPECT_EQ(list.str(), "base\nleft\nright\ntop\n");
}

TEST_F(QueryCommandTest, CheckCleanCatalog) {
    std::ostringstream out;
    EXPECT_EQ(run_check(options_for(LINEAR_CATALOG, {}), out), 0);
    EXPECT_EQ(out.str(), "3 resources, 0 dangling references, 0 cycles\n");
}

TEST_F(QueryCommandTest, CheckReportsProblems) {
    log::LogConfig quiet;
    quiet.level = log::LogLevel::Off;
    log::Logger::init(quiet);

    std::ostringstream out;
    int code = run_check(options_for("[[resource]]\nid = \"a\"\nrequires = [\"b\", \"ghost\"]\n"
                                     "[[resource]]\nid = \"b\"\nrequires = [\"a\"]\n",
                                     {}),
                         out);

    EXPECT_EQ(code, 1);
    EXPECT_EQ(out.str(), "dangling: a -> ghost\n"
                         "cycle: a -> b -> a\n"
                         "2 resources, 1 dangling references, 1 cycles\n");
}

// ============================================================================
// Dispatcher
// ============================================================================

TEST(DispatcherTest, Version) {
    Args args{"reqtree", "--version"};
    testing::internal::CaptureStdout();
    int code = reqtree_main(args.argc(), args.argv());
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(code, 0);
    EXPECT_EQ(out, "reqtree 0.1.0\n");
}

TEST(DispatcherTest, UnknownCommand) {
    Args args{"reqtree", "frobnicate"};
    testing::internal::CaptureStderr();
    int code = reqtree_main(args.argc(), args.argv());
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(code, 1);
    EXPECT_NE(err.find("Unknown command 'frobnicate'"), std::string::npos);
}

TEST(DispatcherTest, RunsQueryAgainstCatalogFile) {
    fs::path path = fs::temp_directory_path() / "reqtree_dispatch_catalog.toml";
    std::ofstream(path) << LINEAR_CATALOG;

    Args args{"reqtree", "tree", "c", "--catalog=" + path.string()};
    testing::internal::CaptureStdout();
    int code = reqtree_main(args.argc(), args.argv());
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(code, 0);
    EXPECT_EQ(out, "c <- b <- a\n");

    std::error_code ec;
    fs::remove(path, ec);
    log::Logger::init(log::LogConfig{});
}
