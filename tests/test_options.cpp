#include "updown/options.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace {

updown::ParseResult parse(std::vector<const char*> args, updown::Options& opts, std::string& error) {
    args.insert(args.begin(), "updown");
    return updown::parse_options(static_cast<int>(args.size()), args.data(), opts, error);
}

}  // namespace

TEST(ParseOptions, Defaults) {
    updown::Options opts;
    std::string error;
    EXPECT_EQ(parse({}, opts, error), updown::ParseResult::ok);
    EXPECT_EQ(opts.port, 6600);
    EXPECT_EQ(opts.bind_address, "0.0.0.0");
    EXPECT_EQ(opts.output_dir, ".");
    EXPECT_EQ(opts.serve_dir, ".");
    EXPECT_EQ(opts.max_upload_size, updown::DEFAULT_MAX_UPLOAD_SIZE);
    EXPECT_FALSE(opts.quiet);
}

TEST(ParseOptions, ShortAndLongFlags) {
    updown::Options opts;
    std::string error;
    EXPECT_EQ(parse({ "-p", "32001", "-o", "/tmp/in", "--serve", "/tmp/out", "--bind", "127.0.0.1",
        "-m", "2048", "-q" }, opts, error), updown::ParseResult::ok);
    EXPECT_EQ(opts.port, 32001);
    EXPECT_EQ(opts.output_dir, "/tmp/in");
    EXPECT_EQ(opts.serve_dir, "/tmp/out");
    EXPECT_EQ(opts.bind_address, "127.0.0.1");
    EXPECT_EQ(opts.max_upload_size, 2048u);
    EXPECT_TRUE(opts.quiet);
}

TEST(ParseOptions, Help) {
    updown::Options opts;
    std::string error;
    EXPECT_EQ(parse({ "--help" }, opts, error), updown::ParseResult::help);
    EXPECT_TRUE(opts.show_help);
}

TEST(ParseOptions, RejectsBadValues) {
    updown::Options opts;
    std::string error;
    EXPECT_EQ(parse({ "-p", "http" }, opts, error), updown::ParseResult::error);
    EXPECT_EQ(error, "Invalid port value.");
    EXPECT_EQ(parse({ "-p", "70000" }, opts, error), updown::ParseResult::error);
    EXPECT_EQ(parse({ "-p" }, opts, error), updown::ParseResult::error);
    EXPECT_EQ(parse({ "-o" }, opts, error), updown::ParseResult::error);
    EXPECT_EQ(parse({ "-m", "-5" }, opts, error), updown::ParseResult::error);
    EXPECT_EQ(parse({ "--ssl" }, opts, error), updown::ParseResult::error);
    EXPECT_EQ(error, "Unknown option: --ssl");
}

TEST(ResolveDirectories, MakesPathsAbsolute) {
    updown_test::TempDir serve;
    updown_test::TempDir output;
    updown::Options opts;
    opts.serve_dir = serve.path().string();
    opts.output_dir = output.path().string();

    updown::Directories dirs;
    std::string error;
    ASSERT_TRUE(updown::resolve_directories(opts, dirs, error)) << error;
    EXPECT_TRUE(dirs.serve_root.is_absolute());
    EXPECT_EQ(dirs.serve_root, serve.path());
    EXPECT_EQ(dirs.output_dir, output.path());
}

TEST(ResolveDirectories, RejectsMissingOrFile) {
    updown_test::TempDir tmp;
    updown_test::write_file(tmp.path() / "plain.txt", "x");

    updown::Options opts;
    updown::Directories dirs;
    std::string error;

    opts.serve_dir = (tmp.path() / "nope").string();
    EXPECT_FALSE(updown::resolve_directories(opts, dirs, error));
    EXPECT_NE(error.find("serve directory not found"), std::string::npos);

    opts.serve_dir = tmp.path().string();
    opts.output_dir = (tmp.path() / "plain.txt").string();
    EXPECT_FALSE(updown::resolve_directories(opts, dirs, error));
    EXPECT_NE(error.find("output path is not a directory"), std::string::npos);
}
