#include "test_common.hpp"
#include <climits>

TEST_CASE("ArgParser basic parsing") {
    const char* argv[] = {"prog", "--foo", "--opt", "42", "pos", "--unknown"};
    ArgParser parser(6, const_cast<char**>(argv), {"--foo", "--bar", "--opt"}, {}, {"--opt"});
    REQUIRE(parser.has_flag("--foo"));
    REQUIRE(parser.get_option("--opt") == "42");
    REQUIRE(parser.positional().size() == 1);
    REQUIRE(parser.positional()[0] == "pos");
    REQUIRE(parser.unknown_flags().size() == 1);
    REQUIRE(parser.unknown_flags()[0] == "--unknown");
}

TEST_CASE("ArgParser option with equals") {
    const char* argv[] = {"prog", "--opt=val"};
    ArgParser parser(2, const_cast<char**>(argv), {"--opt"});
    REQUIRE(parser.has_flag("--opt"));
    REQUIRE(parser.get_option("--opt") == "val");
}

TEST_CASE("ArgParser boolean flag does not consume the next argument") {
    const char* argv[] = {"prog", "--stat", "HEAD~1"};
    ArgParser parser(3, const_cast<char**>(argv), {"--stat"}, {}, {});
    REQUIRE(parser.has_flag("--stat"));
    REQUIRE(parser.get_option("--stat").empty());
    REQUIRE(parser.positional() == std::vector<std::string>{"HEAD~1"});
}

TEST_CASE("ArgParser short options") {
    const char* argv[] = {"prog", "-h", "-n42", "-C", "repo"};
    ArgParser parser(5, const_cast<char**>(argv), {"--help", "--limit", "--dir"},
                     {{'h', "--help"}, {'n', "--limit"}, {'C', "--dir"}}, {"--limit", "--dir"});
    REQUIRE(parser.has_flag("--help"));
    REQUIRE(parser.get_option("--limit") == std::string("42"));
    REQUIRE(parser.get_option("--dir") == std::string("repo"));
    REQUIRE(parser.positional().empty());
}

TEST_CASE("ArgParser short option with equals") {
    const char* argv[] = {"prog", "-n=7"};
    ArgParser parser(2, const_cast<char**>(argv), {"--limit"}, {{'n', "--limit"}}, {"--limit"});
    REQUIRE(parser.get_option("--limit") == "7");
}

TEST_CASE("ArgParser stacked short flags") {
    const char* argv[] = {"prog", "-fvn3"};
    ArgParser parser(2, const_cast<char**>(argv), {"--force", "--verbose", "--limit"},
                     {{'f', "--force"}, {'v', "--verbose"}, {'n', "--limit"}}, {"--limit"});
    REQUIRE(parser.has_flag("--force"));
    REQUIRE(parser.has_flag("--verbose"));
    REQUIRE(parser.get_option("--limit") == "3");
}

TEST_CASE("ArgParser unknown flag detection") {
    const char* argv[] = {"prog", "--foo"};
    ArgParser parser(2, const_cast<char**>(argv), {"--bar"});
    REQUIRE_FALSE(parser.has_flag("--foo"));
    REQUIRE(parser.unknown_flags().size() == 1);
    REQUIRE(parser.unknown_flags()[0] == "--foo");
}

TEST_CASE("ArgParser unknown short flag") {
    const char* argv[] = {"prog", "-x"};
    ArgParser parser(2, const_cast<char**>(argv), {"--bar"}, {{'a', "--bar"}});
    REQUIRE(parser.positional().empty());
    REQUIRE(parser.unknown_flags().size() == 1);
    REQUIRE(parser.unknown_flags()[0] == "-x");
}

TEST_CASE("ArgParser reports value flags missing their value") {
    const char* argv[] = {"prog", "status", "--remote"};
    ArgParser parser(3, const_cast<char**>(argv), {"--remote"}, {}, {"--remote"});
    REQUIRE_FALSE(parser.has_flag("--remote"));
    REQUIRE(parser.missing_values() == std::vector<std::string>{"--remote"});
    REQUIRE(parser.positional() == std::vector<std::string>{"status"});
}

TEST_CASE("ArgParser double dash ends flags") {
    const char* argv[] = {"prog", "diff", "--", "--stat"};
    ArgParser parser(4, const_cast<char**>(argv), {"--stat"});
    REQUIRE_FALSE(parser.has_flag("--stat"));
    REQUIRE(parser.positional() == std::vector<std::string>{"diff", "--stat"});
}

TEST_CASE("ArgParser repeated options keep every value") {
    const char* argv[] = {"prog", "--remote", "a", "--remote=b"};
    ArgParser parser(4, const_cast<char**>(argv), {"--remote"}, {}, {"--remote"});
    REQUIRE(parser.get_option("--remote") == "b");
    REQUIRE(parser.get_all_options("--remote") == std::vector<std::string>{"a", "b"});
}

TEST_CASE("parse_int bounds and trailing text") {
    bool ok = false;
    REQUIRE(parse_int("5", 0, 10, ok) == 5);
    REQUIRE(ok);
    parse_int("11", 0, 10, ok);
    REQUIRE_FALSE(ok);
    parse_int("5x", 0, 10, ok);
    REQUIRE_FALSE(ok);
    parse_int("bad", 0, 10, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_size_t rejects signs and out of range values") {
    bool ok = false;
    REQUIRE(parse_size_t("100", 0, 200, ok) == 100);
    REQUIRE(ok);
    parse_size_t("100", 0, 50, ok);
    REQUIRE_FALSE(ok);
    parse_size_t("-1", 0, SIZE_MAX, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_bytes units") {
    bool ok = false;
    REQUIRE(parse_bytes("1KB", 0, SIZE_MAX, ok) == 1024);
    REQUIRE(ok);
    REQUIRE(parse_bytes("2mb", 0, SIZE_MAX, ok) == 2 * 1024 * 1024);
    REQUIRE(ok);
    REQUIRE(parse_bytes("3GB", 0, SIZE_MAX, ok) == 3ull * 1024 * 1024 * 1024);
    REQUIRE(ok);
    REQUIRE(parse_bytes("512B", 0, SIZE_MAX, ok) == 512);
    REQUIRE(ok);
    parse_bytes("1TB", 0, SIZE_MAX, ok);
    REQUIRE_FALSE(ok);
}

TEST_CASE("parse_duration units") {
    bool ok = false;
    REQUIRE(parse_duration("30", ok) == std::chrono::seconds(30));
    REQUIRE(ok);
    REQUIRE(parse_duration("5s", ok) == std::chrono::seconds(5));
    REQUIRE(ok);
    REQUIRE(parse_duration("2m", ok) == std::chrono::minutes(2));
    REQUIRE(ok);
    REQUIRE(parse_duration("1h", ok) == std::chrono::hours(1));
    REQUIRE(ok);
    parse_duration("1d", ok);
    REQUIRE_FALSE(ok);
    parse_duration("", ok);
    REQUIRE_FALSE(ok);
}
