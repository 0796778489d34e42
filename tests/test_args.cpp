#include "args.hpp"
#include "errors.hpp"

#include <gtest/gtest.h>

TEST(ArgsTest, finds_value_after_key) {
    char prog[] = "roundcolor", mode[] = "--mode", chain[] = "chain", n[] = "--n", five[] = "5";
    char* argv[] = {prog, mode, chain, n, five};
    EXPECT_EQ(get_arg(5, argv, "--mode"), "chain");
    EXPECT_EQ(get_arg(5, argv, "--n"), "5");
    EXPECT_EQ(get_arg(5, argv, "--seed", "7"), "7");
}

TEST(ArgsTest, key_without_value_falls_back_to_default) {
    char prog[] = "roundcolor", n[] = "--n";
    char* argv[] = {prog, n};
    EXPECT_EQ(get_arg(2, argv, "--n", "0"), "0");
}

TEST(ArgsTest, accepts_plain_positive_integers) {
    EXPECT_EQ(parse_positive_int("1", "--n"), 1);
    EXPECT_EQ(parse_positive_int("200", "--n"), 200);
}

TEST(ArgsTest, rejects_trailing_junk_and_non_positive_values) {
    EXPECT_THROW(parse_positive_int("5abc", "--n"), ConfigurationError);
    EXPECT_THROW(parse_positive_int("5 ", "--n"), ConfigurationError);
    EXPECT_THROW(parse_positive_int("0", "--n"), ConfigurationError);
    EXPECT_THROW(parse_positive_int("-3", "--n"), ConfigurationError);
    EXPECT_THROW(parse_positive_int("abc", "--n"), ConfigurationError);
    EXPECT_THROW(parse_positive_int("", "--n"), ConfigurationError);
    EXPECT_THROW(parse_positive_int("99999999999999999999", "--n"), ConfigurationError);
}

TEST(ArgsTest, error_names_the_flag_and_value) {
    try {
        parse_positive_int("5abc", "--n");
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        std::string what = e.what();
        EXPECT_NE(what.find("--n"), std::string::npos);
        EXPECT_NE(what.find("5abc"), std::string::npos);
    }
}
