#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

#include "cli.hpp"

using namespace recog;

/* Writes contents to a fresh temporary file, removed on destruction. */
class InputFile {
public:
    explicit InputFile(const std::string &contents) {
        char name[] = "/tmp/recog_cli_XXXXXX";
        int fd = mkstemp(name);
        if (fd >= 0) {
            if (write(fd, contents.data(), contents.size()) == (ssize_t)contents.size()) {
                path = name;
            }
            close(fd);
        }
    }

    ~InputFile() {
        if (!path.empty()) {
            unlink(path.c_str());
        }
    }

    std::string path;
};

class CliTest : public ::testing::Test {
protected:
    int run(const std::vector<std::string> &args) {
        std::vector<const char *> argv;
        argv.push_back("recog");
        for (const auto &a : args) {
            argv.push_back(a.c_str());
        }
        out.str("");
        err.str("");
        return run_cli((int)argv.size(), argv.data(), out, err);
    }

    Match run_grammar(const std::string &name, const std::string &input) {
        std::map<std::string, Parser> g = grammars();
        StringText st(input);
        return recognize(g.at(name), st, st.start_cursor());
    }

    std::ostringstream out;
    std::ostringstream err;
};

TEST_F(CliTest, HasFiveGrammars) {
    std::map<std::string, Parser> g = grammars();
    EXPECT_EQ(5u, g.size());
    EXPECT_EQ(0, run({"--list"}));
    EXPECT_EQ("hex\nints\nkeyword\nparens\nwords\n", out.str());
}

TEST_F(CliTest, IntsAllowTrailingWhitespace) {
    Match m = run_grammar("ints", "1,-2,+3 \n");
    ASSERT_TRUE(m.succeeded());
    EXPECT_EQ("[1, -2, 3]", to_string(m.value()));
}

TEST_F(CliTest, IntsRejectDanglingSeparator) {
    Match m = run_grammar("ints", "1,2,");
    ASSERT_FALSE(m);
    EXPECT_EQ(FailureKind::NoMatch, m.kind());
}

TEST_F(CliTest, OtherGrammars) {
    EXPECT_EQ(-255, value_of<long long>(run_grammar("hex", "-0xFF\n").value()));
    EXPECT_EQ("[hello, world]", to_string(run_grammar("words", "hello  world\n").value()));
    EXPECT_FALSE(run_grammar("words", "hello 42"));
    EXPECT_EQ("[a, b]", to_string(run_grammar("parens", "(a)(b)").value()));
    EXPECT_FALSE(run_grammar("parens", "(a)(B)"));
    EXPECT_EQ("hello", to_string(run_grammar("keyword", "hello there").value()));
}

TEST_F(CliTest, DefaultGrammarIsInts) {
    InputFile f("1,2\n");
    ASSERT_FALSE(f.path.empty());
    EXPECT_EQ(0, run({f.path}));
    EXPECT_EQ("success? 1\n[1, 2]\n", out.str());
}

TEST_F(CliTest, ParseFailureExitsOne) {
    InputFile f("1,2,");
    ASSERT_FALSE(f.path.empty());
    EXPECT_EQ(1, run({f.path}));
    EXPECT_EQ("success? 0\nNoMatch\n", out.str());
}

TEST_F(CliTest, NamedGrammar) {
    InputFile f("hello");
    ASSERT_FALSE(f.path.empty());
    EXPECT_EQ(0, run({"--grammar", "keyword", f.path}));
    EXPECT_EQ("success? 1\nhello\n", out.str());
}

TEST_F(CliTest, TraceGoesToErr) {
    InputFile f("hello");
    ASSERT_FALSE(f.path.empty());
    EXPECT_EQ(0, run({"--trace", "--grammar", "keyword", f.path}));
    EXPECT_EQ("keyword: try @0\nkeyword: match @0..@5 hello\n", err.str());
}

TEST_F(CliTest, UsageErrorsExitTwo) {
    EXPECT_EQ(2, run({"--grammar"}));
    EXPECT_NE(std::string::npos, err.str().find("usage:"));
    EXPECT_EQ(2, run({"--bogus"}));
    EXPECT_EQ(2, run({"a", "b"}));
    EXPECT_EQ(2, run({"--grammar", "nope"}));
    EXPECT_EQ(2, run({"/nonexistent/recog/input"}));
}
