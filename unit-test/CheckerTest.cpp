#include <algorithm>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "judge/checker.hpp"
#include "test/fake_sandbox.hpp"

using namespace std;
using namespace arbiter;
using namespace arbiter::test;
using namespace std::chrono_literals;

class CheckerTest : public ::testing::Test {
protected:
    language_registry registry = language_registry::builtin();
    fake_sandbox fake;
    cancellation_token token;
    checker_options options;

    unique_ptr<checker> make() {
        return make_checker(string("#include \"testlib.h\"\nint main() {}"), registry, fake, options);
    }
};

TEST_F(CheckerTest, ExitCodeTest) {
    auto checker = make();

    fake.on_checker = [](const execution_request &) { return fake_sandbox::succeed("ok 1 number"); };
    auto accepted = checker->check("1\n", string("2\n"), "2\n", token);
    EXPECT_EQ(accepted.status, verdict::ACCEPTED);

    fake.on_checker = [](const execution_request &) { return fake_sandbox::exited(1, "wrong answer expected 2, found 3"); };
    auto wrong = checker->check("1\n", string("2\n"), "3\n", token);
    EXPECT_EQ(wrong.status, verdict::WRONG_ANSWER);
    EXPECT_EQ(wrong.message, "wrong answer expected 2, found 3");

    fake.on_checker = [](const execution_request &) { return fake_sandbox::exited(2, "wrong output format"); };
    EXPECT_EQ(checker->check("1\n", string("2\n"), "x\n", token).status, verdict::WRONG_ANSWER);

    fake.on_checker = [](const execution_request &) { return fake_sandbox::exited(3, "FAIL"); };
    EXPECT_EQ(checker->check("1\n", string("2\n"), "2\n", token).status, verdict::CHECKER_ERROR);

    fake.on_checker = [](const execution_request &) { return fake_sandbox::signalled(11); };
    EXPECT_EQ(checker->check("1\n", string("2\n"), "2\n", token).status, verdict::CHECKER_ERROR);

    fake.on_checker = [](const execution_request &) { return fake_sandbox::with_status(execution_status::TIME_LIMIT_EXCEEDED); };
    EXPECT_EQ(checker->check("1\n", string("2\n"), "2\n", token).status, verdict::CHECKER_ERROR);

    fake.on_checker = [](const execution_request &) { return fake_sandbox::with_status(execution_status::MEMORY_LIMIT_EXCEEDED); };
    EXPECT_EQ(checker->check("1\n", string("2\n"), "2\n", token).status, verdict::CHECKER_ERROR);

    EXPECT_EQ(fake.checker_compile_calls.load(), 1);
    EXPECT_EQ(fake.checker_calls.load(), 7);
}

TEST_F(CheckerTest, InvocationTest) {
    options.include_dir = "/opt/testlib";
    options.time_limit = 3000ms;
    auto checker = make();
    checker->check("1 2\n", nullopt, "3\n", token);

    auto requests = fake.requests();
    ASSERT_EQ(requests.size(), 2u);

    auto &compile = requests[0];
    EXPECT_EQ(compile.args.front(), "/usr/bin/g++");
    EXPECT_NE(find(compile.args.begin(), compile.args.end(), "-I/opt/testlib"), compile.args.end());
    EXPECT_EQ(compile.copy_in.count("checker.cpp"), 1u);
    EXPECT_EQ(compile.copy_out_cached, vector<string>({"checker"}));

    auto &run = requests[1];
    EXPECT_EQ(run.args, vector<string>({"/w/checker", "input.txt", "output.txt", "answer.txt"}));
    EXPECT_EQ(run.cpu_time_limit, 3000ms);
    EXPECT_TRUE(run.copy_in.at("checker").cached());
    EXPECT_EQ(run.copy_in.at("input.txt").content, "1 2\n");
    EXPECT_EQ(run.copy_in.at("output.txt").content, "3\n");
    EXPECT_EQ(run.copy_in.at("answer.txt").content, "");
}

TEST_F(CheckerTest, CompilationFailureTest) {
    fake.on_checker_compile = [](const execution_request &) {
        return fake_sandbox::exited(1, "checker.cpp:1:10: fatal error: testlib.h: No such file or directory");
    };
    auto checker = make();

    auto first = checker->check("1\n", string("2\n"), "2\n", token);
    EXPECT_EQ(first.status, verdict::CHECKER_ERROR);
    EXPECT_NE(first.message.find("testlib.h"), string::npos);

    auto second = checker->check("1\n", string("2\n"), "2\n", token);
    EXPECT_EQ(second.status, verdict::CHECKER_ERROR);

    EXPECT_EQ(fake.checker_compile_calls.load(), 1);
    EXPECT_EQ(fake.checker_calls.load(), 0);
}

TEST_F(CheckerTest, SandboxErrorTest) {
    auto checker = make();
    fake.on_checker = [](const execution_request &) { return fake_sandbox::with_status(execution_status::SANDBOX_ERROR); };
    EXPECT_THROW(checker->check("1\n", string("2\n"), "2\n", token), internal_error);
}

TEST_F(CheckerTest, ReleaseArtifactTest) {
    {
        auto checker = make();
        checker->check("1\n", string("2\n"), "2\n", token);
        EXPECT_TRUE(fake.removed_files().empty());
    }
    EXPECT_EQ(fake.removed_files(), vector<string>({"file-0"}));
}

TEST_F(CheckerTest, DefaultComparatorTest) {
    auto checker = make_checker(nullopt, registry, fake, options);
    EXPECT_EQ(checker->check("1\n", string("2\n"), "2", token).status, verdict::ACCEPTED);
    EXPECT_EQ(checker->check("1\n", string("2\n"), "3", token).status, verdict::WRONG_ANSWER);
    EXPECT_EQ(fake.total_calls(), 0);
}
