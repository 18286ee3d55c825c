#include <algorithm>
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "judge/pipeline.hpp"
#include "test/fake_sandbox.hpp"

using namespace std;
using namespace arbiter;
using namespace arbiter::test;
using namespace std::chrono_literals;

/**
 * @brief 构造一个提交，每个测试点的标准输出等于输入
 */
static submission echo_submission(const string &language, int cases) {
    submission submit;
    submit.judge_id = 1;
    submit.language = language;
    submit.source = "int main() {}";
    submit.time_limit = 1000ms;
    submit.memory_limit = 256ull << 20;
    for (int i = 0; i < cases; ++i) {
        string data = to_string(i) + "\n";
        submit.test_cases.push_back({data, data, nullopt, nullopt});
    }
    return submit;
}

class PipelineTest : public ::testing::Test {
protected:
    language_registry registry = language_registry::builtin();
    fake_sandbox fake;
    cancellation_token token;
    pipeline_options options;

    submission_verdict judge(const submission &submit) {
        judge_pipeline pipeline(submit, registry, fake, options, token);
        return pipeline.run();
    }
};

TEST_F(PipelineTest, AcceptedTest) {
    auto submit = echo_submission("cpp", 3);
    auto result = judge(submit);

    EXPECT_EQ(result.status, verdict::ACCEPTED);
    EXPECT_EQ(result.judge_id, 1u);
    ASSERT_EQ(result.cases.size(), 3u);
    for (auto &c : result.cases) EXPECT_EQ(c.status, verdict::ACCEPTED);
    EXPECT_EQ(fake.compile_calls.load(), 1);
    EXPECT_EQ(fake.run_calls.load(), 3);
    EXPECT_EQ(result.time, 10ms);
    EXPECT_EQ(result.memory, 1u << 20);
}

TEST_F(PipelineTest, StateTransitionTest) {
    auto submit = echo_submission("cpp", 2);
    judge_pipeline pipeline(submit, registry, fake, options, token);

    EXPECT_EQ(pipeline.state(), pipeline_state::QUEUED);
    pipeline.step();
    EXPECT_EQ(pipeline.state(), pipeline_state::COMPILING);
    pipeline.step();
    EXPECT_EQ(pipeline.state(), pipeline_state::RUNNING);
    EXPECT_EQ(pipeline.case_index(), 0u);
    pipeline.step();
    EXPECT_EQ(pipeline.state(), pipeline_state::CHECKING);
    pipeline.step();
    EXPECT_EQ(pipeline.state(), pipeline_state::RUNNING);
    EXPECT_EQ(pipeline.case_index(), 1u);
    pipeline.step();
    EXPECT_EQ(pipeline.state(), pipeline_state::CHECKING);
    pipeline.step();
    EXPECT_EQ(pipeline.state(), pipeline_state::FINALIZING);
    pipeline.step();
    EXPECT_EQ(pipeline.state(), pipeline_state::DONE);

    pipeline.step();
    EXPECT_EQ(pipeline.state(), pipeline_state::DONE);
    EXPECT_EQ(fake.total_calls(), 3);
    EXPECT_EQ(pipeline.error(), nullptr);
}

TEST_F(PipelineTest, CompilationErrorTest) {
    fake.on_compile = [](const execution_request &) {
        return fake_sandbox::exited(1, "main.cpp:1:1: error: expected unqualified-id");
    };
    auto result = judge(echo_submission("cpp", 3));

    EXPECT_EQ(result.status, verdict::COMPILATION_ERROR);
    EXPECT_TRUE(result.cases.empty());
    EXPECT_NE(result.compile_log.find("expected unqualified-id"), string::npos);
    EXPECT_EQ(fake.run_calls.load(), 0);
    EXPECT_TRUE(fake.removed_files().empty());
}

TEST_F(PipelineTest, CompilationTimeoutTest) {
    fake.on_compile = [](const execution_request &) {
        return fake_sandbox::with_status(execution_status::TIME_LIMIT_EXCEEDED);
    };
    auto result = judge(echo_submission("cpp", 1));

    EXPECT_EQ(result.status, verdict::COMPILATION_ERROR);
    EXPECT_NE(result.compile_log.find("time limit"), string::npos);
    EXPECT_EQ(fake.run_calls.load(), 0);
}

TEST_F(PipelineTest, CompileRequestTest) {
    judge(echo_submission("c", 1));

    auto requests = fake.requests();
    ASSERT_EQ(requests.size(), 2u);
    auto &compile = requests[0];
    EXPECT_EQ(compile.args.front(), "/usr/bin/gcc");
    EXPECT_EQ(compile.copy_in.at("main.c").content, "int main() {}");
    EXPECT_EQ(compile.copy_out_cached, vector<string>({"main"}));

    auto &run = requests[1];
    EXPECT_EQ(run.args, vector<string>({"/w/main"}));
    EXPECT_EQ(run.copy_in.at("main").file_id, "file-0");
    EXPECT_EQ(run.stdin_content, "0\n");
    EXPECT_EQ(run.cpu_time_limit, 1000ms);
    EXPECT_EQ(run.wall_time_limit, 1500ms);
    EXPECT_EQ(run.memory_limit, 256ull << 20);
}

TEST_F(PipelineTest, InterpretedLanguageTest) {
    auto submit = echo_submission("python3", 2);
    submit.source = "print(input())";
    auto result = judge(submit);

    EXPECT_EQ(result.status, verdict::ACCEPTED);
    EXPECT_EQ(fake.compile_calls.load(), 0);
    EXPECT_EQ(fake.run_calls.load(), 2);

    auto requests = fake.requests();
    EXPECT_EQ(requests[0].args, vector<string>({"/usr/bin/python3", "main.py"}));
    EXPECT_EQ(requests[0].copy_in.at("main.py").content, "print(input())");
    EXPECT_EQ(requests[0].memory_limit, (256ull << 20) + (32ull << 20));
}

TEST_F(PipelineTest, LanguageHeadroomTest) {
    auto submit = echo_submission("java", 1);
    judge(submit);

    auto requests = fake.requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[1].cpu_time_limit, 2000ms);
    EXPECT_EQ(requests[1].wall_time_limit, 3000ms);
    EXPECT_EQ(requests[1].memory_limit, (256ull << 20) + (256ull << 20));
}

TEST_F(PipelineTest, PerCaseLimitTest) {
    auto submit = echo_submission("cpp", 2);
    submit.test_cases[1].time_limit = 3000ms;
    submit.test_cases[1].memory_limit = 64ull << 20;
    judge(submit);

    auto requests = fake.requests();
    ASSERT_EQ(requests.size(), 3u);
    EXPECT_EQ(requests[1].cpu_time_limit, 1000ms);
    EXPECT_EQ(requests[2].cpu_time_limit, 3000ms);
    EXPECT_EQ(requests[2].memory_limit, 64ull << 20);
}

TEST_F(PipelineTest, ShortCircuitTest) {
    fake.on_run = [](const execution_request &request) {
        return fake_sandbox::succeed(request.stdin_content == "1\n" ? "wrong\n" : request.stdin_content);
    };
    auto result = judge(echo_submission("cpp", 4));

    EXPECT_EQ(result.status, verdict::WRONG_ANSWER);
    ASSERT_EQ(result.cases.size(), 2u);
    EXPECT_EQ(result.cases[0].status, verdict::ACCEPTED);
    EXPECT_EQ(result.cases[1].status, verdict::WRONG_ANSWER);
    EXPECT_EQ(fake.run_calls.load(), 2);
}

TEST_F(PipelineTest, AllCasesTest) {
    fake.on_run = [](const execution_request &request) {
        if (request.stdin_content == "0\n") return fake_sandbox::succeed("wrong\n");
        if (request.stdin_content == "2\n") return fake_sandbox::signalled(11);
        return fake_sandbox::succeed(request.stdin_content);
    };
    auto submit = echo_submission("cpp", 4);
    submit.mode = judge_mode::ALL_CASES;
    auto result = judge(submit);

    EXPECT_EQ(result.status, verdict::RUNTIME_ERROR);
    ASSERT_EQ(result.cases.size(), 4u);
    EXPECT_EQ(result.cases[0].status, verdict::WRONG_ANSWER);
    EXPECT_EQ(result.cases[1].status, verdict::ACCEPTED);
    EXPECT_EQ(result.cases[2].status, verdict::RUNTIME_ERROR);
    EXPECT_EQ(result.cases[2].execution.signal, 11);
    EXPECT_EQ(result.cases[3].status, verdict::ACCEPTED);
}

TEST_F(PipelineTest, AllCasesMemoryOverTimeTest) {
    fake.on_run = [](const execution_request &request) {
        if (request.stdin_content == "0\n") return fake_sandbox::with_status(execution_status::TIME_LIMIT_EXCEEDED);
        if (request.stdin_content == "1\n") return fake_sandbox::with_status(execution_status::MEMORY_LIMIT_EXCEEDED);
        return fake_sandbox::with_status(execution_status::TIME_LIMIT_EXCEEDED);
    };
    auto submit = echo_submission("cpp", 3);
    submit.mode = judge_mode::ALL_CASES;
    auto result = judge(submit);

    EXPECT_EQ(result.status, verdict::MEMORY_LIMIT_EXCEEDED);
    ASSERT_EQ(result.cases.size(), 3u);
    EXPECT_EQ(result.cases[0].status, verdict::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(result.cases[1].status, verdict::MEMORY_LIMIT_EXCEEDED);
    EXPECT_EQ(result.cases[2].status, verdict::TIME_LIMIT_EXCEEDED);
}

TEST_F(PipelineTest, AllCasesOutputLimitOverCheckerErrorTest) {
    fake.on_run = [](const execution_request &request) {
        if (request.stdin_content != "1\n") return fake_sandbox::succeed(request.stdin_content);
        auto result = fake_sandbox::exited(-1);
        result.truncated = true;
        return result;
    };
    // 比较器在每个测试点上都出错
    fake.on_checker = [](const execution_request &) { return fake_sandbox::exited(3, "bad checker"); };
    auto submit = echo_submission("cpp", 3);
    submit.mode = judge_mode::ALL_CASES;
    submit.checker = "int main() { return 3; }";
    auto result = judge(submit);

    EXPECT_EQ(result.status, verdict::OUTPUT_LIMIT_EXCEEDED);
    ASSERT_EQ(result.cases.size(), 3u);
    EXPECT_EQ(result.cases[0].status, verdict::CHECKER_ERROR);
    EXPECT_EQ(result.cases[1].status, verdict::OUTPUT_LIMIT_EXCEEDED);
    EXPECT_EQ(result.cases[2].status, verdict::CHECKER_ERROR);
    EXPECT_EQ(fake.checker_calls.load(), 2);
}

TEST_F(PipelineTest, ResourceUsageTest) {
    fake.on_run = [](const execution_request &request) {
        auto result = fake_sandbox::succeed(request.stdin_content);
        if (request.stdin_content == "1\n") result.cpu_time = 250ms;
        if (request.stdin_content == "2\n") result.memory = 40u << 20;
        return result;
    };
    auto result = judge(echo_submission("cpp", 3));

    EXPECT_EQ(result.status, verdict::ACCEPTED);
    EXPECT_EQ(result.time, 250ms);
    EXPECT_EQ(result.memory, 40u << 20);
}

TEST_F(PipelineTest, TimeLimitTest) {
    fake.on_run = [](const execution_request &) {
        auto result = fake_sandbox::with_status(execution_status::TIME_LIMIT_EXCEEDED);
        result.cpu_time = 1000ms;
        return result;
    };
    auto result = judge(echo_submission("python3", 2));

    EXPECT_EQ(result.status, verdict::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(result.cases.size(), 1u);
    EXPECT_EQ(fake.checker_calls.load(), 0);
}

TEST_F(PipelineTest, CpuTimeOverLimitTest) {
    fake.on_run = [](const execution_request &request) {
        auto result = fake_sandbox::succeed(request.stdin_content);
        result.cpu_time = 1001ms;
        return result;
    };
    auto result = judge(echo_submission("cpp", 1));
    EXPECT_EQ(result.status, verdict::TIME_LIMIT_EXCEEDED);
}

TEST_F(PipelineTest, MemoryLimitTest) {
    fake.on_run = [](const execution_request &) {
        return fake_sandbox::with_status(execution_status::MEMORY_LIMIT_EXCEEDED);
    };
    EXPECT_EQ(judge(echo_submission("cpp", 1)).status, verdict::MEMORY_LIMIT_EXCEEDED);
}

TEST_F(PipelineTest, OutputLimitTest) {
    fake.on_run = [](const execution_request &) {
        auto result = fake_sandbox::exited(-1);
        result.truncated = true;
        return result;
    };
    EXPECT_EQ(judge(echo_submission("cpp", 1)).status, verdict::OUTPUT_LIMIT_EXCEEDED);
}

TEST_F(PipelineTest, RuntimeErrorTest) {
    fake.on_run = [](const execution_request &) {
        return fake_sandbox::exited(3, "terminate called after throwing an instance of 'std::out_of_range'");
    };
    auto result = judge(echo_submission("cpp", 1));

    EXPECT_EQ(result.status, verdict::RUNTIME_ERROR);
    ASSERT_EQ(result.cases.size(), 1u);
    EXPECT_EQ(result.cases[0].execution.exit_code, 3);
    EXPECT_NE(result.cases[0].message.find("out_of_range"), string::npos);
}

TEST_F(PipelineTest, CheckerOverridesExpectedOutputTest) {
    fake.on_run = [](const execution_request &) { return fake_sandbox::succeed("anything\n"); };
    auto submit = echo_submission("cpp", 2);
    submit.checker = "int main() { return 0; }";
    submit.test_cases[1].output = nullopt;
    auto result = judge(submit);

    EXPECT_EQ(result.status, verdict::ACCEPTED);
    EXPECT_EQ(fake.checker_compile_calls.load(), 1);
    EXPECT_EQ(fake.checker_calls.load(), 2);

    auto requests = fake.requests();
    auto last = requests.back();
    EXPECT_EQ(last.copy_in.at("output.txt").content, "anything\n");
    EXPECT_EQ(last.copy_in.at("answer.txt").content, "");
}

TEST_F(PipelineTest, CheckerCompilationFailureTest) {
    fake.on_checker_compile = [](const execution_request &) { return fake_sandbox::exited(1, "syntax error"); };
    auto submit = echo_submission("cpp", 2);
    submit.checker = "int main( {";
    auto result = judge(submit);

    EXPECT_EQ(result.status, verdict::CHECKER_ERROR);
    ASSERT_EQ(result.cases.size(), 1u);
    EXPECT_NE(result.cases[0].message.find("syntax error"), string::npos);
    EXPECT_EQ(fake.checker_calls.load(), 0);
}

TEST_F(PipelineTest, SandboxUnavailableTest) {
    fake.failures = 1;
    auto submit = echo_submission("cpp", 1);
    judge_pipeline pipeline(submit, registry, fake, options, token);

    EXPECT_THROW(pipeline.run(), sandbox_unavailable);
    EXPECT_EQ(pipeline.state(), pipeline_state::ERRORED);
    EXPECT_NE(pipeline.error(), nullptr);
}

TEST_F(PipelineTest, SandboxErrorTest) {
    fake.on_run = [](const execution_request &) {
        return fake_sandbox::with_status(execution_status::SANDBOX_ERROR);
    };
    auto submit = echo_submission("cpp", 1);
    judge_pipeline pipeline(submit, registry, fake, options, token);

    EXPECT_THROW(pipeline.run(), internal_error);
    EXPECT_EQ(pipeline.state(), pipeline_state::ERRORED);
    EXPECT_EQ(fake.removed_files(), vector<string>({"file-0"}));
}

TEST_F(PipelineTest, CancelledTest) {
    token.cancel();
    auto submit = echo_submission("cpp", 1);
    judge_pipeline pipeline(submit, registry, fake, options, token);

    EXPECT_THROW(pipeline.run(), judge_timeout);
    EXPECT_EQ(fake.total_calls(), 0);
}

TEST_F(PipelineTest, ReleaseArtifactsTest) {
    auto submit = echo_submission("cpp", 2);
    submit.checker = "int main() { return 0; }";
    judge(submit);

    auto removed = fake.removed_files();
    sort(removed.begin(), removed.end());
    EXPECT_EQ(removed, vector<string>({"file-0", "file-1"}));
}

TEST_F(PipelineTest, IdempotenceTest) {
    auto submit = echo_submission("cpp", 3);
    auto first = judge(submit);
    auto second = judge(submit);

    EXPECT_EQ(first.status, second.status);
    ASSERT_EQ(first.cases.size(), second.cases.size());
    for (size_t i = 0; i < first.cases.size(); ++i)
        EXPECT_EQ(first.cases[i].status, second.cases[i].status);
    EXPECT_EQ(first.time, second.time);
    EXPECT_EQ(first.memory, second.memory);
}

TEST(PipelineStateTest, DisplayMessageTest) {
    EXPECT_STREQ(get_display_message(pipeline_state::QUEUED), "Queued");
    EXPECT_STREQ(get_display_message(pipeline_state::ERRORED), "Errored");
}
