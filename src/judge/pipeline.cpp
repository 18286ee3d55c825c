#include "judge/pipeline.hpp"
#include <glog/logging.h>
#include <boost/assign.hpp>
#include <unordered_map>
#include "common/exceptions.hpp"

namespace arbiter {
using namespace std;
using sandbox::execution_request;
using sandbox::execution_result;
using sandbox::sandbox_file;

// clang-format off
static const unordered_map<pipeline_state, const char *> state_string = boost::assign::map_list_of
    (pipeline_state::QUEUED, "Queued")
    (pipeline_state::COMPILING, "Compiling")
    (pipeline_state::RUNNING, "Running")
    (pipeline_state::CHECKING, "Checking")
    (pipeline_state::FINALIZING, "Finalizing")
    (pipeline_state::DONE, "Done")
    (pipeline_state::ERRORED, "Errored");
// clang-format on

const char *get_display_message(pipeline_state state) {
    return state_string.at(state);
}

judge_pipeline::judge_pipeline(const submission &submit, const language_registry &registry, sandbox::sandbox &engine,
                               pipeline_options options, const cancellation_token &token)
    : submit(submit), lang(registry.find(submit.language)), engine(engine), options(move(options)), token(token) {
    judge_checker = make_checker(submit.checker, registry, engine, this->options.checker);
    outcome.judge_id = submit.judge_id;
}

judge_pipeline::~judge_pipeline() {
    release_artifacts();
}

pipeline_state judge_pipeline::state() const {
    return current;
}

size_t judge_pipeline::case_index() const {
    return index;
}

exception_ptr judge_pipeline::error() const {
    return failure;
}

void judge_pipeline::step() {
    if (current == pipeline_state::DONE || current == pipeline_state::ERRORED) return;

    try {
        token.throw_if_cancelled();
        switch (current) {
            case pipeline_state::QUEUED: start(); break;
            case pipeline_state::COMPILING: compile(); break;
            case pipeline_state::RUNNING: run_case(); break;
            case pipeline_state::CHECKING: check_case(); break;
            case pipeline_state::FINALIZING: finalize(); break;
            default: break;
        }
    } catch (infrastructure_error &) {
        fail(current_exception());
    } catch (std::exception &ex) {
        fail(make_exception_ptr(internal_error(ex.what())));
    }
}

submission_verdict judge_pipeline::run() {
    while (current != pipeline_state::DONE && current != pipeline_state::ERRORED)
        step();
    if (current == pipeline_state::ERRORED) rethrow_exception(failure);
    return outcome;
}

void judge_pipeline::start() {
    LOG(INFO) << "Judging " << submit << " with " << submit.test_cases.size() << " test cases";
    index = 0;
    current = lang.compiled() ? pipeline_state::COMPILING : pipeline_state::RUNNING;
}

void judge_pipeline::compile() {
    execution_request request;
    request.args = lang.compile_args(options.workdir);
    request.env = lang.env;
    request.cpu_time_limit = lang.compile_time_limit;
    request.wall_time_limit = lang.compile_time_limit * 2;
    request.memory_limit = lang.compile_memory_limit;
    request.proc_limit = options.proc_limit;
    request.stdout_limit = options.stderr_limit;
    request.stderr_limit = options.stderr_limit;
    request.copy_in[lang.source_name] = sandbox_file::from_content(submit.source);
    request.copy_out_cached = {lang.artifact_name};

    execution_result result = engine.execute(request, token);
    if (result.status == execution_status::SANDBOX_ERROR)
        throw internal_error("sandbox failed to compile " + lang.id + ": " + result.internal_error);

    outcome.compile_log = result.error.empty() ? result.output : result.error;
    auto artifact = result.cached_files.find(lang.artifact_name);
    if (result.success() && artifact != result.cached_files.end()) {
        artifact_id = artifact->second;
        current = pipeline_state::RUNNING;
        return;
    }
    if (result.success())
        throw internal_error("sandbox did not return compiled artifact " + lang.artifact_name);

    if (result.status == execution_status::TIME_LIMIT_EXCEEDED)
        outcome.compile_log = "Compilation exceeded the time limit\n" + outcome.compile_log;
    else if (result.status == execution_status::MEMORY_LIMIT_EXCEEDED)
        outcome.compile_log = "Compilation exceeded the memory limit\n" + outcome.compile_log;

    outcome.status = verdict::COMPILATION_ERROR;
    LOG(INFO) << submit << " failed to compile";
    current = pipeline_state::DONE;
}

void judge_pipeline::run_case() {
    const test_case &tc = submit.test_cases.at(index);
    auto time_limit = lang.adjust_time(submit.case_time_limit(tc));

    execution_request request;
    request.args = lang.run_args(options.workdir);
    request.env = lang.env;
    request.stdin_content = tc.input;
    request.cpu_time_limit = time_limit;
    request.wall_time_limit = chrono::milliseconds(static_cast<int64_t>(time_limit.count() * options.wall_time_factor));
    request.memory_limit = lang.adjust_memory(submit.case_memory_limit(tc));
    request.proc_limit = options.proc_limit;
    request.stdout_limit = options.output_limit;
    request.stderr_limit = options.stderr_limit;
    if (lang.compiled())
        request.copy_in[lang.artifact_name] = sandbox_file::from_cache(artifact_id);
    else
        request.copy_in[lang.source_name] = sandbox_file::from_content(submit.source);

    case_result result;
    result.execution = engine.execute(request, token);
    auto &execution = result.execution;
    if (execution.status == execution_status::SANDBOX_ERROR)
        throw internal_error("sandbox failed to run test case " + to_string(index) + ": " + execution.internal_error);

    if (execution.status == execution_status::TIME_LIMIT_EXCEEDED || execution.cpu_time > time_limit)
        result.status = verdict::TIME_LIMIT_EXCEEDED;
    else if (execution.status == execution_status::MEMORY_LIMIT_EXCEEDED)
        result.status = verdict::MEMORY_LIMIT_EXCEEDED;
    else if (execution.truncated)
        result.status = verdict::OUTPUT_LIMIT_EXCEEDED;
    else if (execution.status == execution_status::RUNTIME_ERROR)
        result.status = verdict::RUNTIME_ERROR;
    else {
        pending = move(result);
        current = pipeline_state::CHECKING;
        return;
    }

    if (result.status == verdict::RUNTIME_ERROR) result.message = execution.error;
    record(move(result));
    advance();
}

void judge_pipeline::check_case() {
    const test_case &tc = submit.test_cases.at(index);
    case_result result = move(pending);
    check_result checked = judge_checker->check(tc.input, tc.output, result.execution.output, token);
    result.status = checked.status;
    result.message = move(checked.message);
    record(move(result));
    advance();
}

void judge_pipeline::finalize() {
    verdict status = verdict::ACCEPTED;
    for (auto &result : outcome.cases) {
        if (submit.mode == judge_mode::SHORT_CIRCUIT) {
            if (result.status != verdict::ACCEPTED) {
                status = result.status;
                break;
            }
        } else {
            status = most_severe(status, result.status);
        }
    }
    outcome.status = status;
    LOG(INFO) << submit << " finished with " << get_display_message(status);
    current = pipeline_state::DONE;
    release_artifacts();
}

void judge_pipeline::record(case_result &&result) {
    VLOG(1) << submit << " test case " << index << ": " << get_display_message(result.status)
            << ", time " << result.execution.cpu_time.count() << "ms, memory " << result.execution.memory;
    outcome.time = max(outcome.time, result.execution.cpu_time);
    outcome.memory = max(outcome.memory, result.execution.memory);
    outcome.cases.push_back(move(result));
}

void judge_pipeline::advance() {
    bool failed = outcome.cases.back().status != verdict::ACCEPTED;
    if ((failed && submit.mode == judge_mode::SHORT_CIRCUIT) || index + 1 >= submit.test_cases.size()) {
        current = pipeline_state::FINALIZING;
    } else {
        ++index;
        current = pipeline_state::RUNNING;
    }
}

void judge_pipeline::fail(exception_ptr ex) {
    try {
        rethrow_exception(ex);
    } catch (std::exception &e) {
        LOG(ERROR) << submit << " errored while " << get_display_message(current) << ": " << e.what();
    }
    failure = ex;
    current = pipeline_state::ERRORED;
    release_artifacts();
}

void judge_pipeline::release_artifacts() noexcept {
    if (!artifact_id.empty()) {
        try {
            engine.remove_file(artifact_id);
        } catch (std::exception &ex) {
            LOG(WARNING) << "Unable to remove artifact " << artifact_id << " of " << submit << ": " << ex.what();
        }
        artifact_id.clear();
    }
    if (judge_checker) judge_checker->release();
}

}  // namespace arbiter
