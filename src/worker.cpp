#include "worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <optional>
#include <stdexcept>
#include "common/defer.hpp"
#include "common/exceptions.hpp"

namespace arbiter {
using namespace std;

static worker_options normalize(worker_options options) {
    if (options.workers == 0) throw invalid_argument("at least one worker is required");
    if (options.parallelism == 0) throw invalid_argument("sandbox parallelism must be positive");
    if (options.parallelism > options.workers) {
        // 每个提交同时最多只有一个沙箱调用，多出来的槽位永远用不到
        LOG(WARNING) << "Sandbox parallelism " << options.parallelism << " exceeds worker count "
                     << options.workers << ", clamped to " << options.workers;
        options.parallelism = options.workers;
    }
    if (options.sandbox_retries < 0) options.sandbox_retries = 0;
    return options;
}

worker_pool::worker_pool(const language_registry &registry, sandbox::sandbox &engine, worker_options options)
    : registry(registry),
      options(normalize(move(options))),
      slots(this->options.parallelism),
      bounded(engine, slots, this->options.sandbox_retries, this->options.retry_backoff) {}

worker_pool::~worker_pool() {
    stop();
}

void worker_pool::register_monitor(unique_ptr<monitor> &&monitor) {
    monitors.push_back(move(monitor));
}

void worker_pool::call_monitor(int worker_id, const function<void(monitor &)> &callback) {
    try {
        for (auto &monitor : monitors) callback(*monitor);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Worker " << worker_id << " has crashed when reporting monitoring information, " << ex.what();
    }
}

void worker_pool::start() {
    if (!threads.empty()) return;
    LOG(INFO) << "Starting " << options.workers << " workers with sandbox parallelism " << options.parallelism;
    for (size_t i = 0; i < options.workers; ++i) {
        int worker_id = static_cast<int>(i);
        threads.emplace_back([this, worker_id] { worker_loop(worker_id); });
    }
}

void worker_pool::stop() {
    queue.close();
    for (auto &thd : threads)
        if (thd.joinable()) thd.join();
    threads.clear();

    // 没有工作线程取走的任务需要显式失败，否则调用方只能拿到 broken_promise
    job j;
    while (queue.pop(j)) {
        LOG(WARNING) << "Worker pool stopped before judging " << *j.submit;
        j.result.set_exception(make_exception_ptr(
            internal_error("worker pool stopped before judging submission " + to_string(j.submit->judge_id))));
        j = job();
    }
}

future<submission_verdict> worker_pool::submit(submission submit) {
    try {
        validate(submit, registry);
    } catch (client_error &ex) {
        call_monitor(-1, [&](monitor &m) { m.reject_submission(ex.what()); });
        throw;
    }

    job j;
    j.submit = make_unique<submission>(move(submit));
    j.submit->judge_id = next_judge_id++;
    // 截止时间从进入队列开始计算，排队时间也计入总时间上限
    if (options.submission_timeout.count() > 0)
        j.token = make_unique<cancellation_token>(cancellation_token::clock::now() + options.submission_timeout);
    else
        j.token = make_unique<cancellation_token>();
    future<submission_verdict> result = j.result.get_future();

    DLOG(INFO) << "Admitted " << *j.submit;
    if (!queue.push(move(j)))
        throw internal_error("worker pool has been stopped");
    return result;
}

submission_verdict worker_pool::judge(submission submit) {
    return this->submit(move(submit)).get();
}

size_t worker_pool::active() const {
    return judging;
}

size_t worker_pool::pending() {
    return queue.size();
}

void worker_pool::judge_job(int worker_id, job &j) {
    ++judging;
    call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::JUDGING, ""); });
    call_monitor(worker_id, [&](monitor &m) { m.start_submission(*j.submit); });
    defer {
        --judging;
        call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::IDLE, ""); });
    };

    optional<submission_verdict> result;
    exception_ptr error;
    string message;
    {
        // 评测流程析构时删除沙箱中的编译产物，需要在返回结果之前完成
        try {
            judge_pipeline pipeline(*j.submit, registry, bounded, options.pipeline, *j.token);
            result = pipeline.run();
        } catch (std::exception &ex) {
            error = current_exception();
            message = ex.what();
        }
    }

    if (result) {
        call_monitor(worker_id, [&](monitor &m) { m.end_submission(*j.submit, result->status); });
        j.result.set_value(move(*result));
    } else {
        call_monitor(worker_id, [&](monitor &m) { m.report_error(*j.submit, message); });
        j.result.set_exception(error);
    }
}

void worker_pool::worker_loop(int worker_id) {
    call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::START, ""); });

    try {
        job j;
        while (queue.pop(j)) {
            judge_job(worker_id, j);
            j = job();
        }
    } catch (std::exception &ex) {
        LOG(ERROR) << "Worker " << worker_id << " crashed" << endl
                   << boost::diagnostic_information(ex);
        call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::CRASHED, ex.what()); });
        return;
    }

    call_monitor(worker_id, [&](monitor &m) { m.worker_state_changed(worker_id, worker_state::STOPPED, ""); });
}

}  // namespace arbiter
