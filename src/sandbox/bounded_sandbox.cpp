#include "sandbox/bounded_sandbox.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"

namespace arbiter::sandbox {
using namespace std;

bounded_sandbox::bounded_sandbox(sandbox &engine, semaphore &slots, int retries, chrono::milliseconds backoff)
    : engine(engine), slots(slots), retries(retries), backoff(backoff) {}

execution_result bounded_sandbox::execute(const execution_request &request, const cancellation_token &token) {
    for (int attempt = 0;; ++attempt) {
        try {
            semaphore_guard slot(slots, token);
            return engine.execute(request, token);
        } catch (sandbox_unavailable &ex) {
            if (attempt >= retries) throw;
            LOG(WARNING) << "Sandbox unavailable, retrying (" << attempt + 1 << "/" << retries << "): " << ex.what();
        }

        if (!token.sleep_for(backoff * (attempt + 1)))
            token.throw_if_cancelled();
    }
}

void bounded_sandbox::remove_file(const string &file_id) {
    semaphore_guard slot(slots);
    engine.remove_file(file_id);
}

}  // namespace arbiter::sandbox
