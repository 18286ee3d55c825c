#include "sandbox/sandbox.hpp"

namespace arbiter::sandbox {
using namespace std;

sandbox_file sandbox_file::from_content(string content) {
    sandbox_file file;
    file.content = move(content);
    return file;
}

sandbox_file sandbox_file::from_cache(string file_id) {
    sandbox_file file;
    file.file_id = move(file_id);
    return file;
}

bool sandbox_file::cached() const {
    return !file_id.empty();
}

bool execution_result::success() const {
    return status == execution_status::SUCCESS;
}

sandbox::~sandbox() = default;

}  // namespace arbiter::sandbox
