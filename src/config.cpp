#include "config.hpp"

namespace arbiter {
using namespace std;

size_t JUDGE_WORKERS = 4;
size_t GJ_PARALLELISM = 4;
string SANDBOX_URL = "http://localhost:5050";
int SANDBOX_RETRIES = 2;
int SANDBOX_GUARD_TIME = 2000;   // 2s
int SUBMISSION_TIMEOUT = 300000;  // 5min
filesystem::path CHECKER_INCLUDE_DIR = "/lib/testlib";
int CHECKER_TIME_LIMIT = 10000;             // 10s
uint64_t CHECKER_MEM_LIMIT = 512ull << 20;  // 512M
uint64_t OUTPUT_LIMIT = 64ull << 20;        // 64M
uint64_t STDERR_LIMIT = 64ull << 10;        // 64K
int PROC_LIMIT = 64;

}  // namespace arbiter
