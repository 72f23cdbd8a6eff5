#include "config.hpp"

namespace grader {
using namespace std;

filesystem::path RUN_DIR = filesystem::temp_directory_path() / "grader";
bool DEBUG = false;
double GRACE_PERIOD = 1;
double BUILD_TIME_LIMIT = 10;
int64_t BUILD_MEMORY_LIMIT = 1LL << 30;  // 1G
size_t OUTPUT_LIMIT = 64 << 20;          // 64M
size_t ERROR_LIMIT = 64 << 10;           // 64K
int64_t FILE_LIMIT = 64 << 20;           // 64M
int PROCESS_LIMIT = -1;
size_t TEST_WORKERS = 1;
bool USE_CGROUP = false;
bool USE_SECCOMP = true;

}  // namespace grader
