#include "common/utils.hpp"
#include <stdlib.h>
#include <time.h>

namespace grader {
using namespace std;

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

void set_env(const string &key, const string &value, bool replace) {
    setenv(key.c_str(), value.c_str(), replace);
}

elapsed_time::elapsed_time() {
    start = chrono::steady_clock::now();
}

double elapsed_time::seconds() const {
    return chrono::duration<double>(chrono::steady_clock::now() - start).count();
}

string format_time(chrono::system_clock::time_point tp) {
    time_t seconds = chrono::system_clock::to_time_t(tp);
    auto millis = chrono::duration_cast<chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    struct tm utc;
    gmtime_r(&seconds, &utc);
    char buf[32];
    strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);
    return fmt::format("{}.{:03d}Z", buf, (int)millis);
}

}  // namespace grader
