#include "worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/exceptions.hpp"
#include "server/local_store.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

// 停止 worker 的标记
static atomic<bool> stop{false};

void stop_workers() {
    stop = true;
}

static void worker_loop(size_t worker_id, concurrent_queue<fs::path> &submission_queue, judging_orchestrator &orchestrator, server::problem_store &problems, worker_stats &stats) {
    fs::path path;
    while (!stop && submission_queue.pop(path)) {
        try {
            submission submit = server::load_submission(path, problems);
            orchestrator.submit(submit);
            ++stats.judged;
        } catch (configuration_error &ex) {
            LOG(ERROR) << "Worker " << worker_id << " rejected " << path.string() << ": " << ex.what();
            ++stats.rejected;
        } catch (already_in_progress &ex) {
            LOG(ERROR) << "Worker " << worker_id << " skipped " << path.string() << ": " << ex.what();
            ++stats.rejected;
        } catch (std::exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed when judging " << path.string() << ", " << ex.what() << endl
                       << boost::diagnostic_information(ex);
            ++stats.rejected;
        }
    }
    DLOG(INFO) << "Worker " << worker_id << " exited";
}

thread start_worker(size_t worker_id, concurrent_queue<fs::path> &submission_queue, judging_orchestrator &orchestrator, server::problem_store &problems, worker_stats &stats) {
    return thread([&, worker_id] {
        worker_loop(worker_id, submission_queue, orchestrator, problems, stats);
    });
}

}  // namespace grader
