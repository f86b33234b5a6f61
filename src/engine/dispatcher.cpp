#include "engine/dispatcher.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"

namespace coderun {
using namespace std;

execution_dispatcher::execution_dispatcher(execution_orchestrator &orchestrator, size_t worker_count)
    : orchestrator(orchestrator), worker_count(max<size_t>(1, worker_count)) {}

execution_dispatcher::~execution_dispatcher() {
    stop();
}

void execution_dispatcher::start() {
    if (!workers.empty()) return;
    for (size_t i = 0; i < worker_count; ++i)
        workers.emplace_back([this, i] { worker_loop(i); });
    LOG(INFO) << "Started " << worker_count << " execution workers";
}

result<code_execution> execution_dispatcher::submit(const execution_request &request, completion_callback callback) {
    if (stopping) return engine_error(error_kind::INTERNAL_ERROR, "dispatcher is stopping");

    auto submitted = orchestrator.submit(request);
    if (!is_ok(submitted)) return submitted;

    auto &execution = get<code_execution>(submitted);
    if (!queue.push({execution, move(callback)})) {
        // 队列在 submit 期间被关闭，直接在当前线程中结束这个执行
        orchestrator.cancel(execution.id);
        orchestrator.run(execution);
        return engine_error(error_kind::INTERNAL_ERROR, "dispatcher is stopping");
    }
    return submitted;
}

void execution_dispatcher::stop() {
    stopping = true;
    queue.close();
    for (auto &worker : workers)
        if (worker.joinable()) worker.join();
    if (!workers.empty()) LOG(INFO) << "All execution workers stopped";
    workers.clear();
}

size_t execution_dispatcher::pending() const {
    return queue.size();
}

void execution_dispatcher::worker_loop(size_t worker_id) {
    while (true) {
        job next;
        if (!queue.pop_for(next, chrono::milliseconds(100))) {
            // 队列关闭后，在队列为空时退出 worker
            if (queue.is_closed() && queue.size() == 0) break;
            continue;
        }

        DLOG(INFO) << "Worker " << worker_id << " picked execution " << next.execution.id;
        code_execution finished = orchestrator.run(move(next.execution));
        if (next.callback) {
            try {
                next.callback(finished);
            } catch (std::exception &ex) {
                LOG(ERROR) << "Completion callback of execution " << finished.id << " failed: " << ex.what();
            }
        }
    }
}

}  // namespace coderun
