#include "TaskDispatcher.h"
#include "observability/Logging.h"

namespace cache {

static void run_guarded(const TaskDispatcher::Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        observability::log_error("dispatch.task_exception", {{"err", std::string(e.what())}});
    }
}

void AsioTaskDispatcher::dispatch(Task task) {
    boost::asio::post(ioc_, [task = std::move(task)]() { run_guarded(task); });
}

}
