#include "tool_executor.h"
#include "logger.h"

namespace guild_voice {

ToolExecutor::ToolExecutor(ToolRegistry* registry, size_t max_concurrent)
    : registry_(registry), running_(true) {
    if (max_concurrent == 0) {
        max_concurrent = 1;
    }
    for (size_t i = 0; i < max_concurrent; ++i) {
        worker_threads_.emplace_back(&ToolExecutor::worker_thread, this);
    }
}

ToolExecutor::~ToolExecutor() {
    shutdown();

    for (auto& thread : worker_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

bool ToolExecutor::execute_async(const ToolExecutionRequest& call,
                                 ToolExecutionCallback callback,
                                 int timeout_ms) {
    if (!running_) {
        Logger::warn("ToolExecutor is shutdown, cannot execute tool: " + call.tool_name);
        return false;
    }

    if (!registry_ || !registry_->has_tool(call.tool_name)) {
        Logger::error("Tool not found: " + call.tool_name);
        if (callback) {
            ToolExecutionResult result;
            result.tool_call_id = call.tool_call_id;
            result.result = ToolResult::error_result("Tool not found: " + call.tool_name);
            callback(result);
        }
        return false;
    }

    ExecutionTask task;
    task.call = call;
    task.callback = std::move(callback);
    task.timeout_ms = timeout_ms;
    task.start_time = std::chrono::steady_clock::now();

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        task_queue_.push(std::move(task));
    }

    queue_cv_.notify_one();
    return true;
}

ToolExecutionResult ToolExecutor::execute_sync(const ToolExecutionRequest& call, int timeout_ms) {
    // Shared with the callback, which may outlive this call after a timeout
    struct SyncState {
        std::mutex mutex;
        std::condition_variable cv;
        bool completed = false;
        ToolExecutionResult result;
    };
    auto state = std::make_shared<SyncState>();

    auto callback = [state](const ToolExecutionResult& res) {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->result = res;
            state->completed = true;
        }
        state->cv.notify_one();
    };

    if (!execute_async(call, callback, timeout_ms)) {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->completed) {
            return state->result;
        }
        ToolExecutionResult result;
        result.tool_call_id = call.tool_call_id;
        result.result = ToolResult::error_result("Failed to queue tool execution");
        return result;
    }

    std::unique_lock<std::mutex> lock(state->mutex);
    if (timeout_ms > 0) {
        if (!state->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                [&] { return state->completed; })) {
            ToolExecutionResult result;
            result.tool_call_id = call.tool_call_id;
            result.result = ToolResult::error_result("Tool execution timeout");
            return result;
        }
    } else {
        state->cv.wait(lock, [&] { return state->completed; });
    }

    return state->result;
}

bool ToolExecutor::is_idle() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return task_queue_.empty() && active_executions_ == 0;
}

size_t ToolExecutor::pending_count() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return task_queue_.size() + active_executions_;
}

bool ToolExecutor::wait_for_completion(int timeout_ms) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    auto idle = [this] { return task_queue_.empty() && active_executions_ == 0; };
    if (timeout_ms > 0) {
        return idle_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), idle);
    }
    idle_cv_.wait(lock, idle);
    return true;
}

void ToolExecutor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_ = false;
    }
    queue_cv_.notify_all();
}

void ToolExecutor::worker_thread() {
    while (true) {
        ExecutionTask task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] {
                return !task_queue_.empty() || !running_;
            });

            // Drain what was queued before shutdown
            if (task_queue_.empty()) {
                break;
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
            active_executions_++;
        }

        execute_task(task);

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            active_executions_--;
        }
        idle_cv_.notify_all();
    }
}

void ToolExecutor::execute_task(const ExecutionTask& task) {
    ToolExecutionResult result;
    result.tool_call_id = task.call.tool_call_id;

    if (task.timeout_ms > 0) {
        auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - task.start_time).count();
        if (waited >= task.timeout_ms) {
            result.result = ToolResult::error_result("Tool execution timeout");
            if (task.callback) {
                task.callback(result);
            }
            return;
        }
    }

    LOG_TOOL("Executing " + task.call.tool_name + " for user " + task.call.context.user_id);
    try {
        result.result = registry_->execute(task.call.tool_name, task.call.context, task.call.params_json);
    } catch (const std::exception& e) {
        Logger::error("Tool execution exception for " + task.call.tool_name + ": " + e.what());
        result.result = ToolResult::error_result("Tool execution exception: " + std::string(e.what()));
    }

    if (task.callback) {
        task.callback(result);
    }
}

} // namespace guild_voice
