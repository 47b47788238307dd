#pragma once

#include "tool.h"
#include "tool_registry.h"
#include <string>
#include <functional>
#include <memory>
#include <vector>
#include <thread>
#include <atomic>
#include <mutex>
#include <queue>
#include <chrono>
#include <condition_variable>

namespace guild_voice {

/**
 * @brief Tool execution request structure
 */
struct ToolExecutionRequest {
    std::string tool_name;
    std::string tool_call_id;  // Caller-chosen id echoed in the result
    ToolCallContext context;
    std::string params_json;   // Parameters as JSON string
};

/**
 * @brief Tool execution result with call ID
 */
struct ToolExecutionResult {
    std::string tool_call_id;
    ToolResult result;
};

/**
 * @brief Callback type for tool execution completion
 */
using ToolExecutionCallback = std::function<void(const ToolExecutionResult&)>;

/**
 * @brief Worker pool for tool calls
 *
 * Voice tools block for whole listen cycles, so they run on worker threads
 * instead of the command loop. Results are delivered through callbacks on
 * the worker thread.
 */
class ToolExecutor {
public:
    /**
     * @brief Construct tool executor with registry
     * @param registry Tool registry containing available tools (not owned)
     * @param max_concurrent Number of worker threads
     */
    explicit ToolExecutor(ToolRegistry* registry, size_t max_concurrent = 2);

    /**
     * @brief Destructor - finishes queued executions, then joins workers
     */
    ~ToolExecutor();

    // Non-copyable
    ToolExecutor(const ToolExecutor&) = delete;
    ToolExecutor& operator=(const ToolExecutor&) = delete;

    /**
     * @brief Execute a tool asynchronously
     * @param call Tool call request
     * @param callback Called when execution completes
     * @param timeout_ms Drop the call if it waited longer than this in the queue (0 = never)
     * @return true if queued, false if the executor is shut down or the tool is unknown
     */
    bool execute_async(const ToolExecutionRequest& call,
                       ToolExecutionCallback callback,
                       int timeout_ms = 0);

    /**
     * @brief Execute a tool and block until it completes
     * @param timeout_ms Maximum wait (0 = no timeout)
     */
    ToolExecutionResult execute_sync(const ToolExecutionRequest& call, int timeout_ms = 0);

    /**
     * @brief Check if executor is idle (no pending executions)
     */
    bool is_idle() const;

    /**
     * @brief Get number of queued and executing tools
     */
    size_t pending_count() const;

    /**
     * @brief Wait for all pending executions to complete
     * @param timeout_ms Maximum time to wait (0 = wait indefinitely)
     * @return true if all completed, false if timeout
     */
    bool wait_for_completion(int timeout_ms = 0);

    /**
     * @brief Stop accepting new executions
     */
    void shutdown();

private:
    struct ExecutionTask {
        ToolExecutionRequest call;
        ToolExecutionCallback callback;
        int timeout_ms = 0;
        std::chrono::steady_clock::time_point start_time;
    };

    void worker_thread();
    void execute_task(const ExecutionTask& task);

    ToolRegistry* registry_;
    std::atomic<bool> running_;
    size_t active_executions_ = 0;

    std::queue<ExecutionTask> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;

    std::vector<std::thread> worker_threads_;
};

} // namespace guild_voice
