#pragma once
/// @file gateway/tasks.hpp
/// @brief Registry of running long tool invocations, for progress and cooperative cancellation

#include "mcpgate/types.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcpgate::gateway
{

struct TaskInfo
{
    std::string id;
    std::string name;
    bool cancelled{false};
    std::chrono::system_clock::time_point start_time;
    int total_steps{0};
    int current_step{0};
};

Json to_json(const TaskInfo& task);

/// Owned, thread-safe task table. All mutation goes through start, advance,
/// cancel and complete. Cancellation only sets a flag; the running tool
/// checks it between steps.
///
/// Task ids are minted per invocation. Callers refer to their own requests by
/// a request key, which bind_request maps to the task serving it.
class TaskRegistry
{
  public:
    /// Fresh id of the form "task_<epoch ms>_<sequence>", unique per registry.
    std::string next_id();

    /// Throws ValidationError when id is already running.
    void start(const std::string& id, const std::string& name, int total_steps);

    /// Record one more completed step; returns the new step count, or
    /// nullopt when the task is unknown.
    std::optional<int> advance(const std::string& id);

    /// False when no such task is running.
    bool cancel(const std::string& id);

    /// Remove the task, whatever its outcome. Unknown ids are ignored.
    void complete(const std::string& id);

    /// Route cancellations for request_key to task id while the call runs.
    void bind_request(const std::string& request_key, const std::string& id);
    void unbind_request(const std::string& request_key, const std::string& id);

    /// Cancel the running tasks bound to request_key; returns how many.
    size_t cancel_request(const std::string& request_key);

    bool is_cancelled(const std::string& id) const;
    std::optional<TaskInfo> get(const std::string& id) const;
    std::vector<TaskInfo> snapshot() const;
    size_t size() const;

  private:
    mutable std::mutex mutex_;
    std::map<std::string, TaskInfo> tasks_;
    std::multimap<std::string, std::string> requests_;
    uint64_t sequence_{0};
};

/// Registers a task for its lifetime and removes it on every exit path.
class TaskScope
{
  public:
    TaskScope(TaskRegistry& registry, std::string id, const std::string& name, int total_steps);
    ~TaskScope();

    TaskScope(const TaskScope&) = delete;
    TaskScope& operator=(const TaskScope&) = delete;

    bool cancelled() const
    {
        return registry_.is_cancelled(id_);
    }

    void advance()
    {
        registry_.advance(id_);
    }

    const std::string& id() const
    {
        return id_;
    }

  private:
    TaskRegistry& registry_;
    std::string id_;
};

} // namespace mcpgate::gateway
