#include "mcpgate/gateway/tasks.hpp"

#include "mcpgate/exceptions.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace mcpgate::gateway
{

namespace
{
std::string to_iso8601(std::chrono::system_clock::time_point tp)
{
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return os.str();
}
} // namespace

Json to_json(const TaskInfo& task)
{
    const int percentage =
        task.total_steps > 0 ? static_cast<int>(100.0 * task.current_step / task.total_steps + 0.5)
                             : 0;
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
                             std::chrono::system_clock::now() - task.start_time)
                             .count();
    return Json{{"id", task.id},
                {"name", task.name},
                {"status", task.cancelled ? "cancelled" : "running"},
                {"progress", task.current_step},
                {"total", task.total_steps},
                {"progressPercentage", percentage},
                {"elapsedTime", elapsed},
                {"startTime", to_iso8601(task.start_time)},
                {"cancelled", task.cancelled}};
}

std::string TaskRegistry::next_id()
{
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::system_clock::now().time_since_epoch())
                        .count();
    std::lock_guard<std::mutex> lock(mutex_);
    return "task_" + std::to_string(ms) + "_" + std::to_string(++sequence_);
}

void TaskRegistry::start(const std::string& id, const std::string& name, int total_steps)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (tasks_.count(id))
        throw ValidationError("Task " + id + " is already running");
    TaskInfo info;
    info.id = id;
    info.name = name;
    info.start_time = std::chrono::system_clock::now();
    info.total_steps = total_steps;
    tasks_.emplace(id, std::move(info));
}

std::optional<int> TaskRegistry::advance(const std::string& id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end())
        return std::nullopt;
    return ++it->second.current_step;
}

bool TaskRegistry::cancel(const std::string& id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end())
        return false;
    it->second.cancelled = true;
    return true;
}

void TaskRegistry::complete(const std::string& id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.erase(id);
}

void TaskRegistry::bind_request(const std::string& request_key, const std::string& id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.emplace(request_key, id);
}

void TaskRegistry::unbind_request(const std::string& request_key, const std::string& id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto range = requests_.equal_range(request_key);
    for (auto it = range.first; it != range.second; ++it)
    {
        if (it->second == id)
        {
            requests_.erase(it);
            return;
        }
    }
}

size_t TaskRegistry::cancel_request(const std::string& request_key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    size_t cancelled = 0;
    auto range = requests_.equal_range(request_key);
    for (auto it = range.first; it != range.second; ++it)
    {
        auto task = tasks_.find(it->second);
        if (task == tasks_.end())
            continue;
        task->second.cancelled = true;
        ++cancelled;
    }
    return cancelled;
}

bool TaskRegistry::is_cancelled(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    return it != tasks_.end() && it->second.cancelled;
}

std::optional<TaskInfo> TaskRegistry::get(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end())
        return std::nullopt;
    return it->second;
}

std::vector<TaskInfo> TaskRegistry::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TaskInfo> out;
    out.reserve(tasks_.size());
    for (const auto& [id, info] : tasks_)
        out.push_back(info);
    return out;
}

size_t TaskRegistry::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

TaskScope::TaskScope(TaskRegistry& registry, std::string id, const std::string& name,
                     int total_steps)
    : registry_(registry), id_(std::move(id))
{
    registry_.start(id_, name, total_steps);
}

TaskScope::~TaskScope()
{
    registry_.complete(id_);
}

} // namespace mcpgate::gateway
