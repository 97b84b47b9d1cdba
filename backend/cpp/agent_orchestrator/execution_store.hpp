#ifndef EXECUTION_STORE_HPP
#define EXECUTION_STORE_HPP

#include "clock.hpp"
#include "event_bus.hpp"
#include "metrics.hpp"
#include "task.hpp"

#include <sqlite3.h>

#include <map>
#include <mutex>
#include <string>
#include <vector>

// SQLite sink for execution outcomes and metrics snapshots. The orchestrator
// never reads from it; it only reports here through the event bus.
class ExecutionStore {
public:
    // ":memory:" gives a private in-memory database
    explicit ExecutionStore(const std::string& path);
    ~ExecutionStore();

    ExecutionStore(const ExecutionStore&) = delete;
    ExecutionStore& operator=(const ExecutionStore&) = delete;

    // Record task_completed, task_failed and metrics_updated events from the bus
    EventBus::Unsubscribe attach(EventBus& bus);

    void recordExecution(const Task& task, TaskStatus outcome);
    void recordMetrics(const OrchestrationMetrics& metrics);

    // Newest first
    std::vector<std::map<std::string, std::string>> recentExecutions(int limit);
    std::vector<std::map<std::string, std::string>> getTaskExecutions(const std::string& task_id);
    int metricsSnapshotCount();

private:
    void initDatabase(const std::string& path);
    std::vector<std::map<std::string, std::string>> queryExecutions(const char* sql, const std::string* task_id,
                                                                    int limit);

    sqlite3* db_ = nullptr; // SQLite connection for executions and metrics
    std::mutex db_mutex_;   // events may arrive from several threads
};

#endif // EXECUTION_STORE_HPP
