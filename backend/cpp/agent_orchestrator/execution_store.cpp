#include "execution_store.hpp"

#include <stdexcept>

namespace {

std::string joinIds(const std::vector<std::string>& ids) {
    std::string joined;
    for (const auto& id : ids) {
        if (!joined.empty()) {
            joined += ",";
        }
        joined += id;
    }
    return joined;
}

std::string columnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

} // namespace

ExecutionStore::ExecutionStore(const std::string& path) {
    initDatabase(path);
}

ExecutionStore::~ExecutionStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

// Open the database and create the tables if they do not exist
void ExecutionStore::initDatabase(const std::string& path) {
    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }

    const char* create_tables_sql =
        "CREATE TABLE IF NOT EXISTS executions ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "task_id TEXT NOT NULL, "
        "task_type TEXT NOT NULL, "
        "priority TEXT NOT NULL, "
        "agent_ids TEXT, "
        "status TEXT NOT NULL, "
        "duration_ms REAL, "
        "attempt INTEGER NOT NULL, "
        "recorded_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP);"
        "CREATE TABLE IF NOT EXISTS metrics_snapshots ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "total_tasks INTEGER NOT NULL, "
        "completed_tasks INTEGER NOT NULL, "
        "failed_tasks INTEGER NOT NULL, "
        "average_task_time REAL NOT NULL, "
        "system_load REAL NOT NULL, "
        "agent_utilization REAL NOT NULL, "
        "network_efficiency REAL NOT NULL, "
        "queue_length INTEGER NOT NULL, "
        "recorded_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP);";
    char* err_msg = nullptr;
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        rc = sqlite3_exec(db_, create_tables_sql, nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK) {
            std::string error = "Failed to create tables: " + std::string(err_msg ? err_msg : "unknown error");
            sqlite3_free(err_msg);
            sqlite3_close(db_);
            db_ = nullptr;
            throw std::runtime_error(error);
        }
    }
}

EventBus::Unsubscribe ExecutionStore::attach(EventBus& bus) {
    // Exceptions thrown here are contained by the bus and logged there
    return bus.subscribeAll([this](const OrchestratorEvent& event) {
        switch (event.type) {
        case EventType::TaskCompleted:
            if (event.task) {
                recordExecution(*event.task, TaskStatus::Completed);
            }
            break;
        case EventType::TaskFailed:
            if (event.task) {
                recordExecution(*event.task, TaskStatus::Failed);
            }
            break;
        case EventType::MetricsUpdated:
            if (event.metrics) {
                recordMetrics(*event.metrics);
            }
            break;
        default:
            break;
        }
    });
}

void ExecutionStore::recordExecution(const Task& task, TaskStatus outcome) {
    const char* insert_sql =
        "INSERT INTO executions (task_id, task_type, priority, agent_ids, status, duration_ms, attempt) "
        "VALUES (?, ?, ?, ?, ?, ?, ?);";
    const std::string priority = toString(task.priority);
    const std::string agent_ids = joinIds(task.assigned_agents);
    const std::string status = toString(outcome);

    sqlite3_stmt* stmt;
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        int rc = sqlite3_prepare_v2(db_, insert_sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            throw std::runtime_error("Failed to prepare insert statement: " + std::string(sqlite3_errmsg(db_)));
        }

        sqlite3_bind_text(stmt, 1, task.id.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 2, task.type.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 3, priority.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 4, agent_ids.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(stmt, 5, status.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_double(stmt, 6, task.actual_duration.value_or(0.0));
        sqlite3_bind_int(stmt, 7, task.attempts);

        rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) {
            sqlite3_finalize(stmt);
            throw std::runtime_error("Failed to insert execution: " + std::string(sqlite3_errmsg(db_)));
        }
        sqlite3_finalize(stmt);
    }
}

void ExecutionStore::recordMetrics(const OrchestrationMetrics& metrics) {
    const char* insert_sql =
        "INSERT INTO metrics_snapshots (total_tasks, completed_tasks, failed_tasks, average_task_time, "
        "system_load, agent_utilization, network_efficiency, queue_length) VALUES (?, ?, ?, ?, ?, ?, ?, ?);";
    sqlite3_stmt* stmt;
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        int rc = sqlite3_prepare_v2(db_, insert_sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            throw std::runtime_error("Failed to prepare insert statement: " + std::string(sqlite3_errmsg(db_)));
        }

        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(metrics.total_tasks));
        sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(metrics.completed_tasks));
        sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(metrics.failed_tasks));
        sqlite3_bind_double(stmt, 4, metrics.average_task_time);
        sqlite3_bind_double(stmt, 5, metrics.system_load);
        sqlite3_bind_double(stmt, 6, metrics.agent_utilization);
        sqlite3_bind_double(stmt, 7, metrics.network_efficiency);
        sqlite3_bind_int64(stmt, 8, static_cast<sqlite3_int64>(metrics.queue_length));

        rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) {
            sqlite3_finalize(stmt);
            throw std::runtime_error("Failed to insert metrics snapshot: " + std::string(sqlite3_errmsg(db_)));
        }
        sqlite3_finalize(stmt);
    }
}

std::vector<std::map<std::string, std::string>> ExecutionStore::recentExecutions(int limit) {
    return queryExecutions("SELECT id, task_id, task_type, priority, agent_ids, status, duration_ms, attempt, "
                           "recorded_at FROM executions ORDER BY id DESC LIMIT ?;",
                           nullptr, limit);
}

std::vector<std::map<std::string, std::string>> ExecutionStore::getTaskExecutions(const std::string& task_id) {
    return queryExecutions("SELECT id, task_id, task_type, priority, agent_ids, status, duration_ms, attempt, "
                           "recorded_at FROM executions WHERE task_id = ? ORDER BY id DESC LIMIT ?;",
                           &task_id, -1);
}

std::vector<std::map<std::string, std::string>> ExecutionStore::queryExecutions(const char* select_sql,
                                                                                 const std::string* task_id,
                                                                                 int limit) {
    std::vector<std::map<std::string, std::string>> result;
    sqlite3_stmt* stmt;

    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        int rc = sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            throw std::runtime_error("Failed to prepare select statement: " + std::string(sqlite3_errmsg(db_)));
        }

        int index = 1;
        if (task_id) {
            sqlite3_bind_text(stmt, index++, task_id->c_str(), -1, SQLITE_STATIC);
        }
        sqlite3_bind_int(stmt, index, limit);

        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            std::map<std::string, std::string> row;
            row["id"] = std::to_string(sqlite3_column_int(stmt, 0));
            row["task_id"] = columnText(stmt, 1);
            row["task_type"] = columnText(stmt, 2);
            row["priority"] = columnText(stmt, 3);
            row["agent_ids"] = columnText(stmt, 4);
            row["status"] = columnText(stmt, 5);
            row["duration_ms"] = columnText(stmt, 6);
            row["attempt"] = std::to_string(sqlite3_column_int(stmt, 7));
            row["recorded_at"] = columnText(stmt, 8);
            result.push_back(row);
        }

        if (rc != SQLITE_DONE) {
            sqlite3_finalize(stmt);
            throw std::runtime_error("Failed to query executions: " + std::string(sqlite3_errmsg(db_)));
        }
        sqlite3_finalize(stmt);
    }
    return result;
}

int ExecutionStore::metricsSnapshotCount() {
    const char* count_sql = "SELECT COUNT(*) FROM metrics_snapshots;";
    sqlite3_stmt* stmt;
    int count = 0;
    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        int rc = sqlite3_prepare_v2(db_, count_sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            throw std::runtime_error("Failed to prepare count statement: " + std::string(sqlite3_errmsg(db_)));
        }
        rc = sqlite3_step(stmt);
        if (rc != SQLITE_ROW) {
            sqlite3_finalize(stmt);
            throw std::runtime_error("Failed to count metrics snapshots: " + std::string(sqlite3_errmsg(db_)));
        }
        count = sqlite3_column_int(stmt, 0);
        sqlite3_finalize(stmt);
    }
    return count;
}
