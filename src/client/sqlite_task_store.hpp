#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <sqlite3.h>
#include "task_store.hpp"

namespace pcex {

// Task store backed by a SQLite table named "transfers".
class SqliteTaskStore : public TaskStore {
public:
    // Opens or creates the database; ":memory:" gives a private in-memory one.
    static Result<std::unique_ptr<SqliteTaskStore>> open(const std::string& path);
    ~SqliteTaskStore() override;

    Result<void> upsert_task(const TransferTask& task) override;
    Result<void> update_progress(const std::string& id, uint64_t transferred,
                                 TransferState state) override;
    Result<std::optional<TransferTask>> get_task(const std::string& id) override;
    Result<std::vector<TransferTask>> list_tasks(const Predicate& pred) override;
    Result<size_t> delete_tasks(const Predicate& pred) override;

private:
    explicit SqliteTaskStore(sqlite3* db) : db_(db) {}
    Error db_error(const char* what) const;
    Result<std::vector<TransferTask>> query_locked(const char* sql, const std::string* id);

    std::mutex mtx_;
    sqlite3* db_;
};

} // namespace pcex
