#include "sqlite_task_store.hpp"
#include "logging.hpp"

namespace pcex {

namespace {

const char *kSchema = "CREATE TABLE IF NOT EXISTS transfers ("
                      " id TEXT PRIMARY KEY,"
                      " file_name TEXT NOT NULL,"
                      " source_path TEXT NOT NULL,"
                      " destination_path TEXT NOT NULL,"
                      " direction TEXT NOT NULL,"
                      " total_bytes INTEGER NOT NULL,"
                      " transferred_bytes INTEGER NOT NULL,"
                      " state TEXT NOT NULL,"
                      " created_at INTEGER NOT NULL,"
                      " completed_at INTEGER,"
                      " error TEXT);";

const char *kUpsert =
    "INSERT INTO transfers (id, file_name, source_path, destination_path,"
    " direction, total_bytes, transferred_bytes, state, created_at,"
    " completed_at, error) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)"
    " ON CONFLICT(id) DO UPDATE SET"
    " file_name = excluded.file_name,"
    " source_path = excluded.source_path,"
    " destination_path = excluded.destination_path,"
    " direction = excluded.direction,"
    " total_bytes = excluded.total_bytes,"
    " transferred_bytes = excluded.transferred_bytes,"
    " state = excluded.state,"
    " created_at = excluded.created_at,"
    " completed_at = excluded.completed_at,"
    " error = excluded.error"
    " WHERE transfers.state IN ('Pending', 'InProgress');";

const char *kUpdateProgress =
    "UPDATE transfers SET transferred_bytes = ?, state = ?"
    " WHERE id = ? AND state IN ('Pending', 'InProgress');";

const char *kSelectAll =
    "SELECT id, file_name, source_path, destination_path, direction,"
    " total_bytes, transferred_bytes, state, created_at, completed_at, error"
    " FROM transfers ORDER BY created_at DESC, rowid DESC;";

const char *kSelectOne =
    "SELECT id, file_name, source_path, destination_path, direction,"
    " total_bytes, transferred_bytes, state, created_at, completed_at, error"
    " FROM transfers WHERE id = ?;";

const char *kDeleteOne = "DELETE FROM transfers WHERE id = ?;";

// Finalizes a prepared statement on scope exit.
struct Statement {
  sqlite3_stmt *stmt = nullptr;
  ~Statement() { sqlite3_finalize(stmt); }
};

std::string column_text(sqlite3_stmt *stmt, int col) {
  const unsigned char *t = sqlite3_column_text(stmt, col);
  return t ? std::string(reinterpret_cast<const char *>(t)) : std::string();
}

TransferTask read_row(sqlite3_stmt *stmt) {
  TransferTask t;
  t.id = column_text(stmt, 0);
  t.file_name = column_text(stmt, 1);
  t.source_path = column_text(stmt, 2);
  t.destination_path = column_text(stmt, 3);
  if (!parse_direction(column_text(stmt, 4), t.direction))
    Logger::instance().log(LogLevel::WARN, "store: task %s has bad direction",
                           t.id.c_str());
  t.total_bytes = (uint64_t)sqlite3_column_int64(stmt, 5);
  t.transferred_bytes = (uint64_t)sqlite3_column_int64(stmt, 6);
  if (!parse_transfer_state(column_text(stmt, 7), t.state)) {
    Logger::instance().log(LogLevel::WARN, "store: task %s has bad state",
                           t.id.c_str());
    t.state = TransferState::Failed;
  }
  t.created_at = sqlite3_column_int64(stmt, 8);
  if (sqlite3_column_type(stmt, 9) != SQLITE_NULL)
    t.completed_at = sqlite3_column_int64(stmt, 9);
  if (sqlite3_column_type(stmt, 10) != SQLITE_NULL)
    t.error = column_text(stmt, 10);
  return t;
}

} // namespace

Result<std::unique_ptr<SqliteTaskStore>>
SqliteTaskStore::open(const std::string &path) {
  sqlite3 *db = nullptr;
  int rc = sqlite3_open(path.c_str(), &db);
  if (rc != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    sqlite3_close(db);
    return Error{TransferErrc::store_failure, "open " + path + ": " + msg};
  }
  char *err = nullptr;
  if (sqlite3_exec(db, kSchema, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "schema";
    sqlite3_free(err);
    sqlite3_close(db);
    return Error{TransferErrc::store_failure, msg};
  }
  return std::unique_ptr<SqliteTaskStore>(new SqliteTaskStore(db));
}

SqliteTaskStore::~SqliteTaskStore() { sqlite3_close(db_); }

Error SqliteTaskStore::db_error(const char *what) const {
  std::string msg = std::string(what) + ": " + sqlite3_errmsg(db_);
  Logger::instance().log(LogLevel::ERROR, "store: %s", msg.c_str());
  return Error{TransferErrc::store_failure, msg};
}

Result<void> SqliteTaskStore::upsert_task(const TransferTask &task) {
  std::lock_guard<std::mutex> lk(mtx_);
  Statement st;
  if (sqlite3_prepare_v2(db_, kUpsert, -1, &st.stmt, nullptr) != SQLITE_OK)
    return db_error("prepare upsert");
  sqlite3_bind_text(st.stmt, 1, task.id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st.stmt, 2, task.file_name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st.stmt, 3, task.source_path.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st.stmt, 4, task.destination_path.c_str(), -1,
                    SQLITE_TRANSIENT);
  sqlite3_bind_text(st.stmt, 5, direction_name(task.direction), -1,
                    SQLITE_STATIC);
  sqlite3_bind_int64(st.stmt, 6, (sqlite3_int64)task.total_bytes);
  sqlite3_bind_int64(st.stmt, 7, (sqlite3_int64)task.transferred_bytes);
  sqlite3_bind_text(st.stmt, 8, transfer_state_name(task.state), -1,
                    SQLITE_STATIC);
  sqlite3_bind_int64(st.stmt, 9, task.created_at);
  if (task.completed_at)
    sqlite3_bind_int64(st.stmt, 10, *task.completed_at);
  else
    sqlite3_bind_null(st.stmt, 10);
  if (task.error)
    sqlite3_bind_text(st.stmt, 11, task.error->c_str(), -1, SQLITE_TRANSIENT);
  else
    sqlite3_bind_null(st.stmt, 11);
  if (sqlite3_step(st.stmt) != SQLITE_DONE)
    return db_error("upsert");
  return {};
}

Result<void> SqliteTaskStore::update_progress(const std::string &id,
                                              uint64_t transferred,
                                              TransferState state) {
  std::lock_guard<std::mutex> lk(mtx_);
  Statement st;
  if (sqlite3_prepare_v2(db_, kUpdateProgress, -1, &st.stmt, nullptr) !=
      SQLITE_OK)
    return db_error("prepare progress");
  sqlite3_bind_int64(st.stmt, 1, (sqlite3_int64)transferred);
  sqlite3_bind_text(st.stmt, 2, transfer_state_name(state), -1, SQLITE_STATIC);
  sqlite3_bind_text(st.stmt, 3, id.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(st.stmt) != SQLITE_DONE)
    return db_error("progress");
  return {};
}

Result<std::vector<TransferTask>>
SqliteTaskStore::query_locked(const char *sql, const std::string *id) {
  Statement st;
  if (sqlite3_prepare_v2(db_, sql, -1, &st.stmt, nullptr) != SQLITE_OK)
    return db_error("prepare select");
  if (id)
    sqlite3_bind_text(st.stmt, 1, id->c_str(), -1, SQLITE_TRANSIENT);
  std::vector<TransferTask> out;
  int rc;
  while ((rc = sqlite3_step(st.stmt)) == SQLITE_ROW)
    out.push_back(read_row(st.stmt));
  if (rc != SQLITE_DONE)
    return db_error("select");
  return out;
}

Result<std::optional<TransferTask>>
SqliteTaskStore::get_task(const std::string &id) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto rows = query_locked(kSelectOne, &id);
  if (!rows)
    return rows.error();
  if (rows.value().empty())
    return std::optional<TransferTask>();
  return std::optional<TransferTask>(rows.value().front());
}

Result<std::vector<TransferTask>>
SqliteTaskStore::list_tasks(const Predicate &pred) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto rows = query_locked(kSelectAll, nullptr);
  if (!rows || !pred)
    return rows;
  std::vector<TransferTask> out;
  for (auto &t : rows.value())
    if (pred(t))
      out.push_back(std::move(t));
  return out;
}

Result<size_t> SqliteTaskStore::delete_tasks(const Predicate &pred) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto rows = query_locked(kSelectAll, nullptr);
  if (!rows)
    return rows.error();
  if (sqlite3_exec(db_, "BEGIN;", nullptr, nullptr, nullptr) != SQLITE_OK)
    return db_error("begin");
  size_t n = 0;
  for (const auto &t : rows.value()) {
    if (pred && !pred(t))
      continue;
    Statement st;
    bool done = sqlite3_prepare_v2(db_, kDeleteOne, -1, &st.stmt, nullptr) ==
                SQLITE_OK;
    if (done) {
      sqlite3_bind_text(st.stmt, 1, t.id.c_str(), -1, SQLITE_TRANSIENT);
      done = sqlite3_step(st.stmt) == SQLITE_DONE;
    }
    if (!done) {
      Error err = db_error("delete");
      if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK)
        Logger::instance().log(LogLevel::ERROR, "store: rollback failed: %s",
                               sqlite3_errmsg(db_));
      return err;
    }
    n++;
  }
  if (sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK)
    return db_error("commit");
  return n;
}

} // namespace pcex
