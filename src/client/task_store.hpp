#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "error.hpp"

namespace pcex {

enum class TransferDirection { Download, Upload };
enum class TransferState { Pending, InProgress, Completed, Failed, Cancelled };

const char* direction_name(TransferDirection d);
bool parse_direction(const std::string& s, TransferDirection& out);
const char* transfer_state_name(TransferState s);
bool parse_transfer_state(const std::string& s, TransferState& out);

inline bool is_terminal(TransferState s) {
    return s == TransferState::Completed || s == TransferState::Failed ||
           s == TransferState::Cancelled;
}

struct TransferTask {
    std::string id;
    std::string file_name;
    std::string source_path;
    std::string destination_path;
    TransferDirection direction{TransferDirection::Download};
    uint64_t total_bytes{0};
    uint64_t transferred_bytes{0};
    TransferState state{TransferState::Pending};
    int64_t created_at{0};
    std::optional<int64_t> completed_at;
    std::optional<std::string> error;

    // Fraction in [0, 1]; zero when the size is unknown.
    double progress() const;
    bool is_active() const {
        return state == TransferState::Pending || state == TransferState::InProgress;
    }
};

// Persistence for transfer tasks. Rows in a terminal state are immutable:
// upsert_task and update_progress leave them untouched.
class TaskStore {
public:
    using Predicate = std::function<bool(const TransferTask&)>;

    virtual ~TaskStore() = default;
    virtual Result<void> upsert_task(const TransferTask& task) = 0;
    virtual Result<void> update_progress(const std::string& id, uint64_t transferred,
                                         TransferState state) = 0;
    virtual Result<std::optional<TransferTask>> get_task(const std::string& id) = 0;
    // Newest first.
    virtual Result<std::vector<TransferTask>> list_tasks(const Predicate& pred) = 0;
    virtual Result<size_t> delete_tasks(const Predicate& pred) = 0;
};

class MemoryTaskStore : public TaskStore {
public:
    Result<void> upsert_task(const TransferTask& task) override;
    Result<void> update_progress(const std::string& id, uint64_t transferred,
                                 TransferState state) override;
    Result<std::optional<TransferTask>> get_task(const std::string& id) override;
    Result<std::vector<TransferTask>> list_tasks(const Predicate& pred) override;
    Result<size_t> delete_tasks(const Predicate& pred) override;

private:
    std::mutex mtx_;
    std::map<std::string, TransferTask> tasks_;
    std::map<std::string, uint64_t> order_;
    uint64_t next_seq_{0};
};

} // namespace pcex
