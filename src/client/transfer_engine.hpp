#pragma once
#include <cstdint>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "command_executor.hpp"
#include "task_store.hpp"

namespace pcex {

constexpr uint32_t kUploadChunkSize = 32 * 1024;

struct TransferOptions {
    uint32_t chunk_size{kUploadChunkSize};
};

// Chunked file transfers with persisted progress. Each transfer holds the
// session lease from its first request to its final acknowledgment.
class TransferEngine {
public:
    using ProgressListener = std::function<void(const TransferTask&)>;

    TransferEngine(CommandExecutor& exec, TaskStore& store, TransferOptions options = {});

    Result<TransferTask> download(const std::string& remote_path, const std::string& local_path);
    Result<TransferTask> upload(const std::string& local_path, const std::string& remote_path);

    // Marks the task Cancelled. A running transfer notices at its next chunk.
    Result<void> cancel(const std::string& task_id);
    // Starts a new task with the source and destination of an existing one.
    Result<TransferTask> retry(const std::string& task_id);

    Result<TransferTask> task(const std::string& task_id);
    Result<std::vector<TransferTask>> history();
    Result<std::vector<TransferTask>> active();
    // Deletes every task in a terminal state.
    Result<size_t> clear_history();

    // Called after each state change and each chunk, on the transferring thread.
    void set_progress_listener(ProgressListener l);

private:
    Result<void> save(const TransferTask& t);
    Result<void> advance(TransferTask& t, uint64_t n);
    Result<TransferTask> complete(TransferTask& t);
    Error fail(TransferTask& t, const Error& err);
    void drain(CommandExecutor::Exchange& ex);
    void notify(const TransferTask& t);
    bool cancel_requested(const std::string& id);
    void forget(const std::string& id);

    CommandExecutor& exec_;
    TaskStore& store_;
    TransferOptions options_;

    std::mutex mtx_;
    std::set<std::string> cancelled_;
    ProgressListener listener_;
};

} // namespace pcex
