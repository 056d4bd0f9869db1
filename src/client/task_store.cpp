#include "task_store.hpp"
#include <algorithm>

namespace pcex {

const char *direction_name(TransferDirection d) {
  return d == TransferDirection::Download ? "Download" : "Upload";
}

bool parse_direction(const std::string &s, TransferDirection &out) {
  if (s == "Download")
    out = TransferDirection::Download;
  else if (s == "Upload")
    out = TransferDirection::Upload;
  else
    return false;
  return true;
}

const char *transfer_state_name(TransferState s) {
  switch (s) {
  case TransferState::Pending:
    return "Pending";
  case TransferState::InProgress:
    return "InProgress";
  case TransferState::Completed:
    return "Completed";
  case TransferState::Failed:
    return "Failed";
  case TransferState::Cancelled:
    return "Cancelled";
  }
  return "Failed";
}

bool parse_transfer_state(const std::string &s, TransferState &out) {
  static const TransferState all[] = {
      TransferState::Pending, TransferState::InProgress,
      TransferState::Completed, TransferState::Failed,
      TransferState::Cancelled};
  for (auto st : all) {
    if (s == transfer_state_name(st)) {
      out = st;
      return true;
    }
  }
  return false;
}

double TransferTask::progress() const {
  if (total_bytes == 0)
    return 0.0;
  return std::min(1.0, (double)transferred_bytes / (double)total_bytes);
}

Result<void> MemoryTaskStore::upsert_task(const TransferTask &task) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = tasks_.find(task.id);
  if (it == tasks_.end()) {
    tasks_.emplace(task.id, task);
    order_[task.id] = next_seq_++;
    return {};
  }
  if (!is_terminal(it->second.state))
    it->second = task;
  return {};
}

Result<void> MemoryTaskStore::update_progress(const std::string &id,
                                              uint64_t transferred,
                                              TransferState state) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = tasks_.find(id);
  if (it == tasks_.end() || is_terminal(it->second.state))
    return {};
  it->second.transferred_bytes = transferred;
  it->second.state = state;
  return {};
}

Result<std::optional<TransferTask>>
MemoryTaskStore::get_task(const std::string &id) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = tasks_.find(id);
  if (it == tasks_.end())
    return std::optional<TransferTask>();
  return std::optional<TransferTask>(it->second);
}

Result<std::vector<TransferTask>>
MemoryTaskStore::list_tasks(const Predicate &pred) {
  std::lock_guard<std::mutex> lk(mtx_);
  std::vector<TransferTask> out;
  for (const auto &kv : tasks_)
    if (!pred || pred(kv.second))
      out.push_back(kv.second);
  std::sort(out.begin(), out.end(),
            [this](const TransferTask &a, const TransferTask &b) {
              if (a.created_at != b.created_at)
                return a.created_at > b.created_at;
              return order_.at(a.id) > order_.at(b.id);
            });
  return out;
}

Result<size_t> MemoryTaskStore::delete_tasks(const Predicate &pred) {
  std::lock_guard<std::mutex> lk(mtx_);
  size_t n = 0;
  for (auto it = tasks_.begin(); it != tasks_.end();) {
    if (!pred || pred(it->second)) {
      order_.erase(it->first);
      it = tasks_.erase(it);
      n++;
    } else {
      ++it;
    }
  }
  return n;
}

} // namespace pcex
