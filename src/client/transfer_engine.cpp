#include "transfer_engine.hpp"
#include "logging.hpp"
#include "payload.hpp"
#include "util.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace pcex {

TransferEngine::TransferEngine(CommandExecutor &exec, TaskStore &store,
                               TransferOptions options)
    : exec_(exec), store_(store), options_(options) {
  if (options_.chunk_size == 0 || options_.chunk_size > kMaxPayloadSize)
    options_.chunk_size = kUploadChunkSize;
}

void TransferEngine::set_progress_listener(ProgressListener l) {
  std::lock_guard<std::mutex> lk(mtx_);
  listener_ = std::move(l);
}

void TransferEngine::notify(const TransferTask &t) {
  ProgressListener l;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    l = listener_;
  }
  if (l)
    l(t);
}

bool TransferEngine::cancel_requested(const std::string &id) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (cancelled_.count(id) != 0)
      return true;
  }
  // Another process sharing the store may have cancelled it.
  auto stored = store_.get_task(id);
  return stored && stored.value() &&
         stored.value()->state == TransferState::Cancelled;
}

void TransferEngine::forget(const std::string &id) {
  std::lock_guard<std::mutex> lk(mtx_);
  cancelled_.erase(id);
}

Result<void> TransferEngine::save(const TransferTask &t) {
  auto r = store_.upsert_task(t);
  if (r)
    notify(t);
  return r;
}

Result<void> TransferEngine::advance(TransferTask &t, uint64_t n) {
  t.transferred_bytes += n;
  if (t.transferred_bytes > t.total_bytes) {
    // Source grew past its advertised size.
    t.total_bytes = t.transferred_bytes;
    return save(t);
  }
  auto r = store_.update_progress(t.id, t.transferred_bytes, t.state);
  if (r)
    notify(t);
  return r;
}

Error TransferEngine::fail(TransferTask &t, const Error &err) {
  Logger::instance().log(LogLevel::WARN, "transfer: %s %s failed: %s",
                         direction_name(t.direction), t.file_name.c_str(),
                         err.describe().c_str());
  t.state = TransferState::Failed;
  t.completed_at = now_millis();
  t.error = err.describe();
  auto r = save(t);
  if (!r)
    Logger::instance().log(LogLevel::ERROR, "transfer: cannot record failure: %s",
                           r.error().describe().c_str());
  forget(t.id);
  return err;
}

Result<TransferTask> TransferEngine::complete(TransferTask &t) {
  forget(t.id);
  t.total_bytes = t.transferred_bytes;
  t.state = TransferState::Completed;
  t.completed_at = now_millis();
  auto r = store_.upsert_task(t);
  if (!r)
    return r.error();
  // The upsert leaves a row that was cancelled in the meantime untouched.
  auto stored = store_.get_task(t.id);
  if (!stored)
    return stored.error();
  if (stored.value() && stored.value()->state == TransferState::Cancelled) {
    Logger::instance().log(LogLevel::INFO, "transfer: %s cancelled",
                           t.file_name.c_str());
    return Error{TransferErrc::cancelled, t.id};
  }
  notify(t);
  Logger::instance().log(LogLevel::INFO, "transfer: %s %s done, %s",
                         direction_name(t.direction), t.file_name.c_str(),
                         format_bytes(t.transferred_bytes).c_str());
  return t;
}

// Consumes the rest of a chunk stream so the next exchange starts on a frame boundary.
void TransferEngine::drain(CommandExecutor::Exchange &ex) {
  for (;;) {
    auto p = ex.receive();
    if (!p) {
      Logger::instance().log(LogLevel::WARN, "transfer: drain stopped: %s",
                             p.error().describe().c_str());
      return;
    }
    if (p.value().command != Command::ResponseFileChunk)
      return;
  }
}

Result<TransferTask> TransferEngine::download(const std::string &remote_path,
                                              const std::string &local_path) {
  auto ex = exec_.open_exchange();
  auto reply = ex.call(Command::GetFileInfo, encode_path(remote_path));
  if (!reply)
    return reply.error();
  auto info = decode_file_entry(reply.value().payload);
  if (!info)
    return info.error();

  TransferTask t;
  t.id = make_task_id();
  t.file_name = info.value().name;
  t.source_path = remote_path;
  t.destination_path = local_path;
  t.direction = TransferDirection::Download;
  t.total_bytes = info.value().size;
  t.created_at = now_millis();
  auto r = save(t);
  if (!r)
    return r.error();
  t.state = TransferState::InProgress;
  r = save(t);
  if (!r)
    return fail(t, r.error());

  std::error_code ec;
  fs::path dest(local_path);
  if (dest.has_parent_path())
    fs::create_directories(dest.parent_path(), ec);
  std::ofstream out(local_path, std::ios::binary | std::ios::trunc);
  if (!out.is_open())
    return fail(t, Error{TransferErrc::local_io, "cannot create " + local_path});

  if (cancel_requested(t.id))
    return complete(t);

  ReadRequest req;
  req.path = remote_path;
  auto sent = ex.send(Command::ReadFile, PF_NONE, encode_read_request(req));
  if (!sent)
    return fail(t, sent.error());

  Logger::instance().log(LogLevel::INFO, "transfer: downloading %s (%s)",
                         remote_path.c_str(),
                         format_bytes(t.total_bytes).c_str());
  bool cancelled = false;
  for (;;) {
    auto p = ex.receive();
    if (!p)
      return fail(t, p.error());
    const Packet &pkt = p.value();
    if (pkt.command == Command::ResponseEnd)
      break;
    if (pkt.command == Command::ResponseError)
      return fail(t, remote_failure(pkt));
    if (pkt.command != Command::ResponseFileChunk)
      return fail(t, Error{ProtocolErrc::unexpected_response,
                           std::string(command_name(pkt.command)) +
                               " during READ_FILE"});
    if (!cancelled && cancel_requested(t.id)) {
      Logger::instance().log(LogLevel::INFO,
                             "transfer: %s cancelled, discarding stream",
                             t.file_name.c_str());
      cancelled = true;
    }
    if (cancelled)
      continue;
    out.write(reinterpret_cast<const char *>(pkt.payload.data()),
              (std::streamsize)pkt.payload.size());
    if (!out) {
      drain(ex);
      return fail(t, Error{TransferErrc::local_io, "write to " + local_path});
    }
    auto ar = advance(t, pkt.payload.size());
    if (!ar) {
      drain(ex);
      return fail(t, ar.error());
    }
  }
  out.close();
  if (!out)
    return fail(t, Error{TransferErrc::local_io, "close " + local_path});
  return complete(t);
}

Result<TransferTask> TransferEngine::upload(const std::string &local_path,
                                            const std::string &remote_path) {
  std::error_code ec;
  if (!fs::is_regular_file(local_path, ec))
    return Error{TransferErrc::local_io, "local file not found: " + local_path};
  uint64_t size = fs::file_size(local_path, ec);
  if (ec)
    return Error{TransferErrc::local_io, local_path + ": " + ec.message()};
  std::ifstream in(local_path, std::ios::binary);
  if (!in.is_open())
    return Error{TransferErrc::local_io, "cannot open " + local_path};

  TransferTask t;
  t.id = make_task_id();
  t.file_name = fs::path(local_path).filename().string();
  t.source_path = local_path;
  t.destination_path = remote_path;
  t.direction = TransferDirection::Upload;
  t.total_bytes = size;
  t.created_at = now_millis();
  auto r = save(t);
  if (!r)
    return r.error();
  t.state = TransferState::InProgress;
  r = save(t);
  if (!r)
    return fail(t, r.error());

  auto ex = exec_.open_exchange();
  WriteHeader hdr;
  hdr.path = remote_path;
  hdr.total_size = size;
  hdr.chunk_size = options_.chunk_size;
  auto ack = ex.call(Command::WriteFile, encode_write_header(hdr));
  if (!ack)
    return fail(t, ack.error());
  if (ack.value().command != Command::ResponseOk)
    return fail(t, Error{ProtocolErrc::unexpected_response,
                         "WRITE_FILE answered with RESPONSE_DATA"});

  Logger::instance().log(LogLevel::INFO, "transfer: uploading %s (%s)",
                         t.file_name.c_str(), format_bytes(size).c_str());
  std::vector<uint8_t> chunk;
  bool final_sent = false;
  while (t.transferred_bytes < size) {
    if (cancel_requested(t.id))
      break;
    size_t want = (size_t)std::min<uint64_t>(options_.chunk_size,
                                             size - t.transferred_bytes);
    chunk.resize(want);
    in.read(reinterpret_cast<char *>(chunk.data()), (std::streamsize)want);
    size_t n = (size_t)in.gcount();
    if (n == 0) {
      Logger::instance().log(LogLevel::WARN, "transfer: %s ended early",
                             local_path.c_str());
      break;
    }
    chunk.resize(n);
    bool last = t.transferred_bytes + n >= size;
    auto sent = ex.send(Command::ResponseFileChunk,
                        last ? PF_FINAL : PF_CONTINUATION, chunk);
    if (!sent)
      return fail(t, sent.error());
    final_sent = last;
    auto ar = advance(t, n);
    if (!ar)
      return fail(t, ar.error());
  }
  if (size > 0 && !final_sent) {
    auto sent = ex.send(Command::ResponseFileChunk, PF_FINAL, {});
    if (!sent)
      return fail(t, sent.error());
  }

  auto done = ex.receive();
  if (!done)
    return fail(t, done.error());
  if (done.value().command == Command::ResponseError)
    return fail(t, remote_failure(done.value()));
  if (done.value().command != Command::ResponseOk)
    return fail(t, Error{ProtocolErrc::unexpected_response,
                         std::string(command_name(done.value().command)) +
                             " after upload"});
  return complete(t);
}

Result<void> TransferEngine::cancel(const std::string &task_id) {
  auto found = store_.get_task(task_id);
  if (!found)
    return found.error();
  if (!found.value())
    return Error{TransferErrc::task_not_found, task_id};
  TransferTask t = *found.value();
  if (is_terminal(t.state))
    return Error{TransferErrc::task_finished,
                 task_id + " is " + transfer_state_name(t.state)};
  {
    std::lock_guard<std::mutex> lk(mtx_);
    cancelled_.insert(task_id);
  }
  t.state = TransferState::Cancelled;
  t.completed_at = now_millis();
  Logger::instance().log(LogLevel::INFO, "transfer: cancelling %s",
                         t.file_name.c_str());
  return save(t);
}

Result<TransferTask> TransferEngine::retry(const std::string &task_id) {
  auto found = store_.get_task(task_id);
  if (!found)
    return found.error();
  if (!found.value())
    return Error{TransferErrc::task_not_found, task_id};
  const TransferTask &old = *found.value();
  Logger::instance().log(LogLevel::INFO, "transfer: retrying %s",
                         old.file_name.c_str());
  if (old.direction == TransferDirection::Download)
    return download(old.source_path, old.destination_path);
  return upload(old.source_path, old.destination_path);
}

Result<TransferTask> TransferEngine::task(const std::string &task_id) {
  auto found = store_.get_task(task_id);
  if (!found)
    return found.error();
  if (!found.value())
    return Error{TransferErrc::task_not_found, task_id};
  return *found.value();
}

Result<std::vector<TransferTask>> TransferEngine::history() {
  return store_.list_tasks(nullptr);
}

Result<std::vector<TransferTask>> TransferEngine::active() {
  return store_.list_tasks(
      [](const TransferTask &t) { return t.is_active(); });
}

Result<size_t> TransferEngine::clear_history() {
  return store_.delete_tasks(
      [](const TransferTask &t) { return is_terminal(t.state); });
}

} // namespace pcex
