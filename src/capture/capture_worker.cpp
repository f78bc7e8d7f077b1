#include "capture/capture_worker.hpp"

#include "core/logging/logger.hpp"

#include <exception>
#include <utility>

namespace camgate::capture {

CaptureWorker::CaptureWorker(std::string name, core::logging::Logger& logger)
    : name_(std::move(name)), logger_(logger) {
  thread_ = std::thread([this] { Run(); });
}

CaptureWorker::~CaptureWorker() {
  std::size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
    dropped = jobs_.size();
    jobs_.clear();
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  if (dropped > 0U) {
    logger_.Warn("capture worker stopped with queued jobs",
                 {{"worker", name_}, {"dropped_jobs", std::to_string(dropped)}});
  }
}

bool CaptureWorker::Post(std::function<void()> job, std::string& error) {
  if (!job) {
    error = "capture job cannot be empty";
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      error = "capture worker '" + name_ + "' is shutting down";
      return false;
    }
    jobs_.push_back(std::move(job));
  }
  wake_.notify_one();
  return true;
}

void CaptureWorker::WaitIdle() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_.wait(lock, [this] { return (jobs_.empty() && !busy_) || stopping_; });
}

void CaptureWorker::Run() {
  while (true) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      wake_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
      if (stopping_) {
        busy_ = false;
        idle_.notify_all();
        return;
      }
      job = std::move(jobs_.front());
      jobs_.pop_front();
      busy_ = true;
    }

    try {
      job();
    } catch (const std::exception& ex) {
      logger_.Error("capture job failed with exception", {{"worker", name_}, {"error", ex.what()}});
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      busy_ = false;
    }
    idle_.notify_all();
  }
}

} // namespace camgate::capture
