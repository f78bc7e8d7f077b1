#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace camgate::core::logging {
class Logger;
}

namespace camgate::capture {

// Single background thread with a FIFO job queue, owned by a capture device.
//
// Jobs run one at a time in submission order, which keeps native camera
// access single-threaded even if a timed-out attempt is still retrying when
// the next one is posted. The destructor finishes the running job, drops
// anything still queued and joins the thread.
class CaptureWorker {
public:
  CaptureWorker(std::string name, core::logging::Logger& logger);
  ~CaptureWorker();

  CaptureWorker(const CaptureWorker&) = delete;
  CaptureWorker& operator=(const CaptureWorker&) = delete;

  bool Post(std::function<void()> job, std::string& error);

  // Blocks until the queue is empty and no job is running.
  void WaitIdle();

private:
  void Run();

  std::string name_;
  core::logging::Logger& logger_;
  std::mutex mutex_;
  std::condition_variable wake_;
  std::condition_variable idle_;
  std::deque<std::function<void()>> jobs_;
  bool busy_ = false;
  bool stopping_ = false;
  std::thread thread_;
};

} // namespace camgate::capture
