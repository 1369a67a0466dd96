#ifndef KOSTORE_TESTS_FAKE_HTTP_CLIENT_HPP
#define KOSTORE_TESTS_FAKE_HTTP_CLIENT_HPP

#include "http.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <fstream>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace KoStore {
namespace testing {

// In-memory HttpClient. Unknown URLs answer 404.
class FakeHttpClient : public HttpClient {
 public:
  struct Route {
    long status = 200;
    std::string body;
    std::map<std::string, std::string> headers;
    bool throwNetworkError = false;
    bool transient = true;
  };

  void Respond(const std::string& url, long status, const std::string& body,
               std::map<std::string, std::string> headers = {}) {
    std::lock_guard<std::mutex> lock(mutex_);
    Route route;
    route.status = status;
    route.body = body;
    for (auto& header : headers) {
      std::string name = header.first;
      std::transform(name.begin(), name.end(), name.begin(), ::tolower);
      route.headers[name] = header.second;
    }
    routes_[url] = route;
  }

  void FailWith(const std::string& url, bool transient) {
    std::lock_guard<std::mutex> lock(mutex_);
    Route route;
    route.throwNetworkError = true;
    route.transient = transient;
    routes_[url] = route;
  }

  // Serves content for download(url), in chunks of chunkSize bytes.
  void ServeFile(const std::string& url, const std::string& content, std::size_t chunkSize = 1024) {
    std::lock_guard<std::mutex> lock(mutex_);
    files_[url] = content;
    chunkSize_ = chunkSize;
  }

  // The next `times` downloads of url fail before any byte is written.
  void FailDownloads(const std::string& url, int times, bool transient, long status = 503) {
    std::lock_guard<std::mutex> lock(mutex_);
    downloadFailures_[url] = {times, transient, status};
  }

  // Downloads stop after the first chunk until Unblock() or cancellation.
  void BlockDownloads() {
    std::lock_guard<std::mutex> lock(mutex_);
    blocked_ = true;
  }

  void Unblock() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      blocked_ = false;
    }
    cv_.notify_all();
  }

  // Waits until `count` downloads have written their first chunk.
  bool WaitForDownloadStart(int count = 1, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this, count] { return downloadsStarted_ >= count; });
  }

  HttpResponse get(const HttpRequest& request) override {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(request);
    HttpResponse response;
    auto it = routes_.find(request.url);
    if (it == routes_.end()) {
      response.status = 404;
      response.body = R"({"message":"Not Found"})";
      return response;
    }
    if (it->second.throwNetworkError) {
      throw NetworkError("Could not resolve host", it->second.transient);
    }
    response.status = it->second.status;
    response.body = it->second.body;
    response.headers = it->second.headers;
    return response;
  }

  void download(const HttpRequest& request, const fs::path& destPath,
                const ProgressCallback& progress) override {
    std::string content;
    std::size_t chunkSize = 0;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      requests_.push_back(request);
      ++downloadAttempts_;
      auto failure = downloadFailures_.find(request.url);
      if (failure != downloadFailures_.end() && failure->second.times > 0) {
        --failure->second.times;
        throw NetworkError("HTTP " + std::to_string(failure->second.status), failure->second.transient,
                           failure->second.status);
      }
      auto it = files_.find(request.url);
      if (it == files_.end()) {
        throw NetworkError("HTTP 404", false, 404);
      }
      content = it->second;
      chunkSize = chunkSize_;
    }

    std::ofstream out(destPath, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw IOError("Cannot open " + destPath.string());
    }
    const std::uint64_t total = content.size();
    std::size_t written = 0;
    bool first = true;
    while (written < content.size()) {
      const std::size_t n = std::min(chunkSize, content.size() - written);
      out.write(content.data() + written, static_cast<std::streamsize>(n));
      out.flush();
      written += n;
      if (progress && !progress(written, total)) {
        throw CancellationError();
      }
      if (first) {
        first = false;
        std::unique_lock<std::mutex> lock(mutex_);
        ++downloadsStarted_;
        cv_.notify_all();
        while (blocked_) {
          cv_.wait_for(lock, std::chrono::milliseconds(10));
          lock.unlock();
          const bool keepGoing = !progress || progress(written, total);
          lock.lock();
          if (!keepGoing) {
            throw CancellationError();
          }
        }
      }
    }
  }

  std::size_t RequestCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
  }

  int DownloadAttempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return downloadAttempts_;
  }

  std::vector<HttpRequest> Requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

 private:
  struct DownloadFailure {
    int times = 0;
    bool transient = true;
    long status = 503;
  };

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::map<std::string, Route> routes_;
  std::map<std::string, std::string> files_;
  std::map<std::string, DownloadFailure> downloadFailures_;
  std::vector<HttpRequest> requests_;
  std::size_t chunkSize_ = 1024;
  bool blocked_ = false;
  int downloadsStarted_ = 0;
  int downloadAttempts_ = 0;
};

} // namespace testing
} // namespace KoStore

#endif // KOSTORE_TESTS_FAKE_HTTP_CLIENT_HPP
