// Scripted IHttpTransport: returns queued responses in order and records
// every request. Thread-safe; no network.

#ifndef DIALOGCAST_TESTS_FIXTURES_HTTP_TRANSPORT_STUB_H_
#define DIALOGCAST_TESTS_FIXTURES_HTTP_TRANSPORT_STUB_H_

#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "dialogcast/providers/HttpTransport.hpp"

namespace dialogcast::tests::fixtures {

class HttpTransportStub : public providers::IHttpTransport {
 public:
  void Enqueue(int status, std::string body) {
    providers::HttpResponse response;
    response.status = status;
    response.body = std::move(body);
    std::lock_guard<std::mutex> lock(mutex_);
    responses_.push_back(std::move(response));
  }

  void EnqueueNetworkError(std::string error) {
    providers::HttpResponse response;
    response.error = std::move(error);
    std::lock_guard<std::mutex> lock(mutex_);
    responses_.push_back(std::move(response));
  }

  // Used once the queue is empty.
  void SetDefault(int status, std::string body) {
    std::lock_guard<std::mutex> lock(mutex_);
    default_.status = status;
    default_.body = std::move(body);
  }

  providers::HttpResponse Post(const providers::HttpRequest& request,
                               const providers::CancellationToken& cancel) override {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(request);
    if (cancel.IsCancelled()) {
      providers::HttpResponse aborted;
      aborted.error = "Canceled";
      aborted.aborted = true;
      return aborted;
    }
    if (responses_.empty()) return default_;
    providers::HttpResponse response = std::move(responses_.front());
    responses_.pop_front();
    return response;
  }

  std::vector<providers::HttpRequest> requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

  size_t call_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::deque<providers::HttpResponse> responses_;
  providers::HttpResponse default_;
  std::vector<providers::HttpRequest> requests_;
};

}  // namespace dialogcast::tests::fixtures

#endif  // DIALOGCAST_TESTS_FIXTURES_HTTP_TRANSPORT_STUB_H_
