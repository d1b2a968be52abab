// Repository: DialogCast
// Component: HttpTransport
// Purpose: HTTPS POST seam between provider adapters and the network.
//          Production uses cpp-httplib; tests inject a scripted fake.
// Copyright (c) 2026 DialogCast

#ifndef DIALOGCAST_PROVIDERS_HTTP_TRANSPORT_HPP_
#define DIALOGCAST_PROVIDERS_HTTP_TRANSPORT_HPP_

#include <map>
#include <string>

#include "dialogcast/providers/CancellationToken.hpp"

namespace dialogcast::providers {

struct HttpRequest {
  std::string path;  // Path plus query, e.g. "/tts/bytes"
  std::multimap<std::string, std::string> headers;
  std::string body;
  std::string content_type = "application/json";
};

struct HttpResponse {
  // 0 when no response was received (connect failure, timeout, abort).
  int status = 0;
  std::string body;
  // Transport-level failure description; empty when a response arrived.
  std::string error;
  // True when the transfer was aborted through the cancellation token.
  bool aborted = false;
};

class IHttpTransport {
 public:
  virtual ~IHttpTransport() = default;

  // Blocking POST. Never throws for network conditions: failures are
  // reported through HttpResponse. Must abort promptly once `cancel` fires.
  virtual HttpResponse Post(const HttpRequest& request,
                            const CancellationToken& cancel) = 0;
};

struct TransportTimeouts {
  int connect_seconds = 30;
  int read_seconds = 120;
  int write_seconds = 30;
};

// cpp-httplib client bound to one base URL ("https://api.cartesia.ai").
// A fresh connection is opened per request, so one instance may be shared by
// concurrent synthesis workers.
class HttplibTransport : public IHttpTransport {
 public:
  explicit HttplibTransport(std::string base_url,
                            TransportTimeouts timeouts = TransportTimeouts());

  HttpResponse Post(const HttpRequest& request,
                    const CancellationToken& cancel) override;

  const std::string& base_url() const { return base_url_; }

 private:
  std::string base_url_;
  TransportTimeouts timeouts_;
};

}  // namespace dialogcast::providers

#endif  // DIALOGCAST_PROVIDERS_HTTP_TRANSPORT_HPP_
