// Repository: DialogCast
// Component: HttpTransport Implementation
// Copyright (c) 2026 DialogCast

#include "dialogcast/providers/HttpTransport.hpp"

#include <httplib.h>

#include <sstream>

#include "dialogcast/util/Logger.hpp"

namespace dialogcast::providers {

using dialogcast::util::Logger;

HttplibTransport::HttplibTransport(std::string base_url,
                                   TransportTimeouts timeouts)
    : base_url_(std::move(base_url)), timeouts_(timeouts) {}

HttpResponse HttplibTransport::Post(const HttpRequest& request,
                                    const CancellationToken& cancel) {
  HttpResponse out;
  if (cancel.IsCancelled()) {
    out.aborted = true;
    out.error = "cancelled before send";
    return out;
  }

  httplib::Client cli(base_url_);
  cli.set_connection_timeout(timeouts_.connect_seconds, 0);
  cli.set_read_timeout(timeouts_.read_seconds, 0);
  cli.set_write_timeout(timeouts_.write_seconds, 0);
  cli.set_keep_alive(false);
  cli.set_follow_location(true);

  httplib::Headers headers;
  headers.emplace("User-Agent", "dialogcast/1.0");
  for (const auto& [name, value] : request.headers) {
    headers.emplace(name, value);
  }

  // Returning false from the progress callback aborts the transfer; httplib
  // releases the partial body before returning.
  auto result = cli.Post(request.path, headers, request.body,
                         request.content_type,
                         [&cancel](uint64_t /*current*/, uint64_t /*total*/) {
                           return !cancel.IsCancelled();
                         });

  if (!result) {
    out.aborted = cancel.IsCancelled();
    out.error = httplib::to_string(result.error());
    std::ostringstream oss;
    oss << "[HttpTransport] POST " << base_url_ << request.path
        << " failed: " << out.error;
    Logger::Debug(oss.str());
    return out;
  }

  out.status = result->status;
  out.body = std::move(result->body);
  return out;
}

}  // namespace dialogcast::providers
