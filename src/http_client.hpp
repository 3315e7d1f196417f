#pragma once
#include <asio.hpp>
#include <httplib.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

struct HttpRequest {
    std::string method = "GET";
    std::string path;
    httplib::Headers headers;
    std::string body;
};

struct HttpOutcome {
    enum class Kind { Response, ConnectFailed, Timeout, ProtocolError };

    Kind kind = Kind::ConnectFailed;
    int status = 0;
    std::string body;
    std::string error;
};

// Maps a failed httplib request to an outcome. Read and write failures that
// took the whole deadline are timeouts; connection failures never are.
HttpOutcome::Kind outcome_kind_of(httplib::Error error,
                                  std::chrono::milliseconds elapsed,
                                  std::chrono::milliseconds timeout);

// Blocking request on a fresh connection; every phase is bounded by timeout.
HttpOutcome perform_request(httplib::Client& client,
                            const HttpRequest& request,
                            std::chrono::milliseconds timeout);

// One outbound request run on a worker pool. cancel() aborts the socket and
// suppresses the handler.
class HttpExchange : public std::enable_shared_from_this<HttpExchange> {
public:
    using Handler = std::function<void(HttpOutcome)>;

    static std::shared_ptr<HttpExchange> start(asio::thread_pool& pool,
                                               const std::string& host,
                                               uint16_t port,
                                               HttpRequest request,
                                               std::chrono::milliseconds timeout,
                                               Handler handler);

    // Any thread.
    void cancel();

private:
    HttpExchange(const std::string& host, uint16_t port, HttpRequest request, Handler handler);
    void run(std::chrono::milliseconds timeout);

    httplib::Client client_;
    HttpRequest request_;
    std::mutex mutex_;
    std::atomic<bool> cancelled_{false};
    Handler handler_;
};
