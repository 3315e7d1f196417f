#include "http_client.hpp"

HttpOutcome::Kind outcome_kind_of(httplib::Error error,
                                  std::chrono::milliseconds elapsed,
                                  std::chrono::milliseconds timeout)
{
    switch(error){
        case httplib::Error::Read:
        case httplib::Error::Write:
            // Allow for timer slack in the socket wait.
            if(elapsed + std::chrono::milliseconds(50) >= timeout) return HttpOutcome::Kind::Timeout;
            return HttpOutcome::Kind::ProtocolError;
        case httplib::Error::Success:
        case httplib::Error::Unknown:
        case httplib::Error::ExceedRedirectCount:
        case httplib::Error::Compression:
            return HttpOutcome::Kind::ProtocolError;
        default:
            return HttpOutcome::Kind::ConnectFailed;
    }
}

HttpOutcome perform_request(httplib::Client& client,
                            const HttpRequest& request,
                            std::chrono::milliseconds timeout)
{
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);
    client.set_write_timeout(timeout);
    client.set_keep_alive(false);

    httplib::Request req;
    req.method = request.method;
    req.path = request.path;
    req.headers = request.headers;
    req.body = request.body;

    const auto started = std::chrono::steady_clock::now();
    auto res = client.send(req);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    HttpOutcome outcome;
    if(res){
        outcome.kind = HttpOutcome::Kind::Response;
        outcome.status = res->status;
        outcome.body = std::move(res->body);
        return outcome;
    }
    outcome.kind = outcome_kind_of(res.error(), elapsed, timeout);
    outcome.error = httplib::to_string(res.error());
    if(outcome.kind == HttpOutcome::Kind::Timeout){
        outcome.error = "no response within " + std::to_string(timeout.count()) + " ms";
    }
    return outcome;
}

std::shared_ptr<HttpExchange> HttpExchange::start(asio::thread_pool& pool,
                                                  const std::string& host,
                                                  uint16_t port,
                                                  HttpRequest request,
                                                  std::chrono::milliseconds timeout,
                                                  Handler handler)
{
    auto x = std::shared_ptr<HttpExchange>(new HttpExchange(host, port, std::move(request), std::move(handler)));
    asio::post(pool, [x, timeout]{ x->run(timeout); });
    return x;
}

HttpExchange::HttpExchange(const std::string& host, uint16_t port, HttpRequest request, Handler handler)
: client_(host, port), request_(std::move(request)), handler_(std::move(handler))
{
}

void HttpExchange::run(std::chrono::milliseconds timeout){
    if(cancelled_) return;
    HttpOutcome outcome = perform_request(client_, request_, timeout);
    request_.body.clear();

    Handler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = std::move(handler_);
    }
    if(!cancelled_ && handler) handler(std::move(outcome));
}

void HttpExchange::cancel(){
    cancelled_ = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler_ = nullptr;
    }
    client_.stop();
}
