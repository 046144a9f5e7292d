#pragma once

// Shaderlay - HTTP Fetcher
// HttpFetcher backed by IXWebSocket's asynchronous HTTP client

#include <shaderlay/remote_shader.h>
#include <shaderlay/task_queue.h>
#include <memory>

namespace ix {
class HttpClient;
}

namespace shaderlay {

class IxHttpFetcher : public HttpFetcher {
public:
    explicit IxHttpFetcher(TaskQueue& queue);
    ~IxHttpFetcher() override;

    // Non-copyable
    IxHttpFetcher(const IxHttpFetcher&) = delete;
    IxHttpFetcher& operator=(const IxHttpFetcher&) = delete;

    // Response is posted to the task queue
    void fetch(const std::string& url, FetchCallback done) override;

private:
    TaskQueue& m_queue;
    std::unique_ptr<ix::HttpClient> m_client;
};

} // namespace shaderlay
