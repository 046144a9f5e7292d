// Shaderlay - HTTP Fetcher Implementation

#include <shaderlay/http_fetcher.h>
#include <ixwebsocket/IXHttpClient.h>
#include <ixwebsocket/IXNetSystem.h>
#include <iostream>

namespace shaderlay {

namespace {
const char* USER_AGENT =
    "Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0 Safari/537.36";
const int CONNECT_TIMEOUT_SECONDS = 15;
const int TRANSFER_TIMEOUT_SECONDS = 30;
}

IxHttpFetcher::IxHttpFetcher(TaskQueue& queue)
    : m_queue(queue) {
    ix::initNetSystem();
    m_client = std::make_unique<ix::HttpClient>(true);
}

IxHttpFetcher::~IxHttpFetcher() {
    // Joins the client's worker thread
    m_client.reset();
    ix::uninitNetSystem();
}

void IxHttpFetcher::fetch(const std::string& url, FetchCallback done) {
    ix::HttpRequestArgsPtr args = m_client->createRequest(url, ix::HttpClient::kGet);
    args->extraHeaders["User-Agent"] = USER_AGENT;
    args->extraHeaders["Accept"] = "text/html,application/xhtml+xml";
    args->followRedirects = true;
    args->connectTimeout = CONNECT_TIMEOUT_SECONDS;
    args->transferTimeout = TRANSFER_TIMEOUT_SECONDS;

    TaskQueue& queue = m_queue;
    bool queued = m_client->performRequest(args, [&queue, done](const ix::HttpResponsePtr& response) {
        HttpResponse result;
        result.status = response->statusCode;
        result.body = response->body;
        if (response->errorCode != ix::HttpErrorCode::Ok) {
            result.error = response->errorMsg.empty() ? "Request failed" : response->errorMsg;
        }
        queue.post([done, result]() {
            if (done) done(result);
        });
    });

    if (!queued) {
        std::cerr << "[Remote] Could not queue request for " << url << std::endl;
        HttpResponse failed;
        failed.error = "Could not start request";
        m_queue.post([done, failed]() {
            if (done) done(failed);
        });
    }
}

} // namespace shaderlay
