#pragma once
#include <string>
#include <utility>
#include <vector>
#include <atomic>

namespace agentsh {

// Global curl setup and teardown, once per process
void http_init();
void http_cleanup();

// In-flight requests abort shortly after *flag becomes true. The shell
// points this at the Ctrl+C flag so a hung model call can be cancelled.
void http_set_abort_flag(const std::atomic<bool>* flag);

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0; // 0 = no HTTP response (see error)
    std::string body;
    std::string error;    // transport failure description, empty otherwise

    bool ok() const { return status_code >= 200 && status_code < 300; }
};

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 120) = 0;
};

class CurlHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 120) override;
};

} // namespace agentsh
