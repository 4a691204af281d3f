#include "http.hpp"

#include <curl/curl.h>
#include <string>

namespace agentsh {

namespace {

const std::atomic<bool>* g_abort_flag = nullptr;

constexpr long kConnectTimeoutSeconds = 10;
constexpr const char* kUserAgent = "agentsh/0.1";

// curl calls this about once a second; non-zero aborts the transfer
int progress_callback(void*, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    return (g_abort_flag && g_abort_flag->load(std::memory_order_relaxed)) ? 1 : 0;
}

size_t append_body(char* data, size_t size, size_t nmemb, void* userdata) {
    static_cast<std::string*>(userdata)->append(data, size * nmemb);
    return size * nmemb;
}

// Owns one easy handle and its header list
class CurlHandle {
public:
    CurlHandle() : curl_(curl_easy_init()) {}
    ~CurlHandle() {
        curl_slist_free_all(headers_);
        if (curl_) curl_easy_cleanup(curl_);
    }
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() const { return curl_; }

    void set_headers(const std::vector<Header>& headers) {
        for (const auto& [name, value] : headers) {
            std::string line = name + ": " + value;
            headers_ = curl_slist_append(headers_, line.c_str());
        }
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers_);
    }

private:
    CURL* curl_;
    curl_slist* headers_ = nullptr;
};

} // namespace

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

void http_set_abort_flag(const std::atomic<bool>* flag) {
    g_abort_flag = flag;
}

HttpResponse CurlHttpClient::post(const std::string& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers,
                                  long timeout_seconds) {
    HttpResponse response;
    CurlHandle handle;
    CURL* curl = handle.get();
    if (!curl) {
        response.error = "could not create curl handle";
        return response;
    }

    handle.set_headers(headers);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, kUserAgent);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, kConnectTimeoutSeconds);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    if (g_abort_flag) {
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    }

    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        response.error = rc == CURLE_ABORTED_BY_CALLBACK
            ? "request cancelled"
            : curl_easy_strerror(rc);
        return response;
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    return response;
}

} // namespace agentsh
