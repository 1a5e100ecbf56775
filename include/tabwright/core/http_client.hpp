#ifndef TABWRIGHT_CORE_HTTP_CLIENT_HPP
#define TABWRIGHT_CORE_HTTP_CLIENT_HPP

#include "json.hpp"
#include <string>
#include <curl/curl.h>

namespace tabwright {

struct HttpResponse {
    long status_code;
    std::string body;
    std::string error;
    
    HttpResponse() : status_code(0) {}
    
    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }
    
    // Parsed body, or null when the body is not JSON
    Json json() const;
};

// Blocking HTTP client using libcurl. Only used against the browser's
// local discovery endpoints (/json/list, /json/version).
class HttpClient {
public:
    HttpClient();
    ~HttpClient();
    
    void set_timeout(long ms);
    
    // Never throws; failures land in HttpResponse::error
    HttpResponse get(const std::string& url);

private:
    HttpClient(const HttpClient&);
    HttpClient& operator=(const HttpClient&);

    CURL* curl_;
    long timeout_ms_;
    
    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata);
};

} // namespace tabwright

#endif // TABWRIGHT_CORE_HTTP_CLIENT_HPP
