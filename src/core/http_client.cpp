#include <tabwright/core/http_client.hpp>
#include <tabwright/core/logger.hpp>
#include <sstream>

namespace tabwright {

Json HttpResponse::json() const {
    try {
        return Json::parse(body);
    } catch (const Json::parse_error& e) {
        LOG_DEBUG("HTTP body is not JSON: %s", e.what());
        return Json();
    }
}

HttpClient::HttpClient() : curl_(nullptr), timeout_ms_(5000) {
    curl_ = curl_easy_init();
}

HttpClient::~HttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
}

void HttpClient::set_timeout(long ms) { 
    timeout_ms_ = ms; 
}

size_t HttpClient::write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    std::string* response_body = static_cast<std::string*>(userdata);
    response_body->append(ptr, total);
    return total;
}

HttpResponse HttpClient::get(const std::string& url) {
    HttpResponse resp;
    
    if (!curl_) {
        resp.error = "CURL not initialized";
        return resp;
    }
    
    curl_easy_reset(curl_);
    
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_ / 2);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, "tabwright");

    std::string response_body;
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_, CURLOPT_MAXREDIRS, 5L);
    
    CURLcode res = curl_easy_perform(curl_);
    if (res != CURLE_OK) {
        resp.error = curl_easy_strerror(res);
        return resp;
    }
    
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &resp.status_code);
    resp.body = response_body;
    
    if (resp.status_code < 200 || resp.status_code >= 300) {
        std::ostringstream oss;
        oss << "HTTP " << resp.status_code;
        if (!resp.body.empty()) {
            std::string snippet = resp.body;
            if (snippet.size() > 512) {
                snippet = snippet.substr(0, 512) + "...";
            }
            oss << ": " << snippet;
        }
        resp.error = oss.str();
    }
    
    return resp;
}

} // namespace tabwright
