#include "../include/http.hpp"
#include "../include/cancel_token.hpp"
#include <curl/curl.h>

namespace {
size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

// Non-zero return makes libcurl abort the transfer with CURLE_ABORTED_BY_CALLBACK.
int progress_cb(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const CancelToken* cancel = static_cast<const CancelToken*>(clientp);
    return cancel->cancelled() ? 1 : 0;
}

struct CurlHandle {
    CURL* h{nullptr};
    CurlHandle() { h = curl_easy_init(); if (!h) throw std::runtime_error("curl_easy_init failed"); }
    ~CurlHandle() { if (h) curl_easy_cleanup(h); }
};

struct HeaderList {
    struct curl_slist* list{nullptr};
    ~HeaderList() { curl_slist_free_all(list); }
    void append(const std::string& line) {
        struct curl_slist* next = curl_slist_append(list, line.c_str());
        if (!next) throw std::runtime_error("curl_slist_append failed");
        list = next;
    }
};
}

CurlGlobalScope::CurlGlobalScope() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        throw std::runtime_error("curl_global_init failed");
    }
}

CurlGlobalScope::~CurlGlobalScope() {
    curl_global_cleanup();
}

HttpResponse http_post(const HttpRequest& req, const CancelToken& cancel) {
    if (cancel.cancelled()) throw TransportError("request cancelled", true);

    CurlHandle c;
    HeaderList headers;
    headers.append("Content-Type: application/json");
    for (const auto& h : req.headers) headers.append(h);

    std::string buf;
    curl_easy_setopt(c.h, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, headers.list);
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, req.body.c_str());
    curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, (long)req.body.size());
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &buf);
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, req.timeout_ms);
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c.h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(c.h, CURLOPT_XFERINFOFUNCTION, progress_cb);
    curl_easy_setopt(c.h, CURLOPT_XFERINFODATA, const_cast<CancelToken*>(&cancel));

    CURLcode code = curl_easy_perform(c.h);
    if (code == CURLE_ABORTED_BY_CALLBACK) {
        throw TransportError("request cancelled", true);
    }
    if (code != CURLE_OK) {
        throw TransportError(std::string("request failed: ") + curl_easy_strerror(code), false);
    }

    HttpResponse resp;
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &resp.status);
    resp.body = std::move(buf);
    return resp;
}
