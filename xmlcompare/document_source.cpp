// document_source.cpp
// libcurl document source: GET for documents, form POST for login

#include "document_source.hpp"
#include "../lib/log.h"
#include <curl/curl.h>
#include <pthread.h>
#include <stdio.h>
#include <strings.h>

namespace xmlcompare {

static log_category_t* net_log() { return log_get_category("network"); }

// Per-call transfer state shared with the curl callbacks
struct Transfer {
    std::string body;
    std::vector<std::string> cookies;
    const std::atomic<bool>* cancel;

    Transfer() : cancel(nullptr) {}
};

static size_t write_response_callback(void* contents, size_t size, size_t nmemb, void* userdata) {
    Transfer* transfer = (Transfer*)userdata;
    size_t total_size = size * nmemb;
    transfer->body.append((const char*)contents, total_size);
    return total_size;
}

static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    Transfer* transfer = (Transfer*)userdata;
    size_t total_size = size * nitems;
    std::string cookie = parse_set_cookie(std::string(buffer, total_size));
    if (!cookie.empty()) transfer->cookies.push_back(cookie);
    return total_size;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK
static int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    Transfer* transfer = (Transfer*)userdata;
    return (transfer->cancel && transfer->cancel->load()) ? 1 : 0;
}

static pthread_once_t curl_init_once = PTHREAD_ONCE_INIT;
static bool curl_initialized = false;

static void init_curl_once() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        clog_error(net_log(), "failed to initialize libcurl");
        return;
    }
    curl_initialized = true;
}

static bool init_curl() {
    pthread_once(&curl_init_once, init_curl_once);
    return curl_initialized;
}

std::string cookie_header_value(const std::vector<std::string>& cookies) {
    std::string value;
    for (const std::string& cookie : cookies) {
        if (!value.empty()) value += "; ";
        value += cookie;
    }
    return value;
}

std::string parse_set_cookie(const std::string& header_line) {
    static const char prefix[] = "Set-Cookie:";
    const size_t prefix_len = sizeof(prefix) - 1;
    if (header_line.size() <= prefix_len ||
        strncasecmp(header_line.c_str(), prefix, prefix_len) != 0) {
        return std::string();
    }

    size_t start = prefix_len;
    while (start < header_line.size() && (header_line[start] == ' ' || header_line[start] == '\t')) {
        start++;
    }
    size_t end = header_line.find_first_of(";\r\n", start);
    if (end == std::string::npos) end = header_line.size();
    while (end > start && (header_line[end - 1] == ' ' || header_line[end - 1] == '\t')) end--;

    std::string pair = header_line.substr(start, end - start);
    size_t eq = pair.find('=');
    if (eq == std::string::npos || eq == 0) return std::string();
    return pair;
}

CurlDocumentSource::CurlDocumentSource(const HttpConfig& config) : config_(config) {
    init_curl();
}

// Shared option setup for both request kinds
static void apply_common_options(CURL* curl, const HttpConfig& config, const std::string& url,
                                 Transfer& transfer) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_response_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &transfer);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &transfer);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, config.timeout_ms);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, config.connect_timeout_ms);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, config.user_agent.c_str());

    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, config.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, config.verify_tls ? 2L : 0L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "gzip, deflate");
}

// Runs the transfer; on failure fills error with fail_kind (or CANCELLED)
static bool perform(CURL* curl, const std::string& url, Transfer& transfer,
                    CompareErrorKind fail_kind, long& http_code, CompareError& error) {
    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_ABORTED_BY_CALLBACK) {
        clog_info(net_log(), "transfer cancelled for %s", url.c_str());
        error.set(CompareErrorKind::CANCELLED, url);
        return false;
    }
    if (res != CURLE_OK) {
        const char* error_str = curl_easy_strerror(res);
        clog_error(net_log(), "request failed for %s: %s", url.c_str(), error_str);
        error.set(fail_kind, url + ": " + error_str);
        return false;
    }
    http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    return true;
}

bool CurlDocumentSource::fetch(const std::string& url, const AuthToken* token, std::string& body,
                               const std::atomic<bool>* cancel, CompareError& error) {
    if (!init_curl()) {
        error.set(CompareErrorKind::FETCH, "Failed to initialize libcurl");
        return false;
    }
    CURL* curl = curl_easy_init();
    if (!curl) {
        clog_error(net_log(), "failed to create curl handle");
        error.set(CompareErrorKind::FETCH, "Failed to create curl handle");
        return false;
    }

    Transfer transfer;
    transfer.cancel = cancel;
    apply_common_options(curl, config_, url, transfer);
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, config_.max_redirects);

    std::string cookie_value;
    if (token && !token->cookies.empty()) {
        cookie_value = cookie_header_value(token->cookies);
        curl_easy_setopt(curl, CURLOPT_COOKIE, cookie_value.c_str());
    }

    clog_debug(net_log(), "fetching %s (timeout: %ldms)", url.c_str(), config_.timeout_ms);
    long http_code = 0;
    bool ok = perform(curl, url, transfer, CompareErrorKind::FETCH, http_code, error);
    curl_easy_cleanup(curl);
    if (!ok) return false;

    if (http_code >= 400) {
        clog_error(net_log(), "HTTP %ld for %s", http_code, url.c_str());
        char msg[64];
        snprintf(msg, sizeof(msg), ": HTTP %ld", http_code);
        error.set(CompareErrorKind::FETCH, url + msg);
        return false;
    }

    clog_debug(net_log(), "fetched %zu bytes from %s (HTTP %ld)",
               transfer.body.size(), url.c_str(), http_code);
    body.swap(transfer.body);
    return true;
}

bool CurlDocumentSource::authenticate(const std::string& url, const std::string& username,
                                      const std::string& password, AuthToken& token,
                                      const std::atomic<bool>* cancel, CompareError& error) {
    if (!init_curl()) {
        error.set(CompareErrorKind::AUTH, "Failed to initialize libcurl");
        return false;
    }
    CURL* curl = curl_easy_init();
    if (!curl) {
        clog_error(net_log(), "failed to create curl handle");
        error.set(CompareErrorKind::AUTH, "Failed to create curl handle");
        return false;
    }

    char* user_enc = curl_easy_escape(curl, username.c_str(), (int)username.size());
    char* pass_enc = curl_easy_escape(curl, password.c_str(), (int)password.size());
    if (!user_enc || !pass_enc) {
        curl_free(user_enc);
        curl_free(pass_enc);
        curl_easy_cleanup(curl);
        error.set(CompareErrorKind::AUTH, "Failed to encode credentials");
        return false;
    }
    std::string form = std::string("username=") + user_enc + "&password=" + pass_enc;
    curl_free(user_enc);
    curl_free(pass_enc);

    Transfer transfer;
    transfer.cancel = cancel;
    apply_common_options(curl, config_, url, transfer);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, form.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)form.size());

    clog_debug(net_log(), "logging in at %s as %s", url.c_str(), username.c_str());
    long http_code = 0;
    bool ok = perform(curl, url, transfer, CompareErrorKind::AUTH, http_code, error);
    curl_easy_cleanup(curl);
    if (!ok) return false;

    if (http_code < 200 || http_code >= 300) {
        clog_error(net_log(), "login rejected by %s (HTTP %ld)", url.c_str(), http_code);
        char msg[64];
        snprintf(msg, sizeof(msg), "HTTP %ld", http_code);
        error.set(CompareErrorKind::AUTH, msg);
        return false;
    }

    token.cookies.swap(transfer.cookies);
    token.expires_at = time(NULL) + config_.session_ttl_seconds;
    clog_info(net_log(), "logged in at %s (%zu cookies)", url.c_str(), token.cookies.size());
    return true;
}

} // namespace xmlcompare
