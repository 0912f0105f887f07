#pragma once
#ifndef XMLCOMPARE_DOCUMENT_SOURCE_HPP
#define XMLCOMPARE_DOCUMENT_SOURCE_HPP

#include "compare_error.hpp"
#include <atomic>
#include <string>
#include <time.h>
#include <vector>

namespace xmlcompare {

// Credential token returned by a successful login
struct AuthToken {
    std::vector<std::string> cookies;   // "name=value" pairs
    time_t expires_at;

    AuthToken() : expires_at(0) {}
};

// Transfer settings for the libcurl source
struct HttpConfig {
    long timeout_ms;
    long connect_timeout_ms;
    long max_redirects;
    std::string user_agent;
    bool verify_tls;
    long session_ttl_seconds;

    HttpConfig()
        : timeout_ms(30000), connect_timeout_ms(5000), max_redirects(5),
          user_agent("xmlcompare/1.0"), verify_tls(true), session_ttl_seconds(3600) {}
};

/**
 * Where URL comparisons get their documents from.
 *
 * Implementations are called concurrently from batch workers and must not
 * share per-call state. A non-null cancel flag that becomes true aborts the
 * call with a CANCELLED error.
 */
class DocumentSource {
public:
    virtual ~DocumentSource() {}

    // Retrieve the document at url; a FETCH error on failure
    virtual bool fetch(const std::string& url, const AuthToken* token, std::string& body,
                       const std::atomic<bool>* cancel, CompareError& error) = 0;

    // Log in at url; an AUTH error when rejected
    virtual bool authenticate(const std::string& url, const std::string& username,
                              const std::string& password, AuthToken& token,
                              const std::atomic<bool>* cancel, CompareError& error) = 0;
};

// HTTP(S) document source built on libcurl easy handles, one per call
class CurlDocumentSource : public DocumentSource {
private:
    HttpConfig config_;

public:
    explicit CurlDocumentSource(const HttpConfig& config);

    bool fetch(const std::string& url, const AuthToken* token, std::string& body,
               const std::atomic<bool>* cancel, CompareError& error) override;

    bool authenticate(const std::string& url, const std::string& username,
                      const std::string& password, AuthToken& token,
                      const std::atomic<bool>* cancel, CompareError& error) override;
};

// "a=1; b=2" for a Cookie request header
std::string cookie_header_value(const std::vector<std::string>& cookies);

// name=value pair of a raw "Set-Cookie:" response header line, or "" for other headers
std::string parse_set_cookie(const std::string& header_line);

} // namespace xmlcompare

#endif // XMLCOMPARE_DOCUMENT_SOURCE_HPP
