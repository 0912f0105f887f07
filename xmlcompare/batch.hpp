#pragma once
#ifndef XMLCOMPARE_BATCH_HPP
#define XMLCOMPARE_BATCH_HPP

#include "compare_error.hpp"
#include "diff_engine.hpp"
#include "document_source.hpp"
#include "path_matcher.hpp"
#include "session_store.hpp"
#include <atomic>
#include <string>
#include <vector>

namespace xmlcompare {

// Inline document pair
struct CompareRequest {
    std::string xml1;
    std::string xml2;
    IgnoreRules rules;
};

struct AuthCredentials {
    std::string username;
    std::string password;
};

// URL pair; login happens against url1
struct UrlCompareRequest {
    std::string url1;
    std::string url2;
    IgnoreRules rules;
    bool has_credentials;
    AuthCredentials credentials;
    std::string session_id;     // existing session, takes precedence over credentials.
                                // Set by embedders; JSON requests never carry it.

    UrlCompareRequest() : has_credentials(false) {}
};

struct BatchResult {
    std::vector<ComparisonResult> results;  // one per request, in request order
    size_t total;
    size_t successful;
    size_t failed;

    BatchResult() : total(0), successful(0), failed(0) {}
};

struct BatchConfig {
    int workers;    // upper bound on concurrent URL tasks

    BatchConfig() : workers(8) {}
};

// Validate, flatten and diff two documents
bool compare_documents(const std::string& xml1, const std::string& xml2, const IgnoreRules& rules,
                       ComparisonResult& result, CompareError& error);

inline bool compare_request(const CompareRequest& request, ComparisonResult& result,
                            CompareError& error) {
    return compare_documents(request.xml1, request.xml2, request.rules, result, error);
}

/**
 * Runs comparison batches.
 *
 * Inline batches run on the calling thread. URL batches run on a worker pool
 * of at most config.workers threads; results always follow request order.
 * A failed item yields a placeholder result and counts as failed; the batch
 * itself never fails.
 */
class BatchOrchestrator {
private:
    DocumentSource& source_;
    SessionStore& sessions_;
    BatchConfig config_;
    std::atomic<bool> cancelled_;

    bool resolveToken(const UrlCompareRequest& request, AuthToken& token, bool& has_token,
                      CompareError& error);

public:
    BatchOrchestrator(DocumentSource& source, SessionStore& sessions,
                      const BatchConfig& config = BatchConfig());

    BatchResult run_inline(const std::vector<CompareRequest>& requests);
    BatchResult run_urls(const std::vector<UrlCompareRequest>& requests);

    // Single URL comparison: resolve session, fetch both documents, diff
    bool compare_urls(const UrlCompareRequest& request, ComparisonResult& result,
                      CompareError& error);

    // Items not yet started finish as CANCELLED; transfers in flight are aborted
    void cancel();
    bool cancelled() const { return cancelled_.load(); }
    void reset() { cancelled_.store(false); }
};

} // namespace xmlcompare

#endif // XMLCOMPARE_BATCH_HPP
