// batch.cpp
// Batch orchestration: inline batches on the caller, URL batches on a worker pool

#include "batch.hpp"
#include "flattener.hpp"
#include "validation.hpp"
#include "worker_pool.h"
#include "../lib/log.h"
#include <memory>

namespace xmlcompare {

static log_category_t* batch_log() { return log_get_category("batch"); }

bool compare_documents(const std::string& xml1, const std::string& xml2, const IgnoreRules& rules,
                       ComparisonResult& result, CompareError& error) {
    if (!validate_xml_content(xml1, error)) return false;
    if (!validate_xml_content(xml2, error)) return false;

    FlatDocument doc1, doc2;
    if (!flatten(xml1, doc1, error)) return false;
    if (!flatten(xml2, doc2, error)) return false;

    result = compare(doc1, doc2, rules);
    return true;
}

static void record_item(BatchResult& batch, size_t index, bool ok, const ComparisonResult& result,
                        const CompareError& error) {
    if (ok) {
        batch.results.push_back(result);
        batch.successful++;
    } else {
        clog_error(batch_log(), "item %zu failed: %s", index, to_string(error).c_str());
        batch.results.push_back(placeholder_result());
        batch.failed++;
    }
}

BatchOrchestrator::BatchOrchestrator(DocumentSource& source, SessionStore& sessions,
                                     const BatchConfig& config)
    : source_(source), sessions_(sessions), config_(config), cancelled_(false) {}

void BatchOrchestrator::cancel() {
    clog_info(batch_log(), "batch cancellation requested");
    cancelled_.store(true);
}

BatchResult BatchOrchestrator::run_inline(const std::vector<CompareRequest>& requests) {
    BatchResult batch;
    batch.total = requests.size();
    batch.results.reserve(requests.size());

    for (size_t i = 0; i < requests.size(); i++) {
        ComparisonResult result;
        CompareError error;
        bool ok = false;
        if (cancelled_.load()) {
            error.set(CompareErrorKind::CANCELLED, "batch cancelled");
        } else {
            ok = compare_request(requests[i], result, error);
        }
        record_item(batch, i, ok, result, error);
    }

    clog_info(batch_log(), "inline batch: %zu total, %zu successful, %zu failed",
              batch.total, batch.successful, batch.failed);
    return batch;
}

bool BatchOrchestrator::resolveToken(const UrlCompareRequest& request, AuthToken& token,
                                     bool& has_token, CompareError& error) {
    has_token = false;
    if (!request.session_id.empty()) {
        Session session;
        if (!sessions_.lookup(request.session_id, session)) {
            error.set(CompareErrorKind::AUTH, "Session not found or expired");
            return false;
        }
        token = session.token();
        has_token = true;
        return true;
    }
    if (request.has_credentials) {
        AuthToken login;
        if (!source_.authenticate(request.url1, request.credentials.username,
                                  request.credentials.password, login, &cancelled_, error)) {
            return false;
        }
        Session session = sessions_.create(request.url1, login.cookies);
        token = session.token();
        has_token = true;
    }
    return true;
}

bool BatchOrchestrator::compare_urls(const UrlCompareRequest& request, ComparisonResult& result,
                                     CompareError& error) {
    if (!validate_url(request.url1, error)) return false;
    if (!validate_url(request.url2, error)) return false;

    AuthToken token;
    bool has_token = false;
    if (!resolveToken(request, token, has_token, error)) return false;
    const AuthToken* token_ptr = has_token ? &token : nullptr;

    std::string xml1, xml2;
    if (!source_.fetch(request.url1, token_ptr, xml1, &cancelled_, error)) return false;
    if (!source_.fetch(request.url2, token_ptr, xml2, &cancelled_, error)) return false;

    if (cancelled_.load()) {
        error.set(CompareErrorKind::CANCELLED, "batch cancelled");
        return false;
    }
    return compare_documents(xml1, xml2, request.rules, result, error);
}

// ============================================================================
// URL batch tasks
// ============================================================================

// Per-item handle: filled by a worker, awaited by the submitting thread
struct UrlTaskSlot {
    BatchOrchestrator* orchestrator;
    const UrlCompareRequest* request;
    ComparisonResult result;
    CompareError error;
    bool ok;
    bool done;
    pthread_mutex_t mutex;
    pthread_cond_t cond;

    UrlTaskSlot() : orchestrator(nullptr), request(nullptr), ok(false), done(false) {
        pthread_mutex_init(&mutex, NULL);
        pthread_cond_init(&cond, NULL);
    }
    ~UrlTaskSlot() {
        pthread_cond_destroy(&cond);
        pthread_mutex_destroy(&mutex);
    }

    void run() {
        ComparisonResult item_result;
        CompareError item_error;
        bool item_ok = false;
        if (orchestrator->cancelled()) {
            item_error.set(CompareErrorKind::CANCELLED, "batch cancelled");
        } else {
            item_ok = orchestrator->compare_urls(*request, item_result, item_error);
        }

        pthread_mutex_lock(&mutex);
        result = item_result;
        error = item_error;
        ok = item_ok;
        done = true;
        pthread_cond_signal(&cond);
        pthread_mutex_unlock(&mutex);
    }

    void await() {
        pthread_mutex_lock(&mutex);
        while (!done) pthread_cond_wait(&cond, &mutex);
        pthread_mutex_unlock(&mutex);
    }

private:
    UrlTaskSlot(const UrlTaskSlot&);
    UrlTaskSlot& operator=(const UrlTaskSlot&);
};

static void url_task_entry(void* data) {
    ((UrlTaskSlot*)data)->run();
}

BatchResult BatchOrchestrator::run_urls(const std::vector<UrlCompareRequest>& requests) {
    BatchResult batch;
    batch.total = requests.size();
    if (requests.empty()) return batch;
    batch.results.reserve(requests.size());

    int workers = config_.workers > 0 ? config_.workers : 8;
    if ((size_t)workers > requests.size()) workers = (int)requests.size();

    std::unique_ptr<UrlTaskSlot[]> slots(new UrlTaskSlot[requests.size()]);
    WorkerPool* pool = worker_pool_create(workers);
    if (!pool) {
        clog_error(batch_log(), "failed to create worker pool, running batch on caller");
    }

    clog_info(batch_log(), "url batch: %zu items on %d workers", requests.size(), workers);
    for (size_t i = 0; i < requests.size(); i++) {
        slots[i].orchestrator = this;
        slots[i].request = &requests[i];
        if (!pool || !worker_pool_enqueue(pool, url_task_entry, &slots[i])) {
            slots[i].run();
        }
    }

    // await handles in submission order
    for (size_t i = 0; i < requests.size(); i++) {
        slots[i].await();
        record_item(batch, i, slots[i].ok, slots[i].result, slots[i].error);
    }
    worker_pool_destroy(pool);

    clog_info(batch_log(), "url batch: %zu total, %zu successful, %zu failed",
              batch.total, batch.successful, batch.failed);
    return batch;
}

} // namespace xmlcompare
