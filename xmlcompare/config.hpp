#pragma once
#ifndef XMLCOMPARE_CONFIG_HPP
#define XMLCOMPARE_CONFIG_HPP

#include "batch.hpp"
#include "document_source.hpp"

namespace xmlcompare {

// Process-wide settings; defaults here, overridden by command-line flags
struct AppConfig {
    BatchConfig batch;              // workers = 8
    HttpConfig http;                // 30s total, 5s connect, 5 redirects, TLS verified
    long session_ttl_seconds;
    long sweep_interval_seconds;

    AppConfig() : session_ttl_seconds(3600), sweep_interval_seconds(300) {}
};

} // namespace xmlcompare

#endif // XMLCOMPARE_CONFIG_HPP
