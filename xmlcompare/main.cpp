// main.cpp
// xmlcompare command-line entry point

#include "batch.hpp"
#include "config.hpp"
#include "json_codec.hpp"
#include "session_store.hpp"
#include "../lib/log.h"
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <fstream>
#include <sstream>

using namespace xmlcompare;

enum ExitCode {
    EXIT_MATCHED = 0,
    EXIT_DIFFERENT = 1,
    EXIT_USAGE = 2
};

static void print_help() {
    printf("xmlcompare - structural XML comparison\n\n");
    printf("Usage:\n");
    printf("  xmlcompare compare <file1> <file2> [-p <ignore-path>]... [-i <ignore-property>]... [-o <out>]\n");
    printf("  xmlcompare url <url1> <url2> [-u <user> -P <password>] [-p ...] [-i ...] [-o <out>]\n");
    printf("  xmlcompare batch <requests.json> [-w <workers>] [-o <out>]\n");
    printf("  xmlcompare --help\n");
    printf("\nOptions:\n");
    printf("  -p, --ignore-path <pattern>      Ignore elements whose path matches (exact, prefix*, prefix/)\n");
    printf("  -i, --ignore-property <name>     Ignore an attribute key or a whole element by tag name\n");
    printf("  -o, --output <file>              Write the JSON result to a file instead of stdout\n");
    printf("  -u, --user <name>                Login user for url comparisons (login against url1)\n");
    printf("  -P, --password <secret>          Login password\n");
    printf("  -w, --workers <n>                Concurrent url comparisons in a batch (default 8)\n");
    printf("  --timeout <ms>                   Total transfer timeout (default 30000)\n");
    printf("  --connect-timeout <ms>           Connect timeout (default 5000)\n");
    printf("  --insecure                       Skip TLS certificate verification\n");
    printf("\nExit status: 0 all matched, 1 differences or failed items, 2 usage or fatal error\n");
    printf("Logging is configured by log.conf in the working directory when present.\n");
}

static bool read_text_file(const char* path, std::string& out) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) return false;
    std::ostringstream buffer;
    buffer << in.rdbuf();
    out = buffer.str();
    return !in.bad();
}

static bool write_output(const char* path, const std::string& text) {
    if (!path) {
        fputs(text.c_str(), stdout);
        return true;
    }
    FILE* f = fopen(path, "w");
    if (!f) {
        log_error("cannot open output file %s", path);
        return false;
    }
    size_t written = fwrite(text.data(), 1, text.size(), f);
    int rc = fclose(f);
    return written == text.size() && rc == 0;
}

static bool parse_long(const char* text, long& out) {
    char* end = NULL;
    long value = strtol(text, &end, 10);
    if (!end || *end != '\0' || end == text || value < 0) return false;
    out = value;
    return true;
}

// Options shared by all subcommands
struct CliOptions {
    std::vector<const char*> positional;
    IgnoreRules rules;
    const char* output;
    const char* user;
    const char* password;

    CliOptions() : output(NULL), user(NULL), password(NULL) {}
};

static bool missing_value(const char* option) {
    fprintf(stderr, "Error: option '%s' requires a value\n", option);
    return false;
}

static bool parse_options(int argc, char* argv[], int start, CliOptions& opts, AppConfig& config) {
    for (int i = start; i < argc; i++) {
        const char* arg = argv[i];
        bool has_value = i + 1 < argc;
        if (strcmp(arg, "-p") == 0 || strcmp(arg, "--ignore-path") == 0) {
            if (!has_value) return missing_value(arg);
            opts.rules.paths.push_back(argv[++i]);
        } else if (strcmp(arg, "-i") == 0 || strcmp(arg, "--ignore-property") == 0) {
            if (!has_value) return missing_value(arg);
            opts.rules.properties.push_back(argv[++i]);
        } else if (strcmp(arg, "-o") == 0 || strcmp(arg, "--output") == 0) {
            if (!has_value) return missing_value(arg);
            opts.output = argv[++i];
        } else if (strcmp(arg, "-u") == 0 || strcmp(arg, "--user") == 0) {
            if (!has_value) return missing_value(arg);
            opts.user = argv[++i];
        } else if (strcmp(arg, "-P") == 0 || strcmp(arg, "--password") == 0) {
            if (!has_value) return missing_value(arg);
            opts.password = argv[++i];
        } else if (strcmp(arg, "-w") == 0 || strcmp(arg, "--workers") == 0) {
            long workers;
            if (!has_value) return missing_value(arg);
            if (!parse_long(argv[++i], workers) || workers == 0) {
                fprintf(stderr, "Error: invalid worker count '%s'\n", argv[i]);
                return false;
            }
            config.batch.workers = (int)workers;
        } else if (strcmp(arg, "--timeout") == 0) {
            if (!has_value) return missing_value(arg);
            if (!parse_long(argv[++i], config.http.timeout_ms)) {
                fprintf(stderr, "Error: invalid timeout '%s'\n", argv[i]);
                return false;
            }
        } else if (strcmp(arg, "--connect-timeout") == 0) {
            if (!has_value) return missing_value(arg);
            if (!parse_long(argv[++i], config.http.connect_timeout_ms)) {
                fprintf(stderr, "Error: invalid connect timeout '%s'\n", argv[i]);
                return false;
            }
        } else if (strcmp(arg, "--insecure") == 0) {
            config.http.verify_tls = false;
        } else if (arg[0] == '-' && arg[1] != '\0') {
            fprintf(stderr, "Error: unknown option '%s'\n", arg);
            return false;
        } else {
            opts.positional.push_back(arg);
        }
    }
    return true;
}

static int finish_single(bool ok, const ComparisonResult& result, const CompareError& error,
                         const char* output) {
    if (!ok) {
        log_error("%s", to_string(error).c_str());
        fprintf(stderr, "Error: %s\n", to_string(error).c_str());
        if (!write_output(output, write_json(error_to_json(error)))) {
            fprintf(stderr, "Error: failed to write output\n");
        }
        return EXIT_USAGE;
    }
    if (!write_output(output, write_json(result_to_json(result)))) {
        fprintf(stderr, "Error: failed to write output\n");
        return EXIT_USAGE;
    }
    return result.matched ? EXIT_MATCHED : EXIT_DIFFERENT;
}

static int run_compare(const CliOptions& opts) {
    if (opts.positional.size() != 2) {
        fprintf(stderr, "Error: compare requires exactly two files\n");
        return EXIT_USAGE;
    }
    CompareRequest request;
    request.rules = opts.rules;
    if (!read_text_file(opts.positional[0], request.xml1)) {
        fprintf(stderr, "Error: cannot read %s\n", opts.positional[0]);
        return EXIT_USAGE;
    }
    if (!read_text_file(opts.positional[1], request.xml2)) {
        fprintf(stderr, "Error: cannot read %s\n", opts.positional[1]);
        return EXIT_USAGE;
    }

    ComparisonResult result;
    CompareError error;
    bool ok = compare_request(request, result, error);
    return finish_single(ok, result, error, opts.output);
}

static int run_url(const CliOptions& opts, const AppConfig& config) {
    if (opts.positional.size() != 2) {
        fprintf(stderr, "Error: url requires exactly two URLs\n");
        return EXIT_USAGE;
    }
    if ((opts.user == NULL) != (opts.password == NULL)) {
        fprintf(stderr, "Error: -u and -P must be given together\n");
        return EXIT_USAGE;
    }

    UrlCompareRequest request;
    request.url1 = opts.positional[0];
    request.url2 = opts.positional[1];
    request.rules = opts.rules;
    if (opts.user) {
        request.has_credentials = true;
        request.credentials.username = opts.user;
        request.credentials.password = opts.password;
    }

    CurlDocumentSource source(config.http);
    SessionStore sessions(config.session_ttl_seconds);
    BatchOrchestrator orchestrator(source, sessions, config.batch);

    ComparisonResult result;
    CompareError error;
    bool ok = orchestrator.compare_urls(request, result, error);
    return finish_single(ok, result, error, opts.output);
}

static int run_batch(const CliOptions& opts, const AppConfig& config) {
    if (opts.positional.size() != 1) {
        fprintf(stderr, "Error: batch requires one request file\n");
        return EXIT_USAGE;
    }
    std::string text;
    if (!read_text_file(opts.positional[0], text)) {
        fprintf(stderr, "Error: cannot read %s\n", opts.positional[0]);
        return EXIT_USAGE;
    }

    Json::Value root;
    BatchRequest request;
    CompareError error;
    if (!parse_json_text(text, root, error) || !batch_request_from_json(root, request, error)) {
        fprintf(stderr, "Error: %s\n", to_string(error).c_str());
        return EXIT_USAGE;
    }

    CurlDocumentSource source(config.http);
    SessionStore sessions(config.session_ttl_seconds);
    SessionSweeper sweeper(sessions, config.sweep_interval_seconds);
    BatchOrchestrator orchestrator(source, sessions, config.batch);

    BatchResult batch;
    if (request.url_form) {
        if (!sweeper.start()) log_warn("session sweeper not running");
        batch = orchestrator.run_urls(request.url_requests);
        sweeper.stop();
    } else {
        batch = orchestrator.run_inline(request.inline_requests);
    }

    if (!write_output(opts.output, write_json(batch_result_to_json(batch)))) {
        fprintf(stderr, "Error: failed to write output\n");
        return EXIT_USAGE;
    }
    bool all_matched = batch.failed == 0;
    for (const ComparisonResult& result : batch.results) {
        if (!result.matched) all_matched = false;
    }
    return all_matched ? EXIT_MATCHED : EXIT_DIFFERENT;
}

int main(int argc, char* argv[]) {
    // Initialize logging system with config file if available
    if (access("log.conf", F_OK) == 0) {
        if (log_parse_config_file("log.conf") != LOG_OK) {
            fprintf(stderr, "Warning: Failed to parse log.conf, using defaults\n");
        }
    }
    log_init("");

    log_debug("main() started with %d arguments", argc);

    if (argc < 2) {
        print_help();
        log_fini();
        return EXIT_USAGE;
    }
    if (strcmp(argv[1], "--help") == 0 || strcmp(argv[1], "-h") == 0) {
        print_help();
        log_fini();
        return EXIT_MATCHED;
    }

    AppConfig config;
    CliOptions opts;
    if (!parse_options(argc, argv, 2, opts, config)) {
        log_fini();
        return EXIT_USAGE;
    }
    config.http.session_ttl_seconds = config.session_ttl_seconds;

    int exit_code;
    if (strcmp(argv[1], "compare") == 0) {
        exit_code = run_compare(opts);
    } else if (strcmp(argv[1], "url") == 0) {
        exit_code = run_url(opts, config);
    } else if (strcmp(argv[1], "batch") == 0) {
        exit_code = run_batch(opts, config);
    } else {
        fprintf(stderr, "Error: unknown command '%s'\n\n", argv[1]);
        print_help();
        exit_code = EXIT_USAGE;
    }

    log_debug("exiting with status %d", exit_code);
    log_fini();
    return exit_code;
}
