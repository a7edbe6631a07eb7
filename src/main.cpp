#include <iostream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>

#include "audit/audit_log.hpp"
#include "config/redactor_config.hpp"
#include "redaction/parallel_batch_redactor.hpp"
#include "redaction/pattern_rule.hpp"
#include "redaction/redaction_cache.hpp"
#include "redaction/redaction_observer.hpp"
#include "redaction/redactor.hpp"
#include "redaction/stream_redactor.hpp"
#include "service/redaction_service.hpp"
#include "service/response.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

namespace {

struct CliOptions
{
    std::string configPath = "phiscrub.conf";
    bool jsonMode = false;
    bool statsMode = false;
    bool listPatterns = false;
    bool streamMode = false;
};

void printUsage(std::ostream &out)
{
    out << "usage: phiscrub [--config <file>] [--json | --stats | --stream] [--list-patterns]\n"
           "  (default)        read lines from stdin, write redacted lines to stdout\n"
           "  --stats          write one redaction-result JSON object per input line\n"
           "  --json           read one JSON service request per line\n"
           "  --stream         redact all of stdin in chunks, writing each as it is done\n"
           "  --list-patterns  print the active rule names and exit\n";
}

CliOptions parseArgs(int argc, char **argv)
{
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                throw std::runtime_error("--config needs a file argument");
            }
            opts.configPath = argv[++i];
        } else if (arg == "--json") {
            opts.jsonMode = true;
        } else if (arg == "--stats") {
            opts.statsMode = true;
        } else if (arg == "--stream") {
            opts.streamMode = true;
        } else if (arg == "--list-patterns") {
            opts.listPatterns = true;
        } else {
            throw std::runtime_error("unknown argument: " + arg);
        }
    }
    if (int(opts.jsonMode) + int(opts.statsMode) + int(opts.streamMode) > 1) {
        throw std::runtime_error("--json, --stats and --stream are mutually exclusive");
    }
    return opts;
}

} // namespace

int main(int argc, char **argv) {
    using namespace phiscrub;

    // stdout carries redacted text only
    util::logger::setConsoleStream(std::cerr);
    util::logger::Logger &log = util::logger::Logger::getInstance();

    CliOptions opts;
    config::RedactorConfig cfg;
    try {
        opts = parseArgs(argc, argv);
        util::ConfigParser parser(cfg);
        parser.loadFromFile(opts.configPath);
        util::logger::setLogLevel(util::logger::parseLogLevel(cfg.logLevel));
    } catch (const std::exception &ex) {
        std::cerr << "phiscrub: " << ex.what() << "\n";
        printUsage(std::cerr);
        return 2;
    }

    if (!cfg.logFile.empty() && !util::logger::enableFileOutput(cfg.logFile, true)) {
        log.warn("[main] Continuing without log file " + cfg.logFile);
    }

    // 1. Diagnostics: logger always, audit trail when configured
    auto observers = std::make_shared<redaction::CompositeObserver>();
    observers->add(std::make_shared<redaction::LoggingObserver>());

    std::shared_ptr<audit::AuditLog> auditLog;
    if (!cfg.auditDatabase.empty()) {
        auditLog = std::make_shared<audit::AuditLog>(cfg.auditDatabase);
        if (auditLog->Open()) {
            observers->add(std::make_shared<audit::AuditObserver>(auditLog));
        } else {
            log.error("[main] Audit trail unavailable: " + cfg.auditDatabase);
        }
    }

    // 2. Build the engine once
    redaction::Redactor redactor(cfg.extendedRules ? redaction::extendedRules()
                                                   : redaction::builtinRules(),
                                 observers);
    if (redactor.isDegraded()) {
        log.critical("[main] Redactor is degraded; refusing to pass text through unredacted.");
        return 3;
    }

    if (opts.listPatterns) {
        for (const auto &name : redactor.getPatternNames()) {
            std::cout << name << "\n";
        }
        return 0;
    }

    redaction::CachingRedactor cached(redactor, cfg.cacheSize);
    redaction::ParallelBatchRedactor batch(redactor, cfg.batchThreads);

    service::RedactionService svc(redactor);
    svc.RegisterCache(&cached);
    svc.RegisterBatchRedactor(&batch);

    // 3. Process stdin
    if (opts.streamMode) {
        std::string all((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
        redaction::StreamRedactor stream(redactor, cfg.streamChunkSize);
        std::size_t chunks = stream.redactStreaming(all, [](const redaction::StreamChunk &c) {
            std::cout << c.chunk;
            std::cout.flush();
        });
        log.info("[main] Streamed " + std::to_string(all.size()) + " bytes in " +
                 std::to_string(chunks) + " chunks");
        return 0;
    }

    std::string line;
    std::size_t lines = 0;
    while (std::getline(std::cin, line)) {
        ++lines;
        if (opts.jsonMode) {
            std::cout << svc.HandleLine(line) << "\n";
        } else if (opts.statsMode) {
            std::cout << service::resultToJson(redactor.redactWithStats(line)) << "\n";
        } else {
            std::cout << cached.redact(line) << "\n";
        }
    }
    std::cout.flush();

    log.info("[main] Processed " + std::to_string(lines) + " lines (cache hits: " +
             std::to_string(cached.cache().hits()) + ")");
    return 0;
}
