#ifndef PHISCRUB_SERVICE_REDACTION_SERVICE_HPP
#define PHISCRUB_SERVICE_REDACTION_SERVICE_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include "api/redaction_api.hpp"
#include "redaction/parallel_batch_redactor.hpp"
#include "redaction/redaction_cache.hpp"
#include "redaction/redactor.hpp"
#include "service/request.hpp"
#include "service/response.hpp"
#include "util/logger.hpp"

namespace phiscrub {
namespace service {

/*
  RedactionService
  --------------------------------
  Routes decoded requests to a Redactor and renders the answers as JSON.

  Methods:
    redact           data: string          -> string
    redactWithStats  data: string          -> {redacted_text, processing_time_ms, patterns_applied}
    batchRedact      data: [string] or a
                     string holding a JSON
                     array                 -> [string]   (malformed array -> [])
    getPatternCount                        -> integer
    getPatternNames                        -> [string]
    redactText       data: string          -> string (fresh Redactor, no reuse)

  Unknown methods and undecodable lines answer 400; the service never throws.

  Optional collaborators:
    RegisterCache           single-text redact goes through the LRU cache
    RegisterBatchRedactor   batches fan out across the thread pool
  Both must outlive the service and be registered before requests arrive.
*/
class RedactionService
{
public:
    explicit RedactionService(const redaction::Redactor &redactor)
        : m_redactor(redactor), m_cache(nullptr), m_batch(nullptr)
    {
    }

    void RegisterCache(redaction::CachingRedactor *cache) { m_cache = cache; }

    void RegisterBatchRedactor(redaction::ParallelBatchRedactor *batch) { m_batch = batch; }

    Response HandleRequest(const Request &req)
    {
        if (req.method == "redact") {
            std::string out = m_cache ? m_cache->redact(req.data) : m_redactor.redact(req.data);
            return Response(200, "OK", jsonString(out));
        }
        if (req.method == "redactWithStats") {
            return Response(200, "OK", resultToJson(m_redactor.redactWithStats(req.data)));
        }
        if (req.method == "batchRedact") {
            std::vector<std::string> items = req.hasItems ? req.items : parseBatchEnvelope(req.data);
            std::vector<std::string> out = m_batch ? m_batch->batchRedact(items)
                                                   : m_redactor.batchRedact(items);
            return Response(200, "OK", jsonStringArray(out));
        }
        if (req.method == "getPatternCount") {
            return Response(200, "OK", std::to_string(m_redactor.getPatternCount()));
        }
        if (req.method == "getPatternNames") {
            return Response(200, "OK", jsonStringArray(m_redactor.getPatternNames()));
        }
        if (req.method == "redactText") {
            return Response(200, "OK", jsonString(api::redactText(req.data)));
        }
        return Response(400, "Unknown method: " + req.method);
    }

    // Decode one JSON request line and return the JSON response line.
    std::string HandleLine(const std::string &line)
    {
        try {
            return HandleRequest(parseRequest(line)).toJson();
        }
        catch (const std::runtime_error &ex) {
            util::logger::warn(std::string("[RedactionService] Bad request: ") + ex.what());
            return Response(400, ex.what()).toJson();
        }
    }

private:
    const redaction::Redactor &m_redactor;
    redaction::CachingRedactor *m_cache;
    redaction::ParallelBatchRedactor *m_batch;
};

} // namespace service
} // namespace phiscrub

#endif // PHISCRUB_SERVICE_REDACTION_SERVICE_HPP
