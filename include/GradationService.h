#pragma once

#include "AnalysisService.h"
#include "AppConfig.h"

#include <atomic>
#include <cstdint>
#include <string>

struct MonitoringSnapshot {
    uint64_t totalRequests = 0;
    uint64_t analyzeRequests = 0;
    uint64_t errorRequests = 0;
    uint64_t samplesAnalyzed = 0;
    uint64_t samplesRejected = 0;
    double averageLatencyMs = 0.0;
};

class RequestMonitor {
public:
    void recordSuccess(const std::string& endpoint, double latencyMs, const AnalysisResponse& response);
    void recordError(const std::string& endpoint, double latencyMs, const AnalysisResponse* response = nullptr);
    MonitoringSnapshot snapshot() const;

private:
    void recordCommon(const std::string& endpoint, double latencyMs, const AnalysisResponse* response);

    std::atomic<uint64_t> totalRequests{0};
    std::atomic<uint64_t> analyzeRequests{0};
    std::atomic<uint64_t> errorRequests{0};
    std::atomic<uint64_t> samplesAnalyzed{0};
    std::atomic<uint64_t> samplesRejected{0};
    std::atomic<uint64_t> totalLatencyMicros{0};
};

class GradationService {
public:
    GradationService(AnalysisService& analysis, RequestMonitor& monitor);

    /**
     * @brief Handles one POST /analyze body.
     * @post Returns the HTTP status and fills body with the JSON document; never throws.
     */
    int handleAnalyze(const std::string& requestBody, std::string& responseBody);

    std::string healthDocument() const;

    /**
     * @brief Serves /analyze, /sieve_sizes and /health until the listener stops.
     * @return 0 on clean shutdown, 1 if the socket could not be bound.
     */
    int start(const ServiceConfig& config);

private:
    AnalysisService& analysis;
    RequestMonitor& monitor;
};
