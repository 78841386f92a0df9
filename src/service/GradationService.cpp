#include "GradationService.h"

#include "GranuloExceptions.h"
#include "JsonValue.h"
#include "RequestCodec.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <sstream>

#include <httplib.h>

namespace {
using Clock = std::chrono::steady_clock;

long long toLatencyMicros(double latencyMs) {
    if (!std::isfinite(latencyMs) || latencyMs <= 0.0) return 0;
    return static_cast<long long>(std::llround(latencyMs * 1000.0));
}

double elapsedMs(Clock::time_point started) {
    return std::chrono::duration<double, std::milli>(Clock::now() - started).count();
}

void logMonitoringLine(const std::string& endpoint, int status, double latencyMs, const MonitoringSnapshot& snapshot) {
    std::ostringstream line;
    line << "[GranuloService][Monitor] endpoint=" << endpoint
         << " status=" << status
         << " total_requests=" << snapshot.totalRequests
         << " errors=" << snapshot.errorRequests
         << " latency_ms=" << latencyMs
         << " avg_latency_ms=" << snapshot.averageLatencyMs
         << " samples_analyzed=" << snapshot.samplesAnalyzed
         << " samples_rejected=" << snapshot.samplesRejected;
    std::cout << line.str() << "\n";
}

void setJsonResponse(httplib::Response& response, int status, const std::string& payload) {
    response.status = status;
    response.set_content(payload, "application/json");
}
} // namespace

void RequestMonitor::recordCommon(const std::string& endpoint, double latencyMs, const AnalysisResponse* response) {
    totalRequests.fetch_add(1, std::memory_order_relaxed);
    if (endpoint == "/analyze") {
        analyzeRequests.fetch_add(1, std::memory_order_relaxed);
    }
    totalLatencyMicros.fetch_add(static_cast<uint64_t>(std::max<long long>(0, toLatencyMicros(latencyMs))),
                                 std::memory_order_relaxed);
    if (response != nullptr) {
        const uint64_t analyzed = response->analyzedCount();
        samplesAnalyzed.fetch_add(analyzed, std::memory_order_relaxed);
        samplesRejected.fetch_add(static_cast<uint64_t>(response->samples.size()) - analyzed,
                                  std::memory_order_relaxed);
    }
}

void RequestMonitor::recordSuccess(const std::string& endpoint, double latencyMs, const AnalysisResponse& response) {
    recordCommon(endpoint, latencyMs, &response);
}

void RequestMonitor::recordError(const std::string& endpoint, double latencyMs, const AnalysisResponse* response) {
    errorRequests.fetch_add(1, std::memory_order_relaxed);
    recordCommon(endpoint, latencyMs, response);
}

MonitoringSnapshot RequestMonitor::snapshot() const {
    MonitoringSnapshot out;
    out.totalRequests = totalRequests.load(std::memory_order_relaxed);
    out.analyzeRequests = analyzeRequests.load(std::memory_order_relaxed);
    out.errorRequests = errorRequests.load(std::memory_order_relaxed);
    out.samplesAnalyzed = samplesAnalyzed.load(std::memory_order_relaxed);
    out.samplesRejected = samplesRejected.load(std::memory_order_relaxed);

    const uint64_t latencyMicros = totalLatencyMicros.load(std::memory_order_relaxed);
    if (out.totalRequests > 0) {
        out.averageLatencyMs = static_cast<double>(latencyMicros) / static_cast<double>(out.totalRequests) / 1000.0;
    }
    return out;
}

GradationService::GradationService(AnalysisService& analysisRef, RequestMonitor& monitorRef)
    : analysis(analysisRef), monitor(monitorRef) {}

int GradationService::handleAnalyze(const std::string& requestBody, std::string& responseBody) {
    const auto started = Clock::now();
    int status = 500;
    try {
        const AnalysisRequest request = RequestCodec::parseAnalysisRequest(requestBody);
        const AnalysisResponse result = analysis.analyze(request);
        status = RequestCodec::httpStatusFor(result.status);
        responseBody = RequestCodec::serializeResponse(result);

        const double latencyMs = elapsedMs(started);
        if (result.success) {
            monitor.recordSuccess("/analyze", latencyMs, result);
        } else {
            monitor.recordError("/analyze", latencyMs, &result);
        }
        logMonitoringLine("/analyze", status, latencyMs, monitor.snapshot());
    } catch (const Granulo::ValidationException& e) {
        status = 400;
        responseBody = RequestCodec::serializeError(e.what());
        const double latencyMs = elapsedMs(started);
        monitor.recordError("/analyze", latencyMs);
        logMonitoringLine("/analyze", status, latencyMs, monitor.snapshot());
    } catch (const std::exception& e) {
        status = 500;
        responseBody = RequestCodec::serializeError(e.what());
        const double latencyMs = elapsedMs(started);
        monitor.recordError("/analyze", latencyMs);
        std::cerr << "[GranuloService] unexpected_error endpoint=/analyze what='" << e.what() << "'\n";
        logMonitoringLine("/analyze", status, latencyMs, monitor.snapshot());
    }
    return status;
}

std::string GradationService::healthDocument() const {
    const MonitoringSnapshot snapshot = monitor.snapshot();
    JsonValue counters = JsonValue::object();
    counters.set("total_requests", JsonValue::number(static_cast<double>(snapshot.totalRequests)));
    counters.set("analyze_requests", JsonValue::number(static_cast<double>(snapshot.analyzeRequests)));
    counters.set("errors", JsonValue::number(static_cast<double>(snapshot.errorRequests)));
    counters.set("samples_analyzed", JsonValue::number(static_cast<double>(snapshot.samplesAnalyzed)));
    counters.set("samples_rejected", JsonValue::number(static_cast<double>(snapshot.samplesRejected)));
    counters.set("avg_latency_ms", JsonValue::number(snapshot.averageLatencyMs));

    JsonValue out = JsonValue::object();
    out.set("status", JsonValue::string("ok"));
    out.set("monitoring", std::move(counters));
    return out.dump();
}

int GradationService::start(const ServiceConfig& config) {
    httplib::Server server;
    server.new_task_queue = [threadCount = std::max<size_t>(1, config.threads)] {
        return new httplib::ThreadPool(static_cast<int>(threadCount));
    };

    server.Post("/analyze", [this](const httplib::Request& request, httplib::Response& response) {
        std::string body;
        const int status = handleAnalyze(request.body, body);
        setJsonResponse(response, status, body);
    });

    server.Get("/sieve_sizes", [this](const httplib::Request&, httplib::Response& response) {
        setJsonResponse(response, 200, RequestCodec::scaleToJson(analysis.scale()).dump());
    });

    server.Get("/health", [this](const httplib::Request&, httplib::Response& response) {
        setJsonResponse(response, 200, healthDocument());
    });

    std::cout << "[GranuloService] host=" << config.host
              << " port=" << config.port
              << " threads=" << std::max<size_t>(1, config.threads)
              << " sieves=" << analysis.scale().size()
              << "\n";

    if (!server.listen(config.host.c_str(), config.port)) {
        std::cerr << "[GranuloService] failed_to_bind host=" << config.host << " port=" << config.port << "\n";
        return 1;
    }

    return 0;
}
