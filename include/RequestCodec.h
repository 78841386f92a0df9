#pragma once

#include "AnalysisService.h"
#include "JsonValue.h"

#include <string>

namespace RequestCodec {

constexpr int kReportedDigits = 3;

/**
 * @brief Decodes {"sieve_data": {name: [values]}, "interpolation_method": ..., "use_color": ...}.
 * Values may be numbers, null, numeric strings or empty strings (absent).
 * Empty names become "Sample N" (1-based input position); repeated names get a " (k)" suffix.
 * @throws Granulo::ValidationException on malformed JSON or an unexpected shape.
 */
AnalysisRequest parseAnalysisRequest(const std::string& body);
AnalysisRequest parseAnalysisRequest(const JsonValue& root);

/**
 * @brief Wire form of an analysis result; numbers rounded to 3 decimals, undefined values as null.
 */
JsonValue responseToJson(const AnalysisResponse& response);
std::string serializeResponse(const AnalysisResponse& response);

std::string serializeError(const std::string& error);
JsonValue scaleToJson(const SieveScale& scale);

int httpStatusFor(AnalysisStatus status);

} // namespace RequestCodec
