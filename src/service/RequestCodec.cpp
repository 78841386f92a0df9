#include "RequestCodec.h"

#include "CommonUtils.h"
#include "GranuloExceptions.h"

#include <cmath>
#include <cstdlib>
#include <optional>
#include <set>

namespace {
std::optional<double> parsePercentValue(const JsonValue& value, const std::string& sample, size_t index) {
    const std::string where = "sieve_data['" + sample + "'][" + std::to_string(index) + "]";
    switch (value.type) {
        case JsonValue::Type::Null:
            return std::nullopt;
        case JsonValue::Type::Number:
            return value.numberValue;
        case JsonValue::Type::String: {
            const std::string text = CommonUtils::trim(value.stringValue);
            if (text.empty()) return std::nullopt;
            char* end = nullptr;
            const double parsed = std::strtod(text.c_str(), &end);
            if (end == text.c_str() || *end != '\0') {
                throw Granulo::ValidationException(where + " is not a number: '" + value.stringValue + "'");
            }
            return parsed;
        }
        default:
            throw Granulo::ValidationException(where + " must be a number, a numeric string or null");
    }
}

std::string uniqueName(const std::string& wanted, std::set<std::string>& taken) {
    if (taken.insert(wanted).second) return wanted;
    for (size_t k = 2;; ++k) {
        std::string candidate = wanted + " (" + std::to_string(k) + ")";
        if (taken.insert(candidate).second) return candidate;
    }
}

bool parseUseColor(const JsonValue* node) {
    if (node == nullptr || node->isNull()) return true;
    if (node->isBool()) return node->booleanValue;
    if (node->isString()) {
        const std::string v = CommonUtils::toLower(CommonUtils::trim(node->stringValue));
        if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
        if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    }
    throw Granulo::ValidationException("use_color must be a boolean");
}

JsonValue roundedOrNull(const std::optional<double>& value) {
    if (!value || !std::isfinite(*value)) return JsonValue::null();
    return JsonValue::number(CommonUtils::roundTo(*value, RequestCodec::kReportedDigits));
}

JsonValue issuesToJson(const std::vector<SampleIssue>& issues) {
    JsonValue out = JsonValue::array();
    for (const auto& issue : issues) {
        JsonValue item = JsonValue::object();
        item.set("sample", JsonValue::string(issue.sample));
        item.set("reason", JsonValue::string(issue.reason));
        out.push(std::move(item));
    }
    return out;
}
} // namespace

namespace RequestCodec {

AnalysisRequest parseAnalysisRequest(const std::string& body) {
    return parseAnalysisRequest(parseJsonText(body));
}

AnalysisRequest parseAnalysisRequest(const JsonValue& root) {
    if (!root.isObject()) {
        throw Granulo::ValidationException("request body must be a JSON object");
    }

    const JsonValue* data = root.find("sieve_data");
    if (data == nullptr || !data->isObject()) {
        throw Granulo::ValidationException("request requires a 'sieve_data' object of named sample arrays");
    }

    AnalysisRequest request;
    if (const JsonValue* method = root.find("interpolation_method"); method != nullptr && !method->isNull()) {
        if (!method->isString()) {
            throw Granulo::ValidationException("interpolation_method must be a string");
        }
        request.method = parseInterpolationMethod(method->stringValue);
    }
    request.useColor = parseUseColor(root.find("use_color"));

    std::set<std::string> taken;
    request.samples.reserve(data->objectValue.size());
    for (size_t i = 0; i < data->objectValue.size(); ++i) {
        const auto& [rawName, values] = data->objectValue[i];
        std::string name = CommonUtils::trim(rawName);
        if (name.empty()) name = "Sample " + std::to_string(i + 1);

        SampleInput sample;
        sample.name = uniqueName(name, taken);
        if (!values.isArray()) {
            throw Granulo::ValidationException("sieve_data['" + sample.name + "'] must be an array");
        }
        sample.values.reserve(values.arrayValue.size());
        for (size_t j = 0; j < values.arrayValue.size(); ++j) {
            sample.values.push_back(parsePercentValue(values.arrayValue[j], sample.name, j));
        }
        request.samples.push_back(std::move(sample));
    }
    return request;
}

JsonValue responseToJson(const AnalysisResponse& response) {
    JsonValue out = JsonValue::object();
    out.set("success", JsonValue::boolean(response.success));
    if (!response.success) {
        out.set("error", JsonValue::string(response.error));
        if (!response.issues.empty()) {
            out.set("warnings", issuesToJson(response.issues));
        }
        return out;
    }

    if (response.plot) {
        out.set("plot", JsonValue::string(response.plot->base64));
        out.set("plot_mime", JsonValue::string(response.plot->mimeType));
        out.set("plot_width", JsonValue::number(response.plot->width));
        out.set("plot_height", JsonValue::number(response.plot->height));
    } else {
        out.set("plot", JsonValue::null());
        out.set("plot_error", JsonValue::string(response.plotError));
    }
    out.set("interpolation_method", JsonValue::string(response.method));

    JsonValue coefficients = JsonValue::object();
    JsonValue samples = JsonValue::array();
    for (const auto& report : response.samples) {
        JsonValue item = JsonValue::object();
        item.set("name", JsonValue::string(report.name));
        item.set("analyzed", JsonValue::boolean(report.analyzed));
        if (report.analyzed) {
            item.set("known_points", JsonValue::number(static_cast<double>(report.knownPoints)));
            item.set("color", JsonValue::string(report.color));
        } else {
            item.set("error", JsonValue::string(report.failureReason));
        }
        samples.push(std::move(item));

        if (!report.parameters) continue;
        const GradationParameters& p = *report.parameters;
        JsonValue entry = JsonValue::object();
        entry.set("D10", roundedOrNull(p.d10));
        entry.set("D30", roundedOrNull(p.d30));
        entry.set("D60", roundedOrNull(p.d60));
        entry.set("Cu", roundedOrNull(p.cu));
        entry.set("Cc", roundedOrNull(p.cc));
        entry.set("classification", JsonValue::string(p.classificationLabel()));
        coefficients.set(report.name, std::move(entry));
    }
    out.set("coefficients", std::move(coefficients));
    out.set("samples", std::move(samples));
    out.set("warnings", issuesToJson(response.issues));
    return out;
}

std::string serializeResponse(const AnalysisResponse& response) {
    return responseToJson(response).dump();
}

std::string serializeError(const std::string& error) {
    JsonValue out = JsonValue::object();
    out.set("success", JsonValue::boolean(false));
    out.set("error", JsonValue::string(error));
    return out.dump();
}

JsonValue scaleToJson(const SieveScale& scale) {
    JsonValue sizes = JsonValue::array();
    for (double s : scale.sizes()) sizes.push(JsonValue::number(s));
    JsonValue out = JsonValue::object();
    out.set("unit", JsonValue::string("mm"));
    out.set("sieve_sizes", std::move(sizes));
    return out;
}

int httpStatusFor(AnalysisStatus status) {
    switch (status) {
        case AnalysisStatus::Ok: return 200;
        case AnalysisStatus::InvalidRequest: return 400;
        case AnalysisStatus::NoAnalyzableSamples: return 422;
        case AnalysisStatus::InternalError: return 500;
    }
    return 500;
}

} // namespace RequestCodec
