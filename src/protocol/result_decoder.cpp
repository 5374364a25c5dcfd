// ============================================================================
// offload/protocol/result_decoder.cpp - Result File Wire Format
// ============================================================================

#include "offload/protocol/result_decoder.hpp"

namespace offload {

using nlohmann::json;

Result<json, DecodeError> DecodeResult(std::string_view bytes) {
    if (bytes.find_first_not_of(" \t\r\n") == std::string_view::npos) {
        return Err(DecodeError{Errc::ResultIncomplete, "result file is empty"});
    }

    json doc;
    try {
        doc = json::parse(bytes.begin(), bytes.end());
    } catch (const json::parse_error& e) {
        // The writer may not have finished; the caller decides when to give up
        if (e.byte >= bytes.size()) {
            return Err(DecodeError{Errc::ResultIncomplete, "result file is truncated"});
        }
        return Err(DecodeError{Errc::ResultIncomplete, std::string("result is not valid JSON yet: ") + e.what()});
    } catch (const json::exception& e) {
        // Syntactically complete but unrepresentable, e.g. a number out of range
        return Err(DecodeError{Errc::MalformedResult, std::string("result cannot be decoded: ") + e.what()});
    }

    if (!doc.is_object()) {
        return Err(DecodeError{Errc::MalformedResult, "result is not a JSON object"});
    }

    auto status = doc.find("status");
    if (status == doc.end() || !status->is_string()) {
        return Err(DecodeError{Errc::MalformedResult, "result has no status"});
    }

    const auto tag = status->get<std::string>();
    if (tag == "ok") {
        doc.erase("status");
        return Ok(std::move(doc));
    }
    if (tag == "error") {
        auto error = doc.find("error");
        std::string reason;
        if (error == doc.end()) {
            reason = "worker reported an error without a reason";
        } else if (error->is_string()) {
            reason = error->get<std::string>();
        } else {
            reason = error->dump();
        }
        return Err(DecodeError{Errc::WorkerReportedError, std::move(reason)});
    }

    return Err(DecodeError{Errc::MalformedResult, "unknown result status '" + tag + "'"});
}

std::string EncodeSuccess(const json& value) {
    json doc;
    if (value.is_object()) {
        doc = value;
    } else if (value.is_null()) {
        doc = json::object();
    } else {
        doc = json::object({{"result", value}});
    }
    doc["status"] = "ok";
    return doc.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string EncodeError(std::string_view reason) {
    json doc = json::object();
    doc["status"] = "error";
    doc["error"] = std::string(reason);
    return doc.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace offload
