#include "wire.hpp"

namespace ghcache::wire {

static CacheError decode_error(int status, std::string msg) {
    return CacheError{TransportError{TransportError::Decode, status, std::move(msg)}};
}

Result<Document> parse_object(const HttpResponse& response, const char* what) {
    Document doc;
    doc.status = response.status;
    doc.object = nlohmann::json::parse(response.body, nullptr, false);
    if (doc.object.is_discarded()) {
        return decode_error(doc.status, std::string(what) + ": body is not valid JSON");
    }
    if (!doc.object.is_object()) {
        return decode_error(doc.status, std::string(what) + ": expected a JSON object");
    }
    return Result<Document>::ok(std::move(doc));
}

Result<std::string> string_field(const Document& doc, const char* field,
                                 const char* what) {
    auto it = doc.object.find(field);
    if (it == doc.object.end() || !it->is_string()) {
        return decode_error(doc.status,
            std::string(what) + ": missing string field '" + field + "'");
    }
    return Result<std::string>::ok(it->get<std::string>());
}

Result<std::int64_t> integer_field(const Document& doc, const char* field,
                                   const char* what) {
    auto it = doc.object.find(field);
    if (it == doc.object.end() || !it->is_number_integer()) {
        return decode_error(doc.status,
            std::string(what) + ": missing integer field '" + field + "'");
    }
    return Result<std::int64_t>::ok(it->get<std::int64_t>());
}

void set_json_body(HttpRequest& request, const nlohmann::json& body) {
    request.body = body.dump();
    set_header(request.headers, "Content-Type", kJsonContentType);
}

} // namespace ghcache::wire
