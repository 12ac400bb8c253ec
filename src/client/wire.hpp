#pragma once

#include <ghcache/http.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace ghcache::wire {

inline constexpr char kJsonContentType[] = "application/json";

// A decoded JSON object together with the status of the response it came
// from, so field errors report the same status as parse errors.
struct Document {
    nlohmann::json object;
    int status = 0;
};

// Parses a success body as a JSON object; `what` names the response in errors.
Result<Document> parse_object(const HttpResponse& response, const char* what);

Result<std::string> string_field(const Document& doc, const char* field,
                                 const char* what);

Result<std::int64_t> integer_field(const Document& doc, const char* field,
                                   const char* what);

// Sets body and Content-Type for a JSON request.
void set_json_body(HttpRequest& request, const nlohmann::json& body);

} // namespace ghcache::wire
