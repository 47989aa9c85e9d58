#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <string>

namespace waterly {
class Store;
}

namespace api_v1 {

enum : unsigned int {
    HTTP_OK                 = 200,
    HTTP_NO_CONTENT         = 204,
    HTTP_BAD_REQUEST        = 400,
    HTTP_NOT_FOUND          = 404,
    HTTP_METHOD_NOT_ALLOWED = 405,
    HTTP_INTERNAL_ERROR     = 500,
};

// Value of a query parameter, or nullptr if the request has none.
using QueryLookup = std::function<const char *(const char *name)>;

struct Reply {
    unsigned int status = HTTP_OK;
    std::string  body;
};

// Runs body() and serialises its result. Exceptions become error replies
// {"error": ..., "message": ...}: NotFoundError 404, ValidationError 400,
// everything else 500.
Reply guarded(const char *url, const std::function<nlohmann::json()> &body);

// Answers one request of the read-only API. Transport-independent: the
// HTTP server supplies the query lookup and writes the reply.
Reply handle(const waterly::Store &store,
             const char *url,
             const char *method,
             const QueryLookup &query);

}
