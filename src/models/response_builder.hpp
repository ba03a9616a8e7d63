#pragma once

#include <boost/beast/version.hpp>
#include <boost/json.hpp>
#include <string>
#include <vector>

#include "Response.hpp"

namespace vireo::models {
namespace json = boost::json;

using core::Response;

/**
 * @brief Canned responses the engine sends on its own behalf (routing failures,
 * timeouts, handler crashes). Bodies are JSON: {"status": "error", "message": ...}.
 */
class ResponseBuilder {
   private:
    static void set_standard_headers(Response& res) {
        res.add_header("Server", BOOST_BEAST_VERSION_STRING);
        res.add_header("Content-Type", "application/json");
    }

   public:
    static Response make_json_response(unsigned int status, const json::value& val) {
        Response res(json::serialize(val), status);
        set_standard_headers(res);
        return res;
    }

    static Response build_error_response(const std::string& error_message,
                                         unsigned int status = 400) {  // NOLINT
        json::object body_json;
        body_json["status"] = "error";
        body_json["message"] = error_message;
        return make_json_response(status, body_json);
    }

    static Response not_found() {
        return build_error_response("Route not found", 404);  // NOLINT
    }

    static Response method_not_allowed(const std::vector<std::string>& allowed) {
        std::string allow;
        for (const auto& method : allowed) {
            if (!allow.empty()) {
                allow += ", ";
            }
            allow += method;
        }

        Response res = build_error_response("Method not allowed", 405);  // NOLINT
        res.add_header("Allow", allow);
        return res;
    }

    // The handler ran past its route timeout and was cancelled.
    static Response service_unavailable() {
        return build_error_response("Request timed out", 503);  // NOLINT
    }

    static Response internal_error() {
        return build_error_response("Internal server error", 500);  // NOLINT
    }
};

}  // namespace vireo::models
