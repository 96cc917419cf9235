#include "../../execution/execution_supervisor.hpp"
#include "../../logging/logger.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace coderun {
namespace http {

//=============================================================================
// POST /v0/execute
//=============================================================================
void HttpServer::handle_post_execute(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json request_json = nlohmann::json::parse(req.body, nullptr, false);
    if (request_json.is_discarded()) {
        send_json(res, StatusCode::INVALID_ARGUMENT,
                  make_error_response(StatusCode::INVALID_ARGUMENT, "Invalid JSON body"));
        return;
    }

    execution::ExecutionRequest request;
    std::string error;
    if (!decode_execute_request(request_json, default_timeout_seconds_, request, error)) {
        send_json(res, StatusCode::INVALID_ARGUMENT, make_error_response(StatusCode::INVALID_ARGUMENT, error));
        return;
    }

    // Every outcome, including failures, is a well-formed result
    auto result = supervisor_.execute(request);
    send_json(res, StatusCode::OK, encode_result(result));
}

}  // namespace http
}  // namespace coderun
