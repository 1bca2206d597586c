#include <mcp_probe/rpc/rpc_client.hpp>

#include <mcp_probe/core/log.hpp>

#include <string>

namespace mcp_probe {

namespace {

constexpr const char* kComponent = "rpc";

Error ProtocolError(const std::string& message, std::string_view line) {
    auto e = Error::Make(ErrorCategory::Protocol, "RpcClient::RecvResponse",
                         message);
    e.raw_response = std::string(line);
    return e;
}

bool IsBlank(std::string_view line) {
    return line.find_first_not_of(" \t\r") == std::string_view::npos;
}

} // anonymous namespace

nlohmann::json MakeRequest(std::string_view method,
                           const std::optional<nlohmann::json>& params,
                           const nlohmann::json& id) {
    nlohmann::json envelope = {
        {"jsonrpc", kJsonRpcVersion},
    };
    if (!id.is_null()) {
        envelope["id"] = id;
    }
    envelope["method"] = std::string(method);
    if (params.has_value()) {
        envelope["params"] = *params;
    }
    return envelope;
}

Result<JsonRpcResponse, Error> ParseResponseLine(std::string_view line) {
    using R = Result<JsonRpcResponse, Error>;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(line.begin(), line.end());
    } catch (const nlohmann::json::parse_error& e) {
        return R::Err(ProtocolError(
            std::string("response is not valid JSON: ") + e.what(), line));
    }

    if (!j.is_object()) {
        return R::Err(ProtocolError("response is not a JSON object", line));
    }
    if (!j.contains("jsonrpc")) {
        return R::Err(ProtocolError("response lacks 'jsonrpc'", line));
    }
    if (!j.contains("id")) {
        return R::Err(ProtocolError("response lacks 'id'", line));
    }

    const bool has_result = j.contains("result");
    const bool has_error = j.contains("error");
    if (!has_result && !has_error) {
        return R::Err(ProtocolError("response has neither 'result' nor 'error'", line));
    }
    if (has_result && has_error) {
        return R::Err(ProtocolError("response has both 'result' and 'error'", line));
    }

    JsonRpcResponse response;
    response.id = j["id"];
    if (has_result) {
        response.result = j["result"];
    } else {
        response.error = j["error"];
    }
    response.raw = std::string(line);
    return R::Ok(std::move(response));
}

RpcClient::RpcClient(ILineChannel& channel, RpcClientOptions options)
    : channel_(channel), options_(options) {}

Result<nlohmann::json, Error> RpcClient::SendRequest(
    std::string_view method,
    const std::optional<nlohmann::json>& params,
    const nlohmann::json& id) {
    return Write(MakeRequest(method, params, id));
}

Result<nlohmann::json, Error> RpcClient::SendNotification(
    std::string_view method,
    const std::optional<nlohmann::json>& params) {
    return Write(MakeRequest(method, params, nullptr));
}

Result<nlohmann::json, Error> RpcClient::Write(nlohmann::json envelope) {
    const auto line = envelope.dump(-1, ' ', false,
                                    nlohmann::json::error_handler_t::replace);
    if (GlobalLogger().Enabled(LogLevel::Debug)) {
        LogDebug(kComponent, "-> " + line);
    }

    auto sent = channel_.SendLine(line);
    if (sent.IsErr()) {
        auto error = std::move(sent).Error();
        error.method = envelope.value("method", "");
        return Result<nlohmann::json, Error>::Err(std::move(error));
    }
    return Result<nlohmann::json, Error>::Ok(std::move(envelope));
}

Result<JsonRpcResponse, Error> RpcClient::RecvResponse() {
    while (true) {
        auto line = channel_.ReadLine(options_.response_timeout);
        if (line.IsErr()) {
            return Result<JsonRpcResponse, Error>::Err(std::move(line).Error());
        }
        if (IsBlank(line.Value())) {
            continue;
        }
        if (GlobalLogger().Enabled(LogLevel::Debug)) {
            LogDebug(kComponent, "<- " + line.Value());
        }
        return ParseResponseLine(line.Value());
    }
}

} // namespace mcp_probe
