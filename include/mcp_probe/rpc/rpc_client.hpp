#pragma once

#include <mcp_probe/core/result.hpp>
#include <mcp_probe/process/i_line_channel.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace mcp_probe {

inline constexpr const char* kJsonRpcVersion = "2.0";

// ---------------------------------------------------------------------------
// JsonRpcResponse - a decoded reply envelope.
//
// Exactly one of `result` / `error` is set. `raw` keeps the line as received
// for diagnostics.
// ---------------------------------------------------------------------------
struct JsonRpcResponse {
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<nlohmann::json> error;
    std::string raw;

    [[nodiscard]] bool IsError() const { return error.has_value(); }
    [[nodiscard]] bool IdMatches(const nlohmann::json& request_id) const {
        return id == request_id;
    }
};

// Build a request envelope. `params` is omitted when nullopt; `id` is
// omitted when null (notification).
nlohmann::json MakeRequest(std::string_view method,
                           const std::optional<nlohmann::json>& params,
                           const nlohmann::json& id);

// Decode and validate one response line. Fails with ErrorCategory::Protocol
// when the line is not JSON, not an object, or lacks `jsonrpc`, `id`, or
// exactly one of `result` / `error`.
[[nodiscard]] Result<JsonRpcResponse, Error> ParseResponseLine(std::string_view line);

struct RpcClientOptions {
    // Bound on each RecvResponse wait; nullopt blocks until a line arrives.
    std::optional<std::chrono::milliseconds> response_timeout;
};

// ---------------------------------------------------------------------------
// RpcClient - newline-delimited JSON-RPC framing over an ILineChannel.
//
// One request, one line; one response, one line. No pipelining and no id
// correlation here: callers compare JsonRpcResponse::id themselves.
// ---------------------------------------------------------------------------
class RpcClient {
public:
    explicit RpcClient(ILineChannel& channel, RpcClientOptions options = {});

    // Serialize and send one request. Returns the envelope that was written.
    [[nodiscard]] Result<nlohmann::json, Error> SendRequest(
        std::string_view method,
        const std::optional<nlohmann::json>& params,
        const nlohmann::json& id);

    // Send a request without an id. No reply is expected.
    [[nodiscard]] Result<nlohmann::json, Error> SendNotification(
        std::string_view method,
        const std::optional<nlohmann::json>& params = std::nullopt);

    // Read the next non-blank line and decode it. EndOfStream, Timeout and Io
    // from the channel pass through unchanged.
    [[nodiscard]] Result<JsonRpcResponse, Error> RecvResponse();

private:
    Result<nlohmann::json, Error> Write(nlohmann::json envelope);

    ILineChannel& channel_;
    RpcClientOptions options_;
};

} // namespace mcp_probe
