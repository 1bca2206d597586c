#pragma once

#include <mcp_probe/core/result.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace mcp_probe {

// ---------------------------------------------------------------------------
// ILineChannel - newline-framed, bidirectional text channel to a peer.
//
// RpcClient depends on this interface rather than on ProcessHarness so the
// protocol layers can be tested offline via MockLineChannel.
//
// Methods return Result<T, Error> - never throw on expected failures.
//   SendLine: Io when the peer is gone.
//   ReadLine: EndOfStream when the peer closed before producing a line,
//             Timeout when `timeout` elapses first (nullopt waits forever).
// ---------------------------------------------------------------------------
class ILineChannel {
public:
    virtual ~ILineChannel() = default;

    ILineChannel(const ILineChannel&) = delete;
    ILineChannel& operator=(const ILineChannel&) = delete;
    ILineChannel(ILineChannel&&) = delete;
    ILineChannel& operator=(ILineChannel&&) = delete;

    [[nodiscard]] virtual Result<void, Error> SendLine(std::string_view text) = 0;

    [[nodiscard]] virtual Result<std::string, Error> ReadLine(
        std::optional<std::chrono::milliseconds> timeout) = 0;

protected:
    ILineChannel() = default;
};

} // namespace mcp_probe
