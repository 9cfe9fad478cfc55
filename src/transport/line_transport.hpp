#pragma once

#include <chrono>
#include <optional>
#include <string>
#include "core/errors/client_errors.hpp"

namespace mcplink::transport {

// Line-oriented duplex byte stream. read_line() yields std::nullopt once the
// peer has closed its side. write_line() gives up with a Timeout error when
// the peer does not accept the line within `timeout`.
class LineTransport {
public:
    virtual ~LineTransport() = default;

    virtual core::errors::VoidResult write_line(const std::string& line,
                                                std::chrono::milliseconds timeout) = 0;
    virtual core::errors::Result<std::optional<std::string>> read_line() = 0;

    // Releases the peer and unblocks a pending read_line(). Idempotent.
    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

}  // namespace mcplink::transport
