#pragma once

#include <string>

namespace minimail::protocol {

// Outcome of feeding one line to a protocol state machine. Multi-line replies
// are joined with CRLF; the transport adds the final line break. An empty
// text means nothing is sent for this line.
struct Reply {
    std::string text;
    bool close = false;

    bool empty() const { return text.empty(); }
};

}  // namespace minimail::protocol
