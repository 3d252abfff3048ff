#pragma once

#include "http_transport.hpp"

#include <string>

namespace batchdl {

class CurlTransport final : public HttpTransport {
public:
    explicit CurlTransport(std::string user_agent = "batchdl/1.0");

    [[nodiscard]] ProbeResult probe(const std::string& url,
                                    const Timeouts& timeouts,
                                    const StopSignal& stop) override;

    [[nodiscard]] TransportResult get(const std::string& url,
                                      std::uint64_t offset,
                                      const Timeouts& timeouts,
                                      const ResponseHandler& handler,
                                      const StopSignal& stop) override;

private:
    std::string user_agent_;
};

} // namespace batchdl
