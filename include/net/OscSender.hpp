#pragma once

#include <string>
#include <lo/lo.h>
#include "core/Types.hpp"
#include "core/Logger.hpp"
#include "net/MetricSink.hpp"

namespace net {

/**
 * Sends each hand's metric vector as one OSC message over UDP (liblo).
 * Address: /hand/left or /hand/right, arguments: 7 floats in metric order.
 *
 * Sending happens on the caller's thread; the frame loop is single threaded.
 */
class OscSender : public MetricSink {
public:
    OscSender(const std::string& host, const std::string& port);
    ~OscSender() override;

    // Non-copyable
    OscSender(const OscSender&) = delete;
    OscSender& operator=(const OscSender&) = delete;

    /**
     * Create the liblo address.
     * @return false if the address could not be created
     */
    bool start();
    void stop();

    [[nodiscard]] bool isRunning() const { return _loAddress != nullptr; }

    bool send(core::Hand hand, const core::MetricVector& values) override;

private:
    std::string _host;
    std::string _port;

    lo_address _loAddress = nullptr;
};

} // namespace net
