#include "net/OscSender.hpp"

namespace net {

OscSender::OscSender(const std::string& host, const std::string& port)
    : _host(host), _port(port) {
}

OscSender::~OscSender() {
    stop();
}

bool OscSender::start() {
    if (_loAddress) return true;

    // Initialize liblo address
    _loAddress = lo_address_new(_host.c_str(), _port.c_str());
    if (!_loAddress) {
        core::Logger::error("OscSender: Failed to create LO address for ", _host, ":", _port);
        return false;
    }

    core::Logger::info("OscSender started. Target: ", _host, ":", _port);
    return true;
}

void OscSender::stop() {
    if (!_loAddress) return;
    lo_address_free(_loAddress);
    _loAddress = nullptr;
    core::Logger::info("OscSender stopped.");
}

bool OscSender::send(core::Hand hand, const core::MetricVector& values) {
    if (!_loAddress) return false;

    lo_message msg = lo_message_new();
    for (float v : values) {
        lo_message_add_float(msg, v);
    }

    int ret = lo_send_message(_loAddress, core::oscAddress(hand), msg);
    lo_message_free(msg);

    if (ret == -1) {
        core::Logger::debug("OscSender: ", lo_address_errstr(_loAddress));
        return false;
    }
    return true;
}

} // namespace net
