#pragma once

#include "../common/cancel_token.hpp"
#include "gattbench/records.hpp"
#include "gattbench/types.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace gattbench {
namespace client {

// Abstract radio boundary of the measurement client: one central-role link
// to the peripheral under test. Implementations report failures through
// bool / empty returns plus lastError().
class RadioLink {
public:
    using NotificationCallback = std::function<void(const Bytes& data)>;
    using LinkLostCallback = std::function<void(const std::string& reason)>;

    virtual ~RadioLink() = default;

    // One physical connect attempt. Must return within timeout_s; returns
    // ERROR with lastError() == "cancelled" if the token fires mid-attempt.
    virtual AttemptOutcome connect(const std::string& target, double timeout_s,
                                   const CancelToken& cancel) = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Characteristic UUIDs of a service, empty if the service is absent
    virtual std::vector<std::string> discoverCharacteristics(const std::string& service_uuid) = 0;

    // Capability negotiation (optional - may be unsupported)
    virtual bool supportsMtuRequest() const = 0;
    virtual std::optional<int> requestMtu(int mtu) = 0;     // Negotiated MTU
    virtual bool supportsPhyRequest() const = 0;
    virtual bool requestPhy(Phy phy) = 0;

    // RX write without response
    virtual bool writeCommand(const Bytes& data) = 0;

    // TX CCCD on / off
    virtual bool subscribe(NotificationCallback cb) = 0;
    virtual bool unsubscribe() = 0;

    // Connected-link RSSI, empty when the backend cannot expose it
    virtual std::optional<int> readRssi() = 0;

    virtual void setLinkLostCallback(LinkLostCallback cb) = 0;

    virtual std::string lastError() const = 0;
    virtual const char* backendName() const = 0;
    virtual std::string adapterName() const = 0;
};

} // namespace client
} // namespace gattbench
