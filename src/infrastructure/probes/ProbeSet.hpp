#pragma once

#include "core/services/IStatusProbe.hpp"
#include "infrastructure/probes/GenericProbe.hpp"
#include "infrastructure/probes/MediaPlayerProbe.hpp"
#include "infrastructure/probes/ShellSwitchProbe.hpp"
#include "infrastructure/probes/SnmpPrinterProbe.hpp"
#include "infrastructure/probes/SnmpSwitchProbe.hpp"
#include "infrastructure/probes/TcpLivenessProbe.hpp"

#include <memory>
#include <string>

namespace fleetwatch::infra {

/**
 * @brief The closed set of probe strategies.
 */
enum class ProbeVariant {
    Generic,
    SnmpSwitch,
    ShellSwitch,
    HttpMediaPlayer,
    SnmpPrinter,
    TcpLiveness
};

std::string probeVariantToString(ProbeVariant variant);

/**
 * @brief One instance of every probe strategy, chosen per target by resolve().
 */
class ProbeSet {
public:
    static constexpr uint16_t kLabelPrinterPort = 9100;
    static constexpr std::chrono::milliseconds kLabelPrinterTimeout{2000};

    ProbeSet(std::shared_ptr<GenericProbe> generic,
             std::shared_ptr<SnmpSwitchProbe> snmpSwitch,
             std::shared_ptr<ShellSwitchProbe> shellSwitch,
             std::shared_ptr<MediaPlayerProbe> mediaPlayer,
             std::shared_ptr<SnmpPrinterProbe> printer,
             std::shared_ptr<TcpLivenessProbe> labelPrinter);

    /**
     * @brief Picks the strategy for a target from its kind, vendor and device type.
     */
    static ProbeVariant resolve(const core::PollTarget& target);

    core::IStatusProbe& probeFor(const core::PollTarget& target);
    core::IStatusProbe& probe(ProbeVariant variant);

    ShellSwitchProbe& shellSwitch() { return *shellSwitch_; }
    MediaPlayerProbe& mediaPlayer() { return *mediaPlayer_; }

private:
    std::shared_ptr<GenericProbe> generic_;
    std::shared_ptr<SnmpSwitchProbe> snmpSwitch_;
    std::shared_ptr<ShellSwitchProbe> shellSwitch_;
    std::shared_ptr<MediaPlayerProbe> mediaPlayer_;
    std::shared_ptr<SnmpPrinterProbe> printer_;
    std::shared_ptr<TcpLivenessProbe> labelPrinter_;
};

} // namespace fleetwatch::infra
