#include "infrastructure/probes/ProbeSet.hpp"

#include "core/types/TextUtils.hpp"

namespace fleetwatch::infra {

std::string probeVariantToString(ProbeVariant variant) {
    switch (variant) {
        case ProbeVariant::Generic: return "generic";
        case ProbeVariant::SnmpSwitch: return "snmp_switch";
        case ProbeVariant::ShellSwitch: return "shell_switch";
        case ProbeVariant::HttpMediaPlayer: return "http_media_player";
        case ProbeVariant::SnmpPrinter: return "snmp_printer";
        case ProbeVariant::TcpLiveness: return "tcp_liveness";
    }
    return "generic";
}

ProbeSet::ProbeSet(std::shared_ptr<GenericProbe> generic,
                   std::shared_ptr<SnmpSwitchProbe> snmpSwitch,
                   std::shared_ptr<ShellSwitchProbe> shellSwitch,
                   std::shared_ptr<MediaPlayerProbe> mediaPlayer,
                   std::shared_ptr<SnmpPrinterProbe> printer,
                   std::shared_ptr<TcpLivenessProbe> labelPrinter)
    : generic_(std::move(generic)),
      snmpSwitch_(std::move(snmpSwitch)),
      shellSwitch_(std::move(shellSwitch)),
      mediaPlayer_(std::move(mediaPlayer)),
      printer_(std::move(printer)),
      labelPrinter_(std::move(labelPrinter)) {}

ProbeVariant ProbeSet::resolve(const core::PollTarget& target) {
    const auto vendor = core::text::toLower(target.vendor);
    switch (target.kind) {
        case core::DeviceKind::Switch:
            return vendor == "cisco" ? ProbeVariant::ShellSwitch : ProbeVariant::SnmpSwitch;
        case core::DeviceKind::MediaPlayer:
            if (vendor == "generic" ||
                (target.deviceType && core::text::toLower(*target.deviceType) != "iconbit")) {
                return ProbeVariant::Generic;
            }
            return ProbeVariant::HttpMediaPlayer;
        case core::DeviceKind::Printer:
            return ProbeVariant::SnmpPrinter;
        case core::DeviceKind::LabelPrinter:
            return ProbeVariant::TcpLiveness;
        case core::DeviceKind::Generic:
            return ProbeVariant::Generic;
    }
    return ProbeVariant::Generic;
}

core::IStatusProbe& ProbeSet::probeFor(const core::PollTarget& target) {
    return probe(resolve(target));
}

core::IStatusProbe& ProbeSet::probe(ProbeVariant variant) {
    switch (variant) {
        case ProbeVariant::SnmpSwitch: return *snmpSwitch_;
        case ProbeVariant::ShellSwitch: return *shellSwitch_;
        case ProbeVariant::HttpMediaPlayer: return *mediaPlayer_;
        case ProbeVariant::SnmpPrinter: return *printer_;
        case ProbeVariant::TcpLiveness: return *labelPrinter_;
        case ProbeVariant::Generic: break;
    }
    return *generic_;
}

} // namespace fleetwatch::infra
