#include "ServiceAdvertiser.hpp"

namespace OQ {

auto serviceRecordsFor(HostInfo const& info, std::uint16_t httpPort) -> std::vector<ServiceRecord> {
    std::vector<ServiceRecord> records;
    records.push_back(ServiceRecord{info.name, "_oscjson._tcp", httpPort, {}});
    if (info.oscPort != 0) {
        ServiceRecord osc{info.name, "_osc._udp", info.oscPort, {}};
        osc.txt["txtvers"] = "1";
        records.push_back(std::move(osc));
    }
    return records;
}

} // namespace OQ
