#include "InboundOsc.hpp"

namespace OQ {

auto editFromMessage(OscMessage message) -> SetValueEdit {
    return SetValueEdit{std::move(message.path), std::move(message.args)};
}

auto editFromPacket(OscPacket packet) -> Edit {
    if (!packet.bundle && packet.messages.size() == 1)
        return editFromMessage(std::move(packet.messages.front()));
    BatchEdit batch;
    batch.edits.reserve(packet.messages.size());
    for (auto& message : packet.messages)
        batch.edits.emplace_back(editFromMessage(std::move(message)));
    return batch;
}

} // namespace OQ
