#pragma once
#include "coordinator/Edit.hpp"
#include "osc/OscCodec.hpp"

namespace OQ {

// A single message becomes a SetValueEdit; a bundle becomes a BatchEdit in element order.
[[nodiscard]] auto editFromPacket(OscPacket packet) -> Edit;

[[nodiscard]] auto editFromMessage(OscMessage message) -> SetValueEdit;

} // namespace OQ
