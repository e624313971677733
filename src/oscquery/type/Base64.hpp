#pragma once
#include <cstddef>
#include <span>
#include <string>

namespace OQ {

[[nodiscard]] auto encode_base64(std::span<std::byte const> bytes) -> std::string;

} // namespace OQ
