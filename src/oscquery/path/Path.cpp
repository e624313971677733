#include "Path.hpp"

namespace OQ {

auto checkAddress(std::string_view path) -> Expected<void> {
    auto const result = validate_address(path);
    if (result.code != PathValidation::Code::None) {
        std::string message{get_validation_message(result.code)};
        message.append(" at position ");
        message.append(std::to_string(result.position));
        message.append(": '");
        message.append(path);
        message.push_back('\'');
        return std::unexpected(Error{Error::Code::InvalidPath, std::move(message)});
    }
    return {};
}

auto splitAddress(std::string_view path) -> Expected<std::vector<std::string_view>> {
    if (auto checked = checkAddress(path); !checked)
        return std::unexpected(checked.error());
    std::vector<std::string_view> segments;
    splitSegments(path, segments);
    return segments;
}

auto splitSegments(std::string_view path, std::vector<std::string_view>& out) -> void {
    out.clear();
    std::size_t start = 0;
    if (!path.empty() && path.front() == '/')
        start = 1;
    while (start <= path.size()) {
        std::size_t      end  = path.find('/', start);
        std::size_t      len  = (end == std::string_view::npos ? path.size() : end) - start;
        std::string_view name = path.substr(start, len);
        if (!name.empty())
            out.push_back(name);
        if (end == std::string_view::npos)
            break;
        start = end + 1;
    }
}

auto parentOf(std::string_view path) -> std::string_view {
    auto const pos = path.rfind('/');
    if (pos == std::string_view::npos || pos == 0)
        return "/";
    return path.substr(0, pos);
}

auto lastSegment(std::string_view path) -> std::string_view {
    auto const pos = path.rfind('/');
    if (pos == std::string_view::npos)
        return path;
    return path.substr(pos + 1);
}

} // namespace OQ
