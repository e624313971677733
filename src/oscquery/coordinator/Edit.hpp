#pragma once
#include "core/Error.hpp"
#include "core/NodeAttributes.hpp"
#include "type/OscValue.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace OQ {

struct InsertEdit {
    std::string    path;
    NodeAttributes attributes;
};

struct RemoveEdit {
    std::string path;
};

struct SetValueEdit {
    std::string path;
    OscValues   values;
};

using SingleEdit = std::variant<InsertEdit, RemoveEdit, SetValueEdit>;

// Members apply in order within one executor turn; each member is atomic on its own.
struct BatchEdit {
    std::vector<SingleEdit> edits;
};

using Edit = std::variant<InsertEdit, RemoveEdit, SetValueEdit, BatchEdit>;

struct EditResult {
    bool                     changed = false;
    std::vector<std::string> added;   // parents first
    std::vector<std::string> removed; // leaves first
    OscValues                stored;  // SetValueEdit: the value after clipping

    // BatchEdit: one entry per member, nullopt where the member applied.
    std::vector<std::optional<Error>> memberErrors;
};

[[nodiscard]] auto editPath(SingleEdit const& edit) -> std::string const&;
[[nodiscard]] auto describeEdit(Edit const& edit) -> std::string;

} // namespace OQ
