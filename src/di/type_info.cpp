#include "ivy/di/type_info.hpp"

#include <unordered_set>

namespace ivy::di {

namespace {

void collect_interfaces(const TypeInfo& type,
                        std::unordered_set<std::type_index>& seen,
                        std::vector<const TypeInfo*>& result) {
    for (const auto& base : type.bases()) {
        const TypeInfo& base_type = base.type();
        if (base.is_interface && seen.insert(base_type.id()).second) {
            result.push_back(&base_type);
        }
        collect_interfaces(base_type, seen, result);
    }
}

bool search_upcast_path(const TypeInfo& current, const TypeInfo& target,
                        UpcastPath& path) {
    if (current == target) {
        return true;
    }
    for (const auto& base : current.bases()) {
        path.push_back(&base);
        if (search_upcast_path(base.type(), target, path)) {
            return true;
        }
        path.pop_back();
    }
    return false;
}

}  // namespace

const TypeInfo* TypeInfo::generic_definition() const {
    return generic_definition_ ? &generic_definition_() : nullptr;
}

std::vector<const TypeInfo*> TypeInfo::type_arguments() const {
    std::vector<const TypeInfo*> arguments;
    arguments.reserve(type_arguments_.size());
    for (auto argument : type_arguments_) {
        arguments.push_back(&argument());
    }
    return arguments;
}

const TypeInfo* TypeInfo::sequence_element() const {
    return sequence_element_ ? &sequence_element_() : nullptr;
}

const ConstructorInfo* TypeInfo::greediest_constructor() const {
    const ConstructorInfo* selected = nullptr;
    for (const auto& constructor : constructors_) {
        // Strictly greater keeps the first declared on a tie
        if (!selected ||
            constructor.parameters.size() > selected->parameters.size()) {
            selected = &constructor;
        }
    }
    return selected;
}

std::vector<const TypeInfo*> TypeInfo::interfaces() const {
    std::unordered_set<std::type_index> seen;
    std::vector<const TypeInfo*> result;
    collect_interfaces(*this, seen, result);
    return result;
}

std::optional<UpcastPath> TypeInfo::find_upcast_path(
    const TypeInfo& target) const {
    UpcastPath path;
    if (search_upcast_path(*this, target, path)) {
        return path;
    }
    return std::nullopt;
}

}  // namespace ivy::di
