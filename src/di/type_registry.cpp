#include "ivy/di/type_registry.hpp"

#include <mutex>

#include "ivy/log/logger.hpp"

namespace ivy::di {

TypeRegistry& TypeRegistry::instance() {
    static TypeRegistry instance;
    return instance;
}

const TypeInfo& TypeRegistry::add(std::unique_ptr<TypeInfo> info) {
    std::unique_lock lock(mutex_);

    auto it = by_id_.find(info->id());
    if (it != by_id_.end()) {
        return *it->second;
    }

    const TypeInfo* stored = info.get();
    by_id_.emplace(stored->id(), stored);
    if (stored->is_generic_instance()) {
        closed_generics_.emplace(
            ClosedKey(stored->generic_definition_id(), stored->argument_ids()),
            stored);
    }
    types_.push_back(std::move(info));

    IVY_LOG_TRACE << "Described type: " << stored->name();
    return *stored;
}

const TypeInfo* TypeRegistry::find(std::type_index id) const {
    std::shared_lock lock(mutex_);
    auto it = by_id_.find(id);
    return it != by_id_.end() ? it->second : nullptr;
}

const TypeInfo* TypeRegistry::close_generic(
    const TypeInfo& definition,
    const std::vector<std::type_index>& arguments) const {
    std::shared_lock lock(mutex_);
    auto it = closed_generics_.find(ClosedKey(definition.id(), arguments));
    return it != closed_generics_.end() ? it->second : nullptr;
}

std::vector<const TypeInfo*> TypeRegistry::types() const {
    std::shared_lock lock(mutex_);
    std::vector<const TypeInfo*> result;
    result.reserve(types_.size());
    for (const auto& type : types_) {
        result.push_back(type.get());
    }
    return result;
}

size_t TypeRegistry::size() const {
    std::shared_lock lock(mutex_);
    return types_.size();
}

}  // namespace ivy::di
