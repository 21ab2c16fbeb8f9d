#pragma once

#include <map>
#include <memory>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "ivy/di/type_info.hpp"

namespace ivy::di {

/**
 * @brief Enumerates candidate types for Container::register_assembly_types
 */
class TypeSource {
public:
    virtual ~TypeSource() = default;
    virtual std::vector<const TypeInfo*> types() const = 0;
};

/**
 * @brief Process-wide catalog of described types
 *
 * Enumerates types in the order they were first described.
 */
class TypeRegistry : public TypeSource {
public:
    static TypeRegistry& instance();

    /**
     * @brief Adopt a freshly described type
     * @return the stored metadata; an earlier description of the same type
     * wins over a duplicate
     */
    const TypeInfo& add(std::unique_ptr<TypeInfo> info);

    const TypeInfo* find(std::type_index id) const;

    /**
     * @brief Look up the instance of a generic definition closed over the
     * given type arguments
     * @return nullptr when that instance was never described
     */
    const TypeInfo* close_generic(
        const TypeInfo& definition,
        const std::vector<std::type_index>& arguments) const;

    std::vector<const TypeInfo*> types() const override;

    size_t size() const;

private:
    TypeRegistry() = default;

    using ClosedKey = std::pair<std::type_index, std::vector<std::type_index>>;

    mutable std::shared_mutex mutex_;
    std::vector<std::unique_ptr<TypeInfo>> types_;
    std::unordered_map<std::type_index, const TypeInfo*> by_id_;
    std::map<ClosedKey, const TypeInfo*> closed_generics_;
};

/**
 * @brief Fixed list of types, scanned in insertion order
 */
class TypeList : public TypeSource {
public:
    TypeList() = default;
    explicit TypeList(std::vector<const TypeInfo*> types)
        : types_(std::move(types)) {}

    TypeList& add(const TypeInfo& type) {
        types_.push_back(&type);
        return *this;
    }

    std::vector<const TypeInfo*> types() const override { return types_; }

private:
    std::vector<const TypeInfo*> types_;
};

}  // namespace ivy::di
