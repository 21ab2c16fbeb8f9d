#pragma once

#include <boost/any.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <vector>

namespace ivy::di {

class TypeInfo;

template <typename T>
class TypeBuilder;

/**
 * @brief Lazy reference to the metadata of another type
 *
 * Metadata is linked through function pointers so that types whose
 * constructors refer to each other can be described independently.
 */
using TypeRef = const TypeInfo& (*)();

/**
 * @brief Type-erased constructor or property arguments
 *
 * A resolved service of type U is passed as std::shared_ptr<U>; parameter
 * overrides are passed as whatever the caller stored.
 */
using Arguments = std::vector<boost::any>;

struct ParameterInfo {
    std::string name;
    TypeRef type;
};

struct ConstructorInfo {
    std::vector<ParameterInfo> parameters;
    // Returns a pointer to the constructed object of the described type
    std::function<std::shared_ptr<void>(Arguments&)> invoke;
};

/**
 * @brief Writable property marked for injection
 */
struct PropertyInfo {
    std::string name;
    TypeRef type;
    // target points to an object of the declaring type
    std::function<void(const std::shared_ptr<void>& target, boost::any& value)>
        assign;
};

struct BaseInfo {
    TypeRef type;
    bool is_interface;
    // Converts a pointer to the derived object into a pointer to this base
    std::shared_ptr<void> (*upcast)(const std::shared_ptr<void>&);
};

using UpcastPath = std::vector<const BaseInfo*>;

/**
 * @brief Runtime description of a type: identity, construction plan
 * ingredients and position in the type hierarchy
 *
 * Instances are created once per type by type_of<T>() or
 * generic_definition_of<Template>() and live in the TypeRegistry for the
 * rest of the process.
 */
class TypeInfo {
public:
    TypeInfo(const TypeInfo&) = delete;
    TypeInfo& operator=(const TypeInfo&) = delete;

    std::type_index id() const { return id_; }
    const std::string& name() const { return name_; }

    bool is_class() const { return is_class_; }
    bool is_abstract() const { return is_abstract_; }

    // True for class templates registered as open generics
    bool is_generic_definition() const { return is_generic_definition_; }

    // True for a closed instance of a class template, e.g. Repository<Order>
    bool is_generic_instance() const { return generic_definition_ != nullptr; }

    const TypeInfo* generic_definition() const;
    std::type_index generic_definition_id() const {
        return generic_definition_id_;
    }
    const std::vector<std::type_index>& argument_ids() const {
        return argument_ids_;
    }
    std::vector<const TypeInfo*> type_arguments() const;

    // Element type when this is std::vector<std::shared_ptr<U>>
    const TypeInfo* sequence_element() const;
    bool is_sequence() const { return sequence_element_ != nullptr; }

    const std::vector<ConstructorInfo>& constructors() const {
        return constructors_;
    }

    /**
     * @brief Constructor with the most parameters; the first declared one
     * wins a tie
     * @return nullptr when the type declares no usable constructor
     */
    const ConstructorInfo* greediest_constructor() const;

    // Injectable properties declared by this type itself
    const std::vector<PropertyInfo>& properties() const { return properties_; }

    const std::vector<BaseInfo>& bases() const { return bases_; }

    /**
     * @brief Interfaces implemented directly or through bases, in declaration
     * order, without duplicates
     */
    std::vector<const TypeInfo*> interfaces() const;

    /**
     * @brief Chain of base conversions leading to target
     * @return empty path for the type itself, std::nullopt when unrelated
     */
    std::optional<UpcastPath> find_upcast_path(const TypeInfo& target) const;

    bool is_assignable_to(const TypeInfo& target) const {
        return find_upcast_path(target).has_value();
    }

    // Wraps a pointer to an object of this type as std::shared_ptr<T>
    boost::any box(const std::shared_ptr<void>& instance) const {
        return box_(instance);
    }

    /**
     * @brief Builds a std::vector<std::shared_ptr<U>> from element pointers
     * @pre is_sequence()
     */
    std::shared_ptr<void> make_sequence(
        const std::vector<std::shared_ptr<void>>& elements) const {
        return make_sequence_(elements);
    }

    bool operator==(const TypeInfo& other) const { return id_ == other.id_; }
    bool operator!=(const TypeInfo& other) const { return id_ != other.id_; }

private:
    template <typename T>
    friend class TypeBuilder;

    template <typename T>
    friend std::unique_ptr<TypeInfo> describe_type();

    template <template <class...> class Template>
    friend std::unique_ptr<TypeInfo> describe_generic_definition();

    TypeInfo(std::type_index id, std::string name)
        : id_(id), name_(std::move(name)) {}

    std::type_index id_;
    std::string name_;
    bool is_class_ = false;
    bool is_abstract_ = false;
    bool is_generic_definition_ = false;
    TypeRef generic_definition_ = nullptr;
    std::type_index generic_definition_id_ = typeid(void);
    std::vector<TypeRef> type_arguments_;
    std::vector<std::type_index> argument_ids_;
    TypeRef sequence_element_ = nullptr;
    std::vector<ConstructorInfo> constructors_;
    std::vector<PropertyInfo> properties_;
    std::vector<BaseInfo> bases_;
    boost::any (*box_)(const std::shared_ptr<void>&) = nullptr;
    std::shared_ptr<void> (*make_sequence_)(
        const std::vector<std::shared_ptr<void>>&) = nullptr;
};

/**
 * @brief Metadata of T, described on first use
 */
template <typename T>
const TypeInfo& type_of();

}  // namespace ivy::di
