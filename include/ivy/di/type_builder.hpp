#pragma once

#include <array>
#include <boost/any.hpp>
#include <boost/type_index.hpp>
#include <memory>
#include <string>
#include <type_traits>
#include <typeindex>
#include <utility>
#include <vector>

#include "ivy/di/type_info.hpp"
#include "ivy/di/type_registry.hpp"

namespace ivy::di {

template <template <class...> class... Templates>
struct template_list {};

/**
 * @brief Implementation templates described together with every closed
 * instance of a service template
 *
 * Specialize with IVY_GENERIC_IMPLEMENTATIONS so that resolving
 * IRepository<Order> finds metadata for Repository<Order> without listing
 * each closed type by hand.
 */
template <template <class...> class Service>
struct generic_implementations {
    using type = template_list<>;
};

template <template <class...> class Template>
const TypeInfo& generic_definition_of();

namespace detail {

template <template <class...> class Template>
struct generic_tag {};

template <typename T>
struct is_shared_ptr : std::false_type {};

template <typename U>
struct is_shared_ptr<std::shared_ptr<U>> : std::true_type {};

/**
 * @brief Service resolved for a parameter or property of type T
 *
 * std::shared_ptr<U> asks for service U; any other type asks for itself.
 */
template <typename T>
struct service_type {
    using type = T;
};

template <typename U>
struct service_type<std::shared_ptr<U>> {
    using type = U;
};

template <typename T>
using service_type_t = typename service_type<std::decay_t<T>>::type;

template <typename T>
struct sequence_traits {
    static constexpr bool is_sequence = false;
};

template <typename U>
struct sequence_traits<std::vector<std::shared_ptr<U>>> {
    static constexpr bool is_sequence = true;
    using element = U;
};

template <typename List, typename... Args>
struct close_each;

template <template <class...> class... Implementations, typename... Args>
struct close_each<template_list<Implementations...>, Args...> {
    static void describe() { (type_of<Implementations<Args...>>(), ...); }
};

template <typename T>
struct generic_traits {
    static constexpr bool is_instance = false;
};

template <template <class...> class Template, typename... Args>
struct generic_traits<Template<Args...>> {
    static constexpr bool is_instance = true;

    static const TypeInfo& definition() {
        return generic_definition_of<Template>();
    }

    static std::type_index definition_id() {
        return std::type_index(typeid(generic_tag<Template>));
    }

    static std::vector<TypeRef> arguments() { return {&type_of<Args>...}; }

    static std::vector<std::type_index> argument_ids() {
        return {std::type_index(typeid(Args))...};
    }

    static void describe_implementations() {
        close_each<typename generic_implementations<Template>::type,
                   Args...>::describe();
    }
};

template <template <class...> class Template>
std::string generic_definition_name() {
    std::string name =
        boost::typeindex::type_id<generic_tag<Template>>().pretty_name();
    auto open = name.find('<');
    auto close = name.rfind('>');
    if (open != std::string::npos && close != std::string::npos &&
        close > open) {
        name = name.substr(open + 1, close - open - 1);
    }
    return name + "<>";
}

template <typename T>
concept reflectable = requires(TypeBuilder<T>& builder) { T::reflect(builder); };

/**
 * @brief Convert a resolved or overridden argument to the declared type
 *
 * Value parameters accept either the value itself or a shared_ptr to it.
 * @throws boost::bad_any_cast when the argument has another type
 */
template <typename Value>
Value argument_cast(boost::any& argument) {
    if constexpr (is_shared_ptr<Value>::value) {
        return boost::any_cast<Value>(argument);
    } else {
        if (auto* direct = boost::any_cast<Value>(&argument)) {
            return *direct;
        }
        if (auto* shared = boost::any_cast<std::shared_ptr<Value>>(&argument);
            shared && *shared) {
            return **shared;
        }
        if constexpr (std::is_same_v<Value, std::string>) {
            if (auto* text = boost::any_cast<const char*>(&argument)) {
                return std::string(*text);
            }
        }
        throw boost::bad_any_cast();
    }
}

}  // namespace detail

/**
 * @brief Collects the metadata a type exposes for injection
 *
 * A type opts in with a static member:
 * @code
 * static void reflect(ivy::di::TypeBuilder<OrderService>& type) {
 *     type.implements<IOrderService>()
 *         .constructor<std::shared_ptr<IRepository<Order>>, std::string>(
 *             {"repository", "connectionString"})
 *         .inject("audit", &OrderService::audit_);
 * }
 * @endcode
 * Types without reflect() get a zero-argument constructor when they are
 * default constructible.
 */
template <typename T>
class TypeBuilder {
public:
    explicit TypeBuilder(TypeInfo& info) : info_(info) {}

    /**
     * @brief Declare a public constructor
     * @param names parameter names, matched against parameter overrides;
     * unnamed parameters can only be resolved
     */
    template <typename... Args>
    TypeBuilder& constructor(
        const std::array<const char*, sizeof...(Args)>& names = {}) {
        static_assert(std::is_constructible_v<T, Args...>,
                      "Type is not constructible from the declared parameters");

        ConstructorInfo constructor;
        [[maybe_unused]] size_t index = 0;
        (add_parameter<Args>(constructor, names[index++]), ...);
        constructor.invoke = [](Arguments& arguments) {
            return construct<Args...>(arguments,
                                      std::index_sequence_for<Args...>{});
        };
        info_.constructors_.push_back(std::move(constructor));
        return *this;
    }

    template <typename Interface>
    TypeBuilder& implements() {
        static_assert(std::is_base_of_v<Interface, T>,
                      "Type must inherit from the implemented interface");
        add_base<Interface>(true);
        return *this;
    }

    template <typename Base>
    TypeBuilder& inherits() {
        static_assert(std::is_base_of_v<Base, T>,
                      "Type must inherit from the declared base");
        add_base<Base>(false);
        return *this;
    }

    /**
     * @brief Mark a data member for injection after construction
     */
    template <typename Member, typename Owner>
        requires(!std::is_function_v<Member>)
    TypeBuilder& inject(std::string name, Member Owner::*member) {
        static_assert(std::is_base_of_v<Owner, T>,
                      "Injected member must belong to the type");
        add_property<Member>(std::move(name),
                             [member](T& target, Member value) {
                                 target.*member = std::move(value);
                             });
        return *this;
    }

    /**
     * @brief Mark a setter for injection after construction
     */
    template <typename Owner, typename Value>
    TypeBuilder& inject(std::string name, void (Owner::*setter)(Value)) {
        static_assert(std::is_base_of_v<Owner, T>,
                      "Injected setter must belong to the type");
        using Decayed = std::decay_t<Value>;
        add_property<Decayed>(std::move(name),
                              [setter](T& target, Decayed value) {
                                  (target.*setter)(std::move(value));
                              });
        return *this;
    }

private:
    template <typename Arg>
    static void add_parameter(ConstructorInfo& constructor, const char* name) {
        constructor.parameters.push_back(ParameterInfo{
            name ? name : "", &type_of<detail::service_type_t<Arg>>});
    }

    template <typename... Args, size_t... I>
    static std::shared_ptr<void> construct(Arguments& arguments,
                                           std::index_sequence<I...>) {
        return std::make_shared<T>(
            detail::argument_cast<std::decay_t<Args>>(arguments[I])...);
    }

    template <typename Base>
    void add_base(bool is_interface) {
        info_.bases_.push_back(BaseInfo{
            &type_of<Base>, is_interface,
            [](const std::shared_ptr<void>& instance) -> std::shared_ptr<void> {
                std::shared_ptr<Base> base = std::static_pointer_cast<T>(instance);
                return base;
            }});
    }

    template <typename Value, typename Assign>
    void add_property(std::string name, Assign assign) {
        info_.properties_.push_back(PropertyInfo{
            std::move(name), &type_of<detail::service_type_t<Value>>,
            [assign](const std::shared_ptr<void>& target, boost::any& value) {
                assign(*static_cast<T*>(target.get()),
                       detail::argument_cast<Value>(value));
            }});
    }

    TypeInfo& info_;
};

template <typename T>
std::unique_ptr<TypeInfo> describe_type() {
    std::unique_ptr<TypeInfo> info(new TypeInfo(
        typeid(T), boost::typeindex::type_id<T>().pretty_name()));
    info->is_class_ = std::is_class_v<T>;
    info->is_abstract_ = std::is_abstract_v<T>;
    info->box_ = [](const std::shared_ptr<void>& instance) {
        return boost::any(std::static_pointer_cast<T>(instance));
    };

    if constexpr (detail::sequence_traits<T>::is_sequence) {
        using Element = typename detail::sequence_traits<T>::element;
        info->sequence_element_ = &type_of<Element>;
        info->make_sequence_ =
            [](const std::vector<std::shared_ptr<void>>& elements)
            -> std::shared_ptr<void> {
            auto sequence = std::make_shared<T>();
            sequence->reserve(elements.size());
            for (const auto& element : elements) {
                sequence->push_back(std::static_pointer_cast<Element>(element));
            }
            return sequence;
        };
    } else if constexpr (detail::generic_traits<T>::is_instance) {
        using Traits = detail::generic_traits<T>;
        info->generic_definition_ = &Traits::definition;
        info->generic_definition_id_ = Traits::definition_id();
        info->type_arguments_ = Traits::arguments();
        info->argument_ids_ = Traits::argument_ids();
    }

    TypeBuilder<T> builder(*info);
    if constexpr (detail::reflectable<T>) {
        T::reflect(builder);
    }
    if constexpr (std::is_class_v<T> && !std::is_abstract_v<T> &&
                  std::is_default_constructible_v<T>) {
        if (info->constructors_.empty()) {
            builder.template constructor<>();
        }
    }
    return info;
}

template <template <class...> class Template>
std::unique_ptr<TypeInfo> describe_generic_definition() {
    std::unique_ptr<TypeInfo> info(
        new TypeInfo(typeid(detail::generic_tag<Template>),
                     detail::generic_definition_name<Template>()));
    info->is_generic_definition_ = true;
    info->box_ = [](const std::shared_ptr<void>&) { return boost::any(); };
    return info;
}

template <typename T>
const TypeInfo& type_of() {
    static const TypeInfo& info = []() -> const TypeInfo& {
        const TypeInfo& stored =
            TypeRegistry::instance().add(describe_type<T>());
        if constexpr (detail::generic_traits<T>::is_instance) {
            detail::generic_traits<T>::describe_implementations();
        }
        return stored;
    }();
    return info;
}

/**
 * @brief Open generic descriptor for a class template, e.g. IRepository<>
 */
template <template <class...> class Template>
const TypeInfo& generic_definition_of() {
    static const TypeInfo& info =
        TypeRegistry::instance().add(describe_generic_definition<Template>());
    return info;
}

/**
 * @brief Describe a list of types up front
 *
 * Closed generic implementations must be described before they can be
 * selected by an open generic registration.
 */
template <typename... Ts>
void reflect_types() {
    (type_of<Ts>(), ...);
}

template <typename... Ts>
TypeList type_list() {
    return TypeList(std::vector<const TypeInfo*>{&type_of<Ts>()...});
}

}  // namespace ivy::di

/**
 * @brief Declare the implementation templates of a service template
 *
 * Use at global namespace scope:
 * @code
 * IVY_GENERIC_IMPLEMENTATIONS(app::IRepository, app::Repository)
 * @endcode
 */
#define IVY_GENERIC_IMPLEMENTATIONS(service, ...)            \
    namespace ivy::di {                                      \
    template <>                                              \
    struct generic_implementations<service> {                \
        using type = template_list<__VA_ARGS__>;             \
    };                                                       \
    }
