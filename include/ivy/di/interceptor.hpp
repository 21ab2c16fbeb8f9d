#pragma once

#include <functional>
#include <memory>

#include "ivy/di/type_builder.hpp"
#include "ivy/di/type_info.hpp"

namespace ivy::di {

/**
 * @brief Hook applied to every constructed instance before it is handed out
 *
 * The instance points at an object of the service type. Returning it
 * unchanged is the identity interception.
 */
class IInterceptor {
public:
    virtual ~IInterceptor() = default;
    virtual std::shared_ptr<void> intercept(const TypeInfo& service,
                                            std::shared_ptr<void> instance) = 0;
};

/**
 * @brief Interceptor that only sees instances of service T
 */
template <typename T>
class TypedInterceptor : public IInterceptor {
public:
    using Transform = std::function<std::shared_ptr<T>(std::shared_ptr<T>)>;

    explicit TypedInterceptor(Transform transform)
        : transform_(std::move(transform)) {}

    std::shared_ptr<void> intercept(const TypeInfo& service,
                                    std::shared_ptr<void> instance) override {
        if (service != type_of<T>()) {
            return instance;
        }
        return transform_(std::static_pointer_cast<T>(std::move(instance)));
    }

private:
    Transform transform_;
};

template <typename T>
std::shared_ptr<IInterceptor> make_interceptor(
    typename TypedInterceptor<T>::Transform transform) {
    return std::make_shared<TypedInterceptor<T>>(std::move(transform));
}

}  // namespace ivy::di
