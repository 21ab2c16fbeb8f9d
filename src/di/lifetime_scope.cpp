#include "ivy/di/lifetime_scope.hpp"

#include "ivy/log/logger.hpp"

namespace ivy::di {

LifetimeScope::LifetimeScope(Container& container) : container_(container) {
    IVY_LOG_DEBUG << "Lifetime scope started";
}

LifetimeScope::~LifetimeScope() {
    IVY_LOG_DEBUG << "Lifetime scope ended, releasing " << instances_.size()
                  << " scoped instances";
}

std::shared_ptr<void> LifetimeScope::find_instance(
    const Registration& registration) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = instances_.find(&registration);
    return it != instances_.end() ? it->second.instance : nullptr;
}

std::shared_ptr<void> LifetimeScope::add_instance(
    std::shared_ptr<Registration> registration,
    std::shared_ptr<void> instance) {
    std::lock_guard<std::mutex> lock(mutex_);
    const Registration* id = registration.get();
    auto result = instances_.emplace(
        id, Entry{std::move(registration), std::move(instance)});
    return result.first->second.instance;
}

size_t LifetimeScope::instance_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return instances_.size();
}

}  // namespace ivy::di
