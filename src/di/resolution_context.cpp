#include "ivy/di/resolution_context.hpp"

#include <algorithm>

#include "ivy/di/exceptions.hpp"
#include "ivy/di/registration.hpp"

namespace ivy::di {

namespace {
thread_local ResolutionContext* current_context = nullptr;
}

void ResolutionContext::push_resolution(const Registration* registration) {
    if (is_resolving(registration)) {
        auto chain = get_resolution_chain();
        chain.push_back(registration->service().name());
        throw CircularDependencyError(std::move(chain));
    }
    if (stack_.size() >= max_depth_) {
        throw ConstructionError("Maximum resolution depth of " +
                                std::to_string(max_depth_) +
                                " exceeded while resolving '" +
                                registration->service().name() + "'");
    }
    stack_.push_back(registration);
}

void ResolutionContext::pop_resolution(const Registration* registration) {
    if (!stack_.empty() && stack_.back() == registration) {
        stack_.pop_back();
    }
}

bool ResolutionContext::is_resolving(const Registration* registration) const {
    return std::find(stack_.begin(), stack_.end(), registration) !=
           stack_.end();
}

std::vector<std::string> ResolutionContext::get_resolution_chain() const {
    std::vector<std::string> chain;
    chain.reserve(stack_.size() + 1);
    for (const auto* registration : stack_) {
        chain.push_back(registration->service().name());
    }
    return chain;
}

ResolutionContext* ResolutionContext::current() { return current_context; }

ResolutionContext::Activation::Activation(size_t max_depth,
                                          LifetimeScope* scope)
    : context_(current_context) {
    if (!context_) {
        owned_ = std::make_unique<ResolutionContext>(max_depth);
        owned_->scope_ = scope;
        context_ = owned_.get();
        current_context = context_;
    }
}

ResolutionContext::Activation::~Activation() {
    if (owned_) {
        current_context = nullptr;
    }
}

}  // namespace ivy::di
