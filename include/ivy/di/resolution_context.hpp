#pragma once

#include <memory>
#include <string>
#include <vector>

namespace ivy::di {

class LifetimeScope;
class Registration;

/**
 * @brief Registrations currently being resolved on one thread
 *
 * Registrations are compared by identity, so two keyed registrations of the
 * same service do not count as a cycle.
 */
class ResolutionContext {
public:
    explicit ResolutionContext(size_t max_depth) : max_depth_(max_depth) {}

    /**
     * @throws CircularDependencyError when registration is already on the
     * stack
     * @throws ConstructionError when the depth limit is exceeded
     */
    void push_resolution(const Registration* registration);

    void pop_resolution(const Registration* registration);

    bool is_resolving(const Registration* registration) const;

    size_t depth() const { return stack_.size(); }

    std::vector<std::string> get_resolution_chain() const;

    // Scope of the outermost resolve call; nested calls without one use it
    LifetimeScope* scope() const { return scope_; }

    /**
     * @brief Context of the resolve call running on this thread, nullptr when
     * there is none
     */
    static ResolutionContext* current();

    /**
     * @brief Makes a context current for the duration of a resolve call
     *
     * Nested activations, including those made from factories calling back
     * into the container, share the outermost context.
     */
    class Activation {
    public:
        Activation(size_t max_depth, LifetimeScope* scope);
        ~Activation();

        Activation(const Activation&) = delete;
        Activation& operator=(const Activation&) = delete;

        ResolutionContext& context() { return *context_; }

    private:
        std::unique_ptr<ResolutionContext> owned_;
        ResolutionContext* context_;
    };

private:
    std::vector<const Registration*> stack_;
    size_t max_depth_;
    LifetimeScope* scope_ = nullptr;
};

/**
 * @brief RAII guard for dependency resolution tracking
 */
class ResolutionGuard {
public:
    ResolutionGuard(ResolutionContext& context,
                    const Registration* registration)
        : context_(context), registration_(registration) {
        context_.push_resolution(registration_);
    }

    ~ResolutionGuard() { context_.pop_resolution(registration_); }

    ResolutionGuard(const ResolutionGuard&) = delete;
    ResolutionGuard& operator=(const ResolutionGuard&) = delete;

private:
    ResolutionContext& context_;
    const Registration* registration_;
};

}  // namespace ivy::di
