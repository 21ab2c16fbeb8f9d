// tests/di/test_circular_dependency.cpp
#define BOOST_TEST_MODULE circular_dependency_tests
#include <boost/test/unit_test.hpp>
#include <memory>
#include <string>

#include "ivy/di/container.hpp"
#include "ivy/di/exceptions.hpp"
#include "ivy/di/lifetime_scope.hpp"

using namespace ivy::di;

class ServiceB;

class ServiceA {
public:
    explicit ServiceA(std::shared_ptr<ServiceB> b) : b_(std::move(b)) {}
    static void reflect(TypeBuilder<ServiceA>& type);

private:
    std::shared_ptr<ServiceB> b_;
};

class ServiceB {
public:
    explicit ServiceB(std::shared_ptr<ServiceA> a) : a_(std::move(a)) {}
    static void reflect(TypeBuilder<ServiceB>& type);

private:
    std::shared_ptr<ServiceA> a_;
};

void ServiceA::reflect(TypeBuilder<ServiceA>& type) {
    type.constructor<std::shared_ptr<ServiceB>>({"b"});
}

void ServiceB::reflect(TypeBuilder<ServiceB>& type) {
    type.constructor<std::shared_ptr<ServiceA>>({"a"});
}

class SelfReferencing {
public:
    static void reflect(TypeBuilder<SelfReferencing>& type) {
        type.inject("self", &SelfReferencing::self_);
    }

    std::shared_ptr<SelfReferencing> self_;
};

struct IAlpha {
    virtual ~IAlpha() = default;
};

struct IBeta {
    virtual ~IBeta() = default;
};

class Alpha : public IAlpha {
public:
    explicit Alpha(std::shared_ptr<IBeta> beta) : beta_(std::move(beta)) {}

private:
    std::shared_ptr<IBeta> beta_;
};

class Beta : public IBeta {
public:
    explicit Beta(std::shared_ptr<IAlpha> alpha) : alpha_(std::move(alpha)) {}

private:
    std::shared_ptr<IAlpha> alpha_;
};

struct INode {
    virtual ~INode() = default;
};

class LeafNode : public INode {
public:
    static void reflect(TypeBuilder<LeafNode>& type) {
        type.implements<INode>();
    }
};

class BranchNode : public INode {
public:
    explicit BranchNode(std::shared_ptr<INode> child) : child_(std::move(child)) {}

    static void reflect(TypeBuilder<BranchNode>& type) {
        type.implements<INode>().constructor<std::shared_ptr<INode>>({"child"});
    }

    std::shared_ptr<INode> child_;
};

class Chain1;
class Chain2;

class Chain0 {
public:
    explicit Chain0(std::shared_ptr<Chain1>) {}
    static void reflect(TypeBuilder<Chain0>& type);
};

class Chain1 {
public:
    explicit Chain1(std::shared_ptr<Chain2>) {}
    static void reflect(TypeBuilder<Chain1>& type);
};

class Chain2 {
public:
    Chain2() = default;
};

void Chain0::reflect(TypeBuilder<Chain0>& type) {
    type.constructor<std::shared_ptr<Chain1>>({"next"});
}

void Chain1::reflect(TypeBuilder<Chain1>& type) {
    type.constructor<std::shared_ptr<Chain2>>({"next"});
}

// =====================================
// Cycle detection
// =====================================

BOOST_AUTO_TEST_SUITE(circular_dependency_suite)

BOOST_AUTO_TEST_CASE(test_constructor_cycle_detected) {
    Container container;

    try {
        container.resolve<ServiceA>();
        BOOST_FAIL("Expected CircularDependencyError");
    } catch (const CircularDependencyError& e) {
        const auto& chain = e.chain();
        BOOST_REQUIRE_EQUAL(chain.size(), 3);
        BOOST_CHECK(chain[0].find("ServiceA") != std::string::npos);
        BOOST_CHECK(chain[1].find("ServiceB") != std::string::npos);
        BOOST_CHECK_EQUAL(chain[0], chain[2]);
        BOOST_CHECK(std::string(e.what()).find(" -> ") != std::string::npos);
    }
}

BOOST_AUTO_TEST_CASE(test_singleton_cycle_detected) {
    Container container;
    container.register_type<ServiceA>(ServiceLifetime::SINGLETON);
    container.register_type<ServiceB>(ServiceLifetime::SINGLETON);

    BOOST_CHECK_THROW(container.resolve<ServiceB>(), CircularDependencyError);
}

BOOST_AUTO_TEST_CASE(test_scoped_cycle_detected) {
    Container container;
    container.register_type<ServiceA>(ServiceLifetime::SCOPED);
    container.register_type<ServiceB>(ServiceLifetime::SCOPED);

    auto scope = container.begin_scope();
    BOOST_CHECK_THROW(scope->resolve<ServiceA>(), CircularDependencyError);
    BOOST_CHECK_EQUAL(scope->instance_count(), 0);
}

BOOST_AUTO_TEST_CASE(test_property_cycle_propagates_unchanged) {
    Container container;
    BOOST_CHECK_THROW(container.resolve<SelfReferencing>(),
                      CircularDependencyError);
}

BOOST_AUTO_TEST_CASE(test_cycle_through_factories_detected) {
    Container container;
    container.register_factory<IAlpha>([](Container& c) {
        return std::make_shared<Alpha>(c.resolve<IBeta>());
    });
    container.register_factory<IBeta>([](Container& c) {
        return std::make_shared<Beta>(c.resolve<IAlpha>());
    });

    BOOST_CHECK_THROW(container.resolve<IAlpha>(), CircularDependencyError);
}

BOOST_AUTO_TEST_CASE(test_keyed_registrations_of_same_service_are_not_a_cycle) {
    Container container;
    container.register_type<INode, LeafNode>(ServiceLifetime::TRANSIENT, "leaf");
    container.register_factory<INode>(
        [](Container& c) {
            return std::make_shared<BranchNode>(c.resolve<INode>("leaf"));
        },
        ServiceLifetime::TRANSIENT, "branch");

    auto node = container.resolve<INode>("branch");
    BOOST_CHECK(dynamic_cast<BranchNode*>(node.get()) != nullptr);
}

BOOST_AUTO_TEST_CASE(test_container_usable_after_cycle) {
    Container container;
    BOOST_CHECK_THROW(container.resolve<ServiceA>(), CircularDependencyError);

    container.register_type<INode, LeafNode>();
    BOOST_CHECK(container.resolve<INode>());
    BOOST_CHECK(container.resolve<Chain0>());
}

BOOST_AUTO_TEST_CASE(test_depth_limit) {
    auto config = std::make_shared<ContainerConfig>();
    config->max_resolution_depth = 2;
    Container container(config);

    BOOST_CHECK_THROW(container.resolve<Chain0>(), ConstructionError);
    BOOST_CHECK_NO_THROW(container.resolve<Chain1>());
}

BOOST_AUTO_TEST_CASE(test_invalid_depth_rejected) {
    auto config = std::make_shared<ContainerConfig>();
    config->max_resolution_depth = 0;
    BOOST_CHECK_THROW(Container container(config), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END()
