// tests/di/test_lifetime_scope.cpp
#define BOOST_TEST_MODULE lifetime_scope_tests
#include <boost/test/unit_test.hpp>
#include <memory>
#include <string>

#include "ivy/di/container.hpp"
#include "ivy/di/exceptions.hpp"
#include "ivy/di/lifetime_scope.hpp"

using namespace ivy::di;

struct IUnitOfWork {
    virtual ~IUnitOfWork() = default;
    virtual int id() const = 0;
};

class UnitOfWork : public IUnitOfWork {
public:
    static int next_id;
    static int released;

    UnitOfWork() : id_(++next_id) {}
    ~UnitOfWork() override { ++released; }

    static void reflect(TypeBuilder<UnitOfWork>& type) {
        type.implements<IUnitOfWork>();
    }

    int id() const override { return id_; }

private:
    int id_;
};

int UnitOfWork::next_id = 0;
int UnitOfWork::released = 0;

class OrderHandler {
public:
    explicit OrderHandler(std::shared_ptr<IUnitOfWork> unit_of_work)
        : unit_of_work_(std::move(unit_of_work)) {}

    static void reflect(TypeBuilder<OrderHandler>& type) {
        type.constructor<std::shared_ptr<IUnitOfWork>>({"unitOfWork"});
    }

    std::shared_ptr<IUnitOfWork> unit_of_work_;
};

class InvoiceHandler {
public:
    static void reflect(TypeBuilder<InvoiceHandler>& type) {
        type.inject("unitOfWork", &InvoiceHandler::unit_of_work_);
    }

    std::shared_ptr<IUnitOfWork> unit_of_work_;
};

// =====================================
// Scoped lifetime
// =====================================

BOOST_AUTO_TEST_SUITE(lifetime_scope_suite)

BOOST_AUTO_TEST_CASE(test_scoped_instance_shared_within_scope) {
    Container container;
    container.register_type<IUnitOfWork, UnitOfWork>(ServiceLifetime::SCOPED);

    auto scope = container.begin_scope();
    auto first = scope->resolve<IUnitOfWork>();
    auto second = scope->resolve<IUnitOfWork>();

    BOOST_CHECK_EQUAL(first.get(), second.get());
    BOOST_CHECK_EQUAL(scope->instance_count(), 1);
}

BOOST_AUTO_TEST_CASE(test_scopes_are_isolated) {
    Container container;
    container.register_type<IUnitOfWork, UnitOfWork>(ServiceLifetime::SCOPED);

    auto scope1 = container.begin_scope();
    auto scope2 = container.begin_scope();

    BOOST_CHECK(scope1->resolve<IUnitOfWork>()->id() !=
                scope2->resolve<IUnitOfWork>()->id());
}

BOOST_AUTO_TEST_CASE(test_scoped_outside_scope_fails) {
    Container container;
    container.register_type<IUnitOfWork, UnitOfWork>(ServiceLifetime::SCOPED);

    BOOST_CHECK_THROW(container.resolve<IUnitOfWork>(), LifetimeViolationError);
}

BOOST_AUTO_TEST_CASE(test_dependencies_resolved_in_same_scope) {
    Container container;
    container.register_type<IUnitOfWork, UnitOfWork>(ServiceLifetime::SCOPED);

    auto scope = container.begin_scope();
    auto unit_of_work = scope->resolve<IUnitOfWork>();
    auto order_handler = scope->resolve<OrderHandler>();
    auto invoice_handler = scope->resolve<InvoiceHandler>();

    BOOST_CHECK_EQUAL(order_handler->unit_of_work_.get(), unit_of_work.get());
    BOOST_CHECK_EQUAL(invoice_handler->unit_of_work_.get(), unit_of_work.get());
}

BOOST_AUTO_TEST_CASE(test_factory_callbacks_see_active_scope) {
    Container container;
    container.register_type<IUnitOfWork, UnitOfWork>(ServiceLifetime::SCOPED);
    container.register_factory<OrderHandler>([](Container& c) {
        return std::make_shared<OrderHandler>(c.resolve<IUnitOfWork>());
    });

    auto scope = container.begin_scope();
    auto handler = scope->resolve<OrderHandler>();

    BOOST_CHECK_EQUAL(handler->unit_of_work_.get(),
                      scope->resolve<IUnitOfWork>().get());
}

BOOST_AUTO_TEST_CASE(test_singleton_and_transient_inside_scope) {
    Container container;
    container.register_type<IUnitOfWork, UnitOfWork>(ServiceLifetime::SINGLETON);

    auto scope1 = container.begin_scope();
    auto scope2 = container.begin_scope();

    BOOST_CHECK_EQUAL(scope1->resolve<IUnitOfWork>().get(),
                      scope2->resolve<IUnitOfWork>().get());
    BOOST_CHECK_EQUAL(scope1->instance_count(), 0);
    BOOST_CHECK(scope1->resolve<OrderHandler>().get() !=
                scope1->resolve<OrderHandler>().get());
}

BOOST_AUTO_TEST_CASE(test_scope_releases_instances) {
    Container container;
    container.register_type<IUnitOfWork, UnitOfWork>(ServiceLifetime::SCOPED);
    UnitOfWork::released = 0;

    {
        auto scope = container.begin_scope();
        scope->resolve<IUnitOfWork>();
        BOOST_CHECK_EQUAL(UnitOfWork::released, 0);
    }

    BOOST_CHECK_EQUAL(UnitOfWork::released, 1);
}

BOOST_AUTO_TEST_CASE(test_scope_forwards_registrations) {
    Container container;
    auto scope = container.begin_scope();

    scope->register_type<IUnitOfWork, UnitOfWork>(ServiceLifetime::SCOPED);

    BOOST_CHECK(container.is_registered<IUnitOfWork>());
    BOOST_CHECK(scope->resolve<IUnitOfWork>());
}

BOOST_AUTO_TEST_CASE(test_keyed_scoped_registrations) {
    Container container;
    container.register_type<IUnitOfWork, UnitOfWork>(ServiceLifetime::SCOPED,
                                                     "reporting");
    container.register_type<IUnitOfWork, UnitOfWork>(ServiceLifetime::SCOPED,
                                                     "billing");

    auto scope = container.begin_scope();
    auto reporting = scope->resolve<IUnitOfWork>("reporting");

    BOOST_CHECK_EQUAL(reporting.get(),
                      scope->resolve<IUnitOfWork>("reporting").get());
    BOOST_CHECK(reporting.get() != scope->resolve<IUnitOfWork>("billing").get());
    BOOST_CHECK_EQUAL(scope->resolve_all<IUnitOfWork>().size(), 2);
}

BOOST_AUTO_TEST_SUITE_END()
