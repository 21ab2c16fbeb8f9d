// tests/di/test_open_generic.cpp
#define BOOST_TEST_MODULE open_generic_tests
#include <boost/test/unit_test.hpp>
#include <memory>
#include <string>

#include "ivy/di/container.hpp"
#include "ivy/di/exceptions.hpp"

using namespace ivy::di;

namespace shop {

struct Customer {};
struct Order {};

struct IAuditLog {
    virtual ~IAuditLog() = default;
    virtual std::string channel() const = 0;
};

class MemoryAuditLog : public IAuditLog {
public:
    static void reflect(TypeBuilder<MemoryAuditLog>& type) {
        type.implements<IAuditLog>();
    }
    std::string channel() const override { return "memory"; }
};

template <typename T>
struct IRepository {
    virtual ~IRepository() = default;
    virtual std::shared_ptr<IAuditLog> audit() const = 0;
};

template <typename T>
class Repository : public IRepository<T> {
public:
    explicit Repository(std::shared_ptr<IAuditLog> audit)
        : audit_(std::move(audit)) {}

    static void reflect(TypeBuilder<Repository>& type) {
        type.template implements<IRepository<T>>()
            .template constructor<std::shared_ptr<IAuditLog>>({"audit"});
    }

    std::shared_ptr<IAuditLog> audit() const override { return audit_; }

private:
    std::shared_ptr<IAuditLog> audit_;
};

template <typename T>
struct IMapper {
    virtual ~IMapper() = default;
    virtual std::string target() const = 0;
};

template <typename T>
class Mapper : public IMapper<T> {
public:
    static void reflect(TypeBuilder<Mapper>& type) {
        type.template implements<IMapper<T>>();
    }

    std::string target() const override { return "mapped"; }
};

template <typename T>
class Validator {};

template <typename T>
struct IStore {
    virtual ~IStore() = default;
    virtual char kind() const = 0;
};

template <typename T>
class PrimaryStore : public IStore<T> {
public:
    static void reflect(TypeBuilder<PrimaryStore>& type) {
        type.template implements<IStore<T>>();
    }
    char kind() const override { return 'A'; }
};

template <typename T>
class ReplicaStore : public IStore<T> {
public:
    static void reflect(TypeBuilder<ReplicaStore>& type) {
        type.template implements<IStore<T>>();
    }
    char kind() const override { return 'B'; }
};

template <typename T>
class ArchiveStore : public IStore<T> {
public:
    static void reflect(TypeBuilder<ArchiveStore>& type) {
        type.template implements<IStore<T>>();
    }
    char kind() const override { return 'C'; }
};

template <typename T>
class Catalog {
public:
    virtual ~Catalog() = default;
    virtual std::string kind() const { return "plain"; }
};

template <typename T>
class SpecialCatalog : public Catalog<T> {
public:
    static void reflect(TypeBuilder<SpecialCatalog>& type) {
        type.template implements<Catalog<T>>();
    }
    std::string kind() const override { return "special"; }
};

}  // namespace shop

IVY_GENERIC_IMPLEMENTATIONS(shop::IRepository, shop::Repository)
IVY_GENERIC_IMPLEMENTATIONS(shop::IStore, shop::PrimaryStore,
                            shop::ReplicaStore, shop::ArchiveStore)
IVY_GENERIC_IMPLEMENTATIONS(shop::Catalog, shop::SpecialCatalog)

using namespace shop;

BOOST_AUTO_TEST_SUITE(open_generic_suite)

BOOST_AUTO_TEST_CASE(test_resolve_closed_service) {
    Container container;
    container.register_type<IAuditLog, MemoryAuditLog>();
    container.register_open_generic<IRepository, Repository>();

    auto repository = container.resolve<IRepository<Customer>>();

    BOOST_REQUIRE(repository);
    BOOST_CHECK(dynamic_cast<Repository<Customer>*>(repository.get()) != nullptr);
    BOOST_CHECK_EQUAL(repository->audit()->channel(), "memory");
    BOOST_CHECK(container.is_registered<IRepository<Customer>>());
}

BOOST_AUTO_TEST_CASE(test_lifetime_preserved_per_closed_service) {
    Container container;
    container.register_type<IAuditLog, MemoryAuditLog>();
    container.register_open_generic<IRepository, Repository>(
        ServiceLifetime::SINGLETON);

    auto customers = container.resolve<IRepository<Customer>>();
    auto orders = container.resolve<IRepository<Order>>();

    BOOST_CHECK_EQUAL(customers.get(),
                      container.resolve<IRepository<Customer>>().get());
    BOOST_CHECK_EQUAL(orders.get(), container.resolve<IRepository<Order>>().get());
    BOOST_CHECK(static_cast<void*>(customers.get()) !=
                static_cast<void*>(orders.get()));
}

BOOST_AUTO_TEST_CASE(test_reregistering_open_generic_resets_closed_cache) {
    Container container;
    container.register_type<IAuditLog, MemoryAuditLog>();
    container.register_open_generic<IRepository, Repository>(
        ServiceLifetime::SINGLETON);
    auto before = container.resolve<IRepository<Order>>();

    container.register_open_generic<IRepository, Repository>(
        ServiceLifetime::SINGLETON);
    auto after = container.resolve<IRepository<Order>>();

    BOOST_CHECK(before.get() != after.get());
}

BOOST_AUTO_TEST_CASE(test_last_open_generic_registration_wins) {
    Container container;
    for (int i = 0; i < 50; ++i) {
        container.register_open_generic<IStore, PrimaryStore>();
        BOOST_REQUIRE_EQUAL(container.resolve<IStore<Order>>()->kind(), 'A');

        container.register_open_generic<IStore, ReplicaStore>();
        container.register_open_generic<IStore, ArchiveStore>();
        BOOST_REQUIRE_EQUAL(container.resolve<IStore<Order>>()->kind(), 'C');
        BOOST_REQUIRE_EQUAL(container.resolve<IStore<Customer>>()->kind(), 'C');
    }
}

BOOST_AUTO_TEST_CASE(test_open_generic_replaces_implicit_instance) {
    Container container;
    BOOST_CHECK_EQUAL(container.resolve<Catalog<Order>>()->kind(), "plain");

    container.register_open_generic<Catalog, SpecialCatalog>();

    BOOST_CHECK_EQUAL(container.resolve<Catalog<Order>>()->kind(), "special");
    BOOST_CHECK_EQUAL(container.resolve<Catalog<Customer>>()->kind(),
                      "special");
}

BOOST_AUTO_TEST_CASE(test_closed_registration_takes_precedence) {
    Container container;
    container.register_type<IAuditLog, MemoryAuditLog>();
    container.register_open_generic<IRepository, Repository>();
    auto repository = std::make_shared<Repository<Order>>(nullptr);
    container.register_instance<IRepository<Order>>(repository);

    BOOST_CHECK_EQUAL(container.resolve<IRepository<Order>>().get(),
                      static_cast<IRepository<Order>*>(repository.get()));
}

BOOST_AUTO_TEST_CASE(test_undescribed_implementation_fails) {
    Container container;
    container.register_open_generic<IMapper, Mapper>();

    BOOST_CHECK(!container.is_registered<IMapper<Order>>());
    BOOST_CHECK_THROW(container.resolve<IMapper<Order>>(), NotRegisteredError);

    reflect_types<Mapper<Order>>();
    BOOST_CHECK(container.is_registered<IMapper<Order>>());
    BOOST_CHECK_EQUAL(container.resolve<IMapper<Order>>()->target(), "mapped");
}

BOOST_AUTO_TEST_CASE(test_unregistered_generic_service_fails) {
    Container container;
    BOOST_CHECK_THROW(container.resolve<IMapper<Customer>>(), NotRegisteredError);
}

BOOST_AUTO_TEST_CASE(test_generic_mismatch_rejected) {
    Container container;

    BOOST_CHECK_THROW(container.register_type(generic_definition_of<IRepository>(),
                                              type_of<MemoryAuditLog>()),
                      ConfigurationError);
    BOOST_CHECK_THROW(container.register_type(type_of<IAuditLog>(),
                                              generic_definition_of<Repository>()),
                      ConfigurationError);
}

BOOST_AUTO_TEST_CASE(test_open_generic_needs_implementation_type) {
    Container container;
    Factory factory = [](Container&) { return std::make_shared<int>(0); };

    BOOST_CHECK_THROW(container.register_factory(
                          generic_definition_of<IRepository>(), factory),
                      ConfigurationError);
    BOOST_CHECK_THROW(
        container.register_type(generic_definition_of<IRepository>(),
                                generic_definition_of<Repository>(),
                                ServiceLifetime::TRANSIENT, "keyed"),
        ConfigurationError);
}

BOOST_AUTO_TEST_CASE(test_open_generic_cannot_be_resolved_directly) {
    Container container;
    container.register_open_generic<IRepository, Repository>();

    BOOST_CHECK_THROW(container.resolve(generic_definition_of<IRepository>()),
                      ConstructionError);
}

BOOST_AUTO_TEST_CASE(test_implicit_generic_instance) {
    Container container;
    BOOST_CHECK(container.resolve<Validator<Order>>());
}

BOOST_AUTO_TEST_SUITE_END()
