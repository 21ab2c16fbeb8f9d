#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "ivy/config/config.hpp"
#include "ivy/di/di.hpp"
#include "ivy/log/logger.hpp"

using namespace ivy::di;

namespace app {

struct Order {};
struct Customer {};

struct IClock {
    virtual ~IClock() = default;
    virtual std::string now() const = 0;
};

class FixedClock : public IClock {
public:
    static void reflect(TypeBuilder<FixedClock>& type) {
        type.implements<IClock>();
    }
    std::string now() const override { return "2024-01-01T00:00:00Z"; }
};

template <typename T>
struct IRepository {
    virtual ~IRepository() = default;
    virtual size_t count() const = 0;
};

template <typename T>
class InMemoryRepository : public IRepository<T> {
public:
    static void reflect(TypeBuilder<InMemoryRepository>& type) {
        type.template implements<IRepository<T>>();
    }
    size_t count() const override { return 0; }
};

struct INotifier {
    virtual ~INotifier() = default;
    virtual std::string channel() const = 0;
};

class EmailNotifier : public INotifier {
public:
    static void reflect(TypeBuilder<EmailNotifier>& type) {
        type.implements<INotifier>();
    }
    std::string channel() const override { return "email"; }
};

class SmsNotifier : public INotifier {
public:
    static void reflect(TypeBuilder<SmsNotifier>& type) {
        type.implements<INotifier>();
    }
    std::string channel() const override { return "sms"; }
};

class RequestContext {
public:
    RequestContext() : id_(++next_id_) {}
    int id() const { return id_; }

private:
    static inline int next_id_ = 0;
    int id_;
};

class OrderService {
public:
    OrderService(std::shared_ptr<IRepository<Order>> orders,
                 std::shared_ptr<IClock> clock, std::string region)
        : orders_(std::move(orders)),
          clock_(std::move(clock)),
          region_(std::move(region)) {}

    static void reflect(TypeBuilder<OrderService>& type) {
        type.constructor<std::shared_ptr<IRepository<Order>>,
                         std::shared_ptr<IClock>, std::string>(
                {"orders", "clock", "region"})
            .inject("notifiers", &OrderService::notifiers_)
            .inject("request", &OrderService::request_);
    }

    void describe() const {
        IVY_LOG_INFO << "OrderService in region '" << region_ << "' at "
                     << clock_->now() << ", " << orders_->count()
                     << " orders, request " << request_->id() << ", "
                     << notifiers_.size() << " notifiers";
    }

private:
    std::shared_ptr<IRepository<Order>> orders_;
    std::shared_ptr<IClock> clock_;
    std::string region_;
    std::vector<std::shared_ptr<INotifier>> notifiers_;
    std::shared_ptr<RequestContext> request_;
};

class InfrastructureModule : public Module {
public:
    std::string name() const override { return "infrastructure"; }

    void load(Container& container) override {
        container.register_type<IClock, FixedClock>(ServiceLifetime::SINGLETON);
        container.register_open_generic<IRepository, InMemoryRepository>(
            ServiceLifetime::SINGLETON);
        container.register_type<RequestContext>(ServiceLifetime::SCOPED);
    }
};

class NotificationModule : public Module {
public:
    std::string name() const override { return "notifications"; }

    std::vector<std::string> depends_on() const override {
        return {"infrastructure"};
    }

    void load(Container& container) override {
        container.register_assembly_types(type_list<EmailNotifier>());
        container.register_type<INotifier, SmsNotifier>(
            ServiceLifetime::TRANSIENT, "sms");
    }
};

}  // namespace app

IVY_GENERIC_IMPLEMENTATIONS(app::IRepository, app::InMemoryRepository)

int main(int argc, char* argv[]) {
    std::string config_file =
        argc > 1 ? argv[1] : ivy::config::ConfigPaths::DEFAULT_CONFIG_FILE;

    auto& config_manager = ivy::config::ConfigManager::instance();
    auto log_config = std::make_shared<ivy::log::LogConfig>();
    auto container_config = std::make_shared<ContainerConfig>();
    config_manager.register_configuration_properties(log_config);
    config_manager.register_configuration_properties(container_config);

    try {
        if (std::filesystem::exists(config_file)) {
            config_manager.load_config(config_file);
        }
        ivy::log::Logger::init(*log_config);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load configuration: " << e.what() << std::endl;
        return 1;
    }

    try {
        Container container(container_config);

        ModuleManager modules;
        modules.register_module(std::make_unique<app::NotificationModule>());
        modules.register_module(std::make_unique<app::InfrastructureModule>());
        modules.load_all(container);

        for (int request = 0; request < 2; ++request) {
            auto scope = container.begin_scope();
            auto service = scope->resolve<app::OrderService>(
                ParameterOverrides{{"region", std::string("eu-west")}});
            service->describe();
        }
    } catch (const DiError& e) {
        IVY_LOG_FATAL << "Bootstrap failed: " << e.what();
        ivy::log::Logger::shutdown();
        return 1;
    }

    ivy::log::Logger::shutdown();
    return 0;
}
