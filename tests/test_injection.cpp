#include <catch2/catch_test_macros.hpp>
#include <svcdi.hpp>

#include <memory>
#include <string>
#include <vector>

namespace {

struct ILogger {
    virtual ~ILogger() = default;
    virtual std::string name() const = 0;
};

struct ConsoleLogger : ILogger {
    std::string name() const override { return "console"; }
};

struct IService {
    virtual ~IService() = default;
    virtual int value() const = 0;
};

// Service that depends on ILogger
struct Service : IService {
    std::shared_ptr<ILogger> logger_;
    explicit Service(std::shared_ptr<ILogger> logger) : logger_(std::move(logger)) {}
    int value() const override { return 42; }
};

// Service that tolerates a missing ILogger
struct OptionalService : IService {
    std::shared_ptr<ILogger> logger_;
    explicit OptionalService(std::shared_ptr<ILogger> logger) : logger_(std::move(logger)) {}
    int value() const override { return logger_ ? 1 : 0; }
};

} // namespace

TEST_CASE("inject exactly_one dep via deps<>", "[injection]") {
    svcdi::registry reg;
    reg.add(svcdi::singleton<ILogger, ConsoleLogger>());
    reg.add(svcdi::singleton<IService, Service>(svcdi::deps<ILogger>));
    auto p = reg.build();

    auto svc = p->get_required<IService>();
    REQUIRE(svc->value() == 42);
}

TEST_CASE("explicit exactly_one tag matches bare type", "[injection]") {
    svcdi::registry reg;
    reg.add(svcdi::singleton<ILogger, ConsoleLogger>());
    reg.add(svcdi::transient<IService, Service>(svcdi::deps<svcdi::exactly_one<ILogger>>));
    auto p = reg.build();

    auto s = std::static_pointer_cast<Service>(p->get_required<IService>());
    REQUIRE(s->logger_.get() == p->get<ILogger>().get());
    REQUIRE(reg.descriptors()[1].dependencies()[0].card == svcdi::cardinality::exactly_one);
}

TEST_CASE("inject transient dep into transient impl", "[injection]") {
    svcdi::registry reg;
    reg.add(svcdi::transient<ILogger, ConsoleLogger>());
    reg.add(svcdi::transient<IService, Service>(svcdi::deps<ILogger>));
    auto p = reg.build();

    auto a = std::static_pointer_cast<Service>(p->get_required<IService>());
    auto b = std::static_pointer_cast<Service>(p->get_required<IService>());
    REQUIRE(a.get() != b.get());
    REQUIRE(a->logger_.get() != b->logger_.get());
}

TEST_CASE("zero_or_one injects nullptr when absent", "[injection]") {
    svcdi::registry reg;
    reg.add(svcdi::singleton<IService, OptionalService>(svcdi::deps<svcdi::zero_or_one<ILogger>>));
    auto p = reg.build();

    REQUIRE(p->get_required<IService>()->value() == 0);
}

TEST_CASE("zero_or_one injects the instance when present", "[injection]") {
    svcdi::registry reg;
    reg.add(svcdi::singleton<ILogger, ConsoleLogger>());
    reg.add(svcdi::singleton<IService, OptionalService>(svcdi::deps<svcdi::zero_or_one<ILogger>>));
    auto p = reg.build();

    REQUIRE(p->get_required<IService>()->value() == 1);
}

TEST_CASE("multi-dep injection", "[injection]") {
    struct IRepo {
        virtual ~IRepo() = default;
    };
    struct Repo : IRepo {};

    struct IApp {
        virtual ~IApp() = default;
        virtual int val() const = 0;
    };
    struct App : IApp {
        App(std::shared_ptr<ILogger> l, std::shared_ptr<IRepo> r,
            std::vector<std::shared_ptr<ILogger>> all)
            : count(static_cast<int>(all.size()) + (l ? 1 : 0) + (r ? 1 : 0)) {}
        int val() const override { return count; }
        int count;
    };

    svcdi::registry reg;
    reg.add(svcdi::singleton<ILogger, ConsoleLogger>());
    reg.add(svcdi::singleton<ILogger, ConsoleLogger>());
    reg.add(svcdi::scoped<IRepo, Repo>());
    reg.add(svcdi::scoped<IApp, App>(
        svcdi::deps<ILogger, IRepo, svcdi::zero_or_more<ILogger>>));
    auto p = reg.build();

    auto scope = p->create_scope();
    REQUIRE(scope->get_required<IApp>()->val() == 4);
}

TEST_CASE("scoped dependency injected from the resolving scope", "[injection]") {
    struct IUnit {
        virtual ~IUnit() = default;
    };
    struct Unit : IUnit {};
    struct Worker {
        explicit Worker(std::shared_ptr<IUnit> u) : unit(std::move(u)) {}
        std::shared_ptr<IUnit> unit;
    };

    svcdi::registry reg;
    reg.add(svcdi::scoped<IUnit, Unit>());
    reg.add(svcdi::transient<Worker>(svcdi::deps<IUnit>));
    auto p = reg.build();

    auto s1 = p->create_scope();
    auto s2 = p->create_scope();
    REQUIRE(s1->get<Worker>()->unit.get() == s1->get<IUnit>().get());
    REQUIRE(s1->get<Worker>()->unit.get() != s2->get<Worker>()->unit.get());
}

TEST_CASE("from_factory declared deps take part in validation", "[injection]") {
    svcdi::registry reg;
    reg.add(svcdi::from_factory<IService>(svcdi::lifetime_kind::singleton,
        [](svcdi::provider& p) {
            return std::make_shared<Service>(p.get_required<ILogger>());
        },
        svcdi::deps<ILogger>));

    REQUIRE_THROWS_AS(reg.build(), svcdi::validation_error);
}

namespace {

// Holds the resolving provider and looks ILogger up on demand.
struct LoggerLocator {
    std::shared_ptr<svcdi::provider> services;
    explicit LoggerLocator(std::shared_ptr<svcdi::provider> p) : services(std::move(p)) {}

    std::shared_ptr<ILogger> logger() const { return services->get_required<ILogger>(); }
};

// Same, but every lookup runs in a fresh scope.
struct ScopedLoggerLocator {
    std::shared_ptr<svcdi::provider> services;
    explicit ScopedLoggerLocator(std::shared_ptr<svcdi::provider> p) : services(std::move(p)) {}

    std::shared_ptr<ILogger> logger() const {
        auto unit = services->create_scope();
        return unit->get_required<ILogger>();
    }
};

} // namespace

TEST_CASE("provider_ref injects the provider and sees the same singleton", "[injection]") {
    svcdi::registry reg;
    reg.add(svcdi::singleton<ILogger, ConsoleLogger>());
    reg.add(svcdi::transient<LoggerLocator>(svcdi::deps<svcdi::provider_ref>));
    auto p = reg.build();

    auto locator = p->get_required<LoggerLocator>();
    REQUIRE(locator->services == p);
    REQUIRE(locator->logger() == p->get_required<ILogger>());
}

TEST_CASE("provider_ref lookups in a new scope get a different scoped instance", "[injection]") {
    svcdi::registry reg;
    reg.add(svcdi::scoped<ILogger, ConsoleLogger>());
    reg.add(svcdi::transient<ScopedLoggerLocator>(svcdi::deps<svcdi::provider_ref>));
    auto p = reg.build();

    auto locator = p->get_required<ScopedLoggerLocator>();
    auto from_locator = locator->logger();
    REQUIRE(from_locator != nullptr);
    REQUIRE(from_locator != p->get_required<ILogger>());
}

TEST_CASE("provider_ref inside a scope is that scope's provider", "[injection]") {
    svcdi::registry reg;
    reg.add(svcdi::scoped<ILogger, ConsoleLogger>());
    reg.add(svcdi::scoped<LoggerLocator>(svcdi::deps<svcdi::provider_ref>));
    auto p = reg.build();

    auto unit = p->create_scope();
    auto locator = unit->get_required<LoggerLocator>();
    REQUIRE_FALSE(locator->services->is_root());
    REQUIRE(locator->logger() == unit->get_required<ILogger>());
    REQUIRE(locator->logger() != p->get_required<ILogger>());
}

TEST_CASE("provider_ref is not recorded as a dependency", "[injection]") {
    auto desc = svcdi::transient<LoggerLocator>(svcdi::deps<svcdi::provider_ref>);
    REQUIRE(desc.dependencies().empty());

    svcdi::registry reg;
    reg.add(std::move(desc));
    REQUIRE_NOTHROW(reg.build());
}
