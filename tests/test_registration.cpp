#include <catch2/catch_test_macros.hpp>
#include <svcdi.hpp>
#include <memory>

using namespace svcdi;

// ---------------------------------------------------------------
// Test interfaces
// ---------------------------------------------------------------

namespace {

struct IPlugin {
    virtual ~IPlugin() = default;
    virtual int id() const = 0;
};

struct PluginA : IPlugin {
    int id() const override { return 1; }
};

struct PluginB : IPlugin {
    int id() const override { return 2; }
};

struct IOther {
    virtual ~IOther() = default;
};

struct OtherImpl : IOther {};

} // namespace

// ---------------------------------------------------------------
// add / try_add / try_add_to_all
// ---------------------------------------------------------------

TEST_CASE("registration: add appends unconditionally", "[registration]") {
    registry reg;
    reg.add(singleton<IPlugin, PluginA>());
    reg.add(singleton<IPlugin, PluginA>());
    reg.add(singleton<IPlugin, PluginB>());

    REQUIRE(reg.size() == 3);
    REQUIRE(reg.count<IPlugin>() == 3);
}

TEST_CASE("registration: add keeps insertion order", "[registration]") {
    registry reg;
    reg.add(singleton<IPlugin, PluginB>())
       .add(transient<IOther, OtherImpl>())
       .add(singleton<IPlugin, PluginA>());

    const auto& descs = reg.descriptors();
    REQUIRE(descs.size() == 3);
    REQUIRE(descs[0].implementation_type() == contract_of<PluginB>());
    REQUIRE(descs[1].service_type() == contract_of<IOther>());
    REQUIRE(descs[2].implementation_type() == contract_of<PluginA>());
}

TEST_CASE("registration: try_add skips an already registered contract", "[registration]") {
    registry reg;
    reg.try_add(singleton<IPlugin, PluginA>());
    reg.try_add(singleton<IPlugin, PluginB>());

    REQUIRE(reg.count<IPlugin>() == 1);
    REQUIRE(reg.descriptors()[0].implementation_type() == contract_of<PluginA>());
}

TEST_CASE("registration: try_add_to_all skips duplicate implementation only", "[registration]") {
    registry reg;
    reg.try_add_to_all(singleton<IPlugin, PluginA>());
    reg.try_add_to_all(singleton<IPlugin, PluginA>());
    reg.try_add_to_all(singleton<IPlugin, PluginB>());

    REQUIRE(reg.count<IPlugin>() == 2);

    auto p = reg.build();
    auto all = p->get_all<IPlugin>();
    REQUIRE(all.size() == 2);
    REQUIRE(all[0]->id() == 1);
    REQUIRE(all[1]->id() == 2);
}

TEST_CASE("registration: try_add_to_all tells factories apart by implementation", "[registration]") {
    registry reg;
    reg.try_add_to_all(from_factory<IPlugin, PluginA>(lifetime_kind::singleton,
        [](provider&) { return std::make_shared<PluginA>(); }));
    reg.try_add_to_all(from_factory<IPlugin, PluginB>(lifetime_kind::singleton,
        [](provider&) { return std::make_shared<PluginB>(); }));
    reg.try_add_to_all(from_factory<IPlugin, PluginB>(lifetime_kind::singleton,
        [](provider&) { return std::make_shared<PluginB>(); }));

    REQUIRE(reg.count<IPlugin>() == 2);
    REQUIRE(reg.descriptors()[0].implementation_type() == contract_of<PluginA>());
    REQUIRE(reg.descriptors()[1].implementation_type() == contract_of<PluginB>());

    auto all = reg.build()->get_all<IPlugin>();
    REQUIRE(all.size() == 2);
    REQUIRE(all[0]->id() == 1);
    REQUIRE(all[1]->id() == 2);
}

TEST_CASE("registration: from_factory without an implementation records the contract", "[registration]") {
    auto desc = from_factory<IPlugin>(lifetime_kind::transient,
        [](provider&) { return std::make_shared<PluginA>(); });
    REQUIRE(desc.implementation_type() == contract_of<IPlugin>());
}

// ---------------------------------------------------------------
// replace / remove_all
// ---------------------------------------------------------------

TEST_CASE("registration: replace drops every previous registration", "[registration]") {
    registry reg;
    reg.add(singleton<IPlugin, PluginA>());
    reg.add(singleton<IPlugin, PluginA>());
    reg.add(transient<IOther, OtherImpl>());
    reg.replace(singleton<IPlugin, PluginB>());

    REQUIRE(reg.count<IPlugin>() == 1);
    REQUIRE(reg.count<IOther>() == 1);

    auto p = reg.build();
    REQUIRE(p->get_required<IPlugin>()->id() == 2);
}

TEST_CASE("registration: remove_all leaves other contracts untouched", "[registration]") {
    registry reg;
    reg.add(singleton<IPlugin, PluginA>());
    reg.add(transient<IOther, OtherImpl>());
    reg.add(singleton<IPlugin, PluginB>());
    reg.remove_all<IPlugin>();

    REQUIRE(reg.size() == 1);
    REQUIRE_FALSE(reg.contains(contract_of<IPlugin>()));
    REQUIRE(reg.contains(contract_of<IOther>()));
}

TEST_CASE("registration: remove_all on unknown contract is a no-op", "[registration]") {
    registry reg;
    reg.add(transient<IOther, OtherImpl>());
    reg.remove_all<IPlugin>();
    REQUIRE(reg.size() == 1);
}

// ---------------------------------------------------------------
// descriptor construction
// ---------------------------------------------------------------

TEST_CASE("registration: descriptor rejects an empty factory", "[registration]") {
    REQUIRE_THROWS_AS(
        descriptor(typeid(IPlugin), typeid(PluginA), lifetime_kind::singleton, factory_fn{}),
        di_error);
}

TEST_CASE("registration: describe records lifetime and dependencies", "[registration]") {
    struct Consumer {
        Consumer(std::shared_ptr<IPlugin>, std::vector<std::shared_ptr<IOther>>) {}
    };

    auto d = scoped<Consumer>(deps<IPlugin, zero_or_more<IOther>>);
    REQUIRE(d.lifetime() == lifetime_kind::scoped);
    REQUIRE(d.service_type() == contract_of<Consumer>());
    REQUIRE(d.dependencies().size() == 2);
    REQUIRE(d.dependencies()[0] == dependency_info{contract_of<IPlugin>(), cardinality::exactly_one});
    REQUIRE(d.dependencies()[1] == dependency_info{contract_of<IOther>(), cardinality::zero_or_more});
}

TEST_CASE("registration: registration location points at the caller", "[registration]") {
    auto d = singleton<IPlugin, PluginA>();
    std::string file = d.registration_location().file_name();
    REQUIRE(file.find("test_registration") != std::string::npos);
}

// ---------------------------------------------------------------
// build-once
// ---------------------------------------------------------------

TEST_CASE("registration: mutation after build throws", "[registration]") {
    registry reg;
    reg.add(singleton<IPlugin, PluginA>());
    auto p = reg.build();

    REQUIRE_THROWS_AS(reg.add(singleton<IPlugin, PluginB>()), di_error);
    REQUIRE_THROWS_AS(reg.replace(singleton<IPlugin, PluginB>()), di_error);
    REQUIRE_THROWS_AS(reg.remove_all<IPlugin>(), di_error);
    // inspection still works
    REQUIRE(reg.count<IPlugin>() == 1);
}

TEST_CASE("registration: second build throws", "[registration]") {
    registry reg;
    auto p = reg.build();
    REQUIRE(p != nullptr);
    REQUIRE_THROWS_AS(reg.build(), di_error);
}

TEST_CASE("registration: failed build leaves registry mutable", "[registration]") {
    struct Needy {
        explicit Needy(std::shared_ptr<IOther>) {}
    };

    registry reg;
    reg.add(singleton<Needy>(deps<IOther>));
    REQUIRE_THROWS_AS(reg.build(), validation_error);

    reg.add(singleton<IOther, OtherImpl>());
    auto p = reg.build();
    REQUIRE(p->get<Needy>() != nullptr);
}
