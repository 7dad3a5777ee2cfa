/**
 * @file test_component.cpp
 * @brief Unit tests for Component: state installation, the life-cycle hooks and error routing.
 */

#include <catch2/catch_test_macros.hpp>

#include "../reactive_fixture.h"

#include <reactive/types/array.h>
#include <reactive/types/observer.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

using namespace reactive;
using reactive::test::ReactiveFixture;

namespace {
    ComponentOptions named(std::string name, Component *parent = nullptr) {
        ComponentOptions options;
        options.name = std::move(name);
        options.parent = parent;
        return options;
    }

    ComponentOptions::hook_type record(std::vector<std::string> &events, std::string event) {
        return [&events, event = std::move(event)](Component &) { events.push_back(event); };
    }
} // namespace

// ============================================================================
// Props, data, computed and watch
// ============================================================================

TEST_CASE_METHOD(ReactiveFixture, "Component - installs props, data, computed then watch", "[component]") {
    Value immediate;
    ComponentOptions options;
    options.props = {
        {"count", PropOptions{Value{2}}},
        {"items", PropOptions{std::nullopt, [](Component &) { return make_array({1}); }}},
        {"given", PropOptions{Value{0}}},
    };
    options.props_data = Object::make({{"given", 7}});
    options.data = [](Component &c) { return make_object({{"doubled", c.get("count").as_number() * 2}}); };
    options.computed.emplace_back("total", ComputedOptions{[](Component &c) {
        return Value{c.get("doubled").as_number() + c.get("given").as_number()};
    }});
    options.watch.emplace_back(
        "total", std::vector<WatchHandler>{
                     {[&immediate](const Value &n, const Value &) { immediate = n; }, WatchOptions{.immediate = true}}});

    Component vm{std::move(options)};
    initialise_component(vm);

    CHECK(same_value(vm.get("count"), Value{2}));
    CHECK(same_value(vm.get("given"), Value{7}));
    CHECK(same_value(vm.get("doubled"), Value{4}));
    CHECK(same_value(vm.get("total"), Value{11}));
    CHECK(same_value(immediate, Value{11}));
    CHECK(vm.get("missing").is_undefined());
    CHECK(vm.props()->is_reactive("count"));
    CHECK(vm.data()->is_reactive("doubled"));

    auto items = vm.get("items");
    REQUIRE(items.is_array());
    CHECK(items.as_array()->observer() != nullptr);

    vm.set("given", 10);
    flush();
    CHECK(same_value(immediate, Value{14}));
}

TEST_CASE_METHOD(ReactiveFixture, "Component - default factories give each component its own instance", "[component]") {
    auto options = [] {
        ComponentOptions o;
        o.props = {{"items", PropOptions{std::nullopt, [](Component &) { return make_array(); }}}};
        return o;
    };
    Component first{options()};
    Component second{options()};
    initialise_component(first);
    initialise_component(second);
    CHECK(first.get("items").as_array() != second.get("items").as_array());
}

TEST_CASE_METHOD(ReactiveFixture, "Component - mutating a prop of a child warns, updates from the parent do not", "[component]") {
    Component parent;
    initialise_component(parent);

    auto child_options = named("child", &parent);
    child_options.props = {{"x", PropOptions{Value{1}}}};
    Component child{std::move(child_options)};
    initialise_component(child);

    Value seen;
    child.watch("x", [&seen](const Value &n, const Value &) { seen = n; });

    child.set("x", 2);
    CHECK(warned("Avoid mutating a prop directly"));
    CHECK(warned("Prop being mutated: \"x\""));

    warnings.clear();
    child.update_props({{"x", 3}, {"unknown", 4}});
    CHECK(warnings.empty());
    CHECK(same_value(child.get("x"), Value{3}));
    CHECK(child.get("unknown").is_undefined());
    flush();
    CHECK(same_value(seen, Value{3}));
}

TEST_CASE_METHOD(ReactiveFixture, "Component - root props can be assigned without warning", "[component]") {
    ComponentOptions options;
    options.props = {{"x", PropOptions{Value{1}}}};
    Component vm{std::move(options)};
    initialise_component(vm);

    vm.set("x", 5);
    CHECK(warnings.empty());
    CHECK(same_value(vm.get("x"), Value{5}));
}

TEST_CASE_METHOD(ReactiveFixture, "Component - a failing data factory is reported and yields empty data", "[component]") {
    Component vm{test::with_data([](Component &) -> Value { throw std::runtime_error("no data"); })};
    initialise_component(vm);

    CHECK(reported("data()"));
    CHECK(vm.data()->empty());
}

TEST_CASE_METHOD(ReactiveFixture, "Component - data must be an object", "[component]") {
    Component vm{test::with_data([](Component &) { return Value{1}; })};
    initialise_component(vm);

    CHECK(warned("data functions should return an object"));
    CHECK(vm.data()->empty());
    CHECK(vm.data()->observer() != nullptr);
}

TEST_CASE_METHOD(ReactiveFixture, "Component - data keys clashing with props warn", "[component]") {
    auto options = test::with_data([](Component &) { return make_object({{"x", 2}}); });
    options.props = {{"x", PropOptions{Value{1}}}};
    Component vm{std::move(options)};
    initialise_component(vm);

    CHECK(warned("The data property \"x\" is already declared as a prop."));
    CHECK(same_value(vm.get("x"), Value{1}));
}

TEST_CASE_METHOD(ReactiveFixture, "Component - computed properties cache until a dependency changes", "[component]") {
    int evaluations{0};
    auto options = test::with_data([](Component &) { return make_object({{"a", 1}}); });
    options.computed.emplace_back("plus", ComputedOptions{[&evaluations](Component &c) {
        ++evaluations;
        return Value{c.get("a").as_number() + 1};
    }});
    Component vm{std::move(options)};
    initialise_component(vm);

    CHECK(evaluations == 0);
    CHECK(same_value(vm.get("plus"), Value{2}));
    CHECK(same_value(vm.get("plus"), Value{2}));
    CHECK(evaluations == 1);

    vm.set("a", 5);
    CHECK(evaluations == 1);
    CHECK(same_value(vm.get("plus"), Value{6}));
    CHECK(evaluations == 2);
}

TEST_CASE_METHOD(ReactiveFixture, "Component - uncached computed properties evaluate on every read", "[component]") {
    int evaluations{0};
    auto options = test::with_data([](Component &) { return make_object({{"a", 1}}); });
    ComputedOptions computed;
    computed.get = [&evaluations](Component &c) {
        ++evaluations;
        return c.get("a");
    };
    computed.cache = false;
    options.computed.emplace_back("a_copy", std::move(computed));
    Component vm{std::move(options)};
    initialise_component(vm);

    (void)vm.get("a_copy");
    (void)vm.get("a_copy");
    CHECK(evaluations == 2);
}

TEST_CASE_METHOD(ReactiveFixture, "Component - computed setters and their absence", "[component]") {
    auto options = test::with_data([](Component &) { return make_object({{"a", 1}}); });
    options.computed.emplace_back("double", ComputedOptions{
                                                [](Component &c) { return Value{c.get("a").as_number() * 2}; },
                                                [](Component &c, const Value &v) { c.set("a", v.as_number() / 2); },
                                            });
    options.computed.emplace_back("read_only", ComputedOptions{[](Component &c) { return c.get("a"); }});
    Component vm{std::move(options)};
    initialise_component(vm);

    vm.set("double", 10);
    CHECK(same_value(vm.get("a"), Value{5}));
    CHECK(same_value(vm.get("double"), Value{10}));

    vm.set("read_only", 3);
    CHECK(warned("Computed property \"read_only\" was assigned to but it has no setter."));
    CHECK(same_value(vm.get("a"), Value{5}));

    vm.set("nowhere", 3);
    CHECK(warned("Property \"nowhere\" is not defined"));
}

TEST_CASE_METHOD(ReactiveFixture, "Component - computed declaration problems warn", "[component]") {
    auto options = test::with_data([](Component &) { return make_object({{"a", 1}}); });
    options.props = {{"p", PropOptions{Value{1}}}};
    options.computed.emplace_back("nothing", ComputedOptions{});
    options.computed.emplace_back("a", ComputedOptions{[](Component &) { return Value{2}; }});
    options.computed.emplace_back("p", ComputedOptions{[](Component &) { return Value{3}; }});
    Component vm{std::move(options)};
    initialise_component(vm);

    CHECK(warned("Getter is missing for computed property \"nothing\"."));
    CHECK(warned("The computed property \"a\" is already defined in data."));
    CHECK(warned("The computed property \"p\" is already defined as a prop."));
    CHECK(vm.get("nothing").is_undefined());
    CHECK(same_value(vm.get("a"), Value{1}));
    CHECK(same_value(vm.get("p"), Value{1}));
}

TEST_CASE_METHOD(ReactiveFixture, "Component - unwatch cancels a user watch", "[component]") {
    Component vm{test::with_data([](Component &) { return make_object({{"a", 1}}); })};
    initialise_component(vm);

    int runs{0};
    auto unwatch = vm.watch("a", [&runs](const Value &, const Value &) { ++runs; });
    unwatch();
    vm.set("a", 2);
    flush();
    CHECK(runs == 0);
    CHECK(vm.watchers().empty());
    // cancelling twice is harmless
    unwatch();
}

// ============================================================================
// Life-cycle
// ============================================================================

TEST_CASE_METHOD(ReactiveFixture, "Component - mounting renders and updates call the hooks", "[component]") {
    std::vector<std::string> events;
    auto options = test::with_data([](Component &) { return make_object({{"a", 1}}); });
    options.render = [](Component &c) { return Value{c.get("a").as_number() * 10}; };
    options.on(LifecycleHook::MOUNTED, record(events, "mounted"))
        .on(LifecycleHook::BEFORE_UPDATE, record(events, "beforeUpdate"))
        .on(LifecycleHook::UPDATED, record(events, "updated"));
    Component vm{std::move(options)};

    start_component(vm);
    CHECK(vm.is_initialised());
    CHECK(vm.is_mounted());
    REQUIRE(vm.render_watcher() != nullptr);
    CHECK(same_value(vm.rendered(), Value{10}));
    CHECK(events == std::vector<std::string>{"mounted"});

    vm.set("a", 2);
    flush();
    CHECK(same_value(vm.rendered(), Value{20}));
    CHECK(events == std::vector<std::string>{"mounted", "beforeUpdate", "updated"});
}

TEST_CASE_METHOD(ReactiveFixture, "Component - stop deactivates and start reactivates after the flush", "[component]") {
    std::vector<std::string> events;
    auto parent_options = named("parent");
    parent_options.on(LifecycleHook::ACTIVATED, record(events, "parent:activated"))
        .on(LifecycleHook::DEACTIVATED, record(events, "parent:deactivated"));
    Component parent{std::move(parent_options)};
    start_component(parent);

    auto child_options = named("child", &parent);
    child_options.on(LifecycleHook::ACTIVATED, record(events, "child:activated"))
        .on(LifecycleHook::DEACTIVATED, record(events, "child:deactivated"));
    Component child{std::move(child_options)};
    start_component(child);

    stop_component(parent);
    CHECK(parent.is_inactive());
    CHECK(child.is_inactive());
    CHECK(events == std::vector<std::string>{"child:deactivated", "parent:deactivated"});

    events.clear();
    start_component(parent);
    CHECK(events.empty());
    flush();
    CHECK_FALSE(parent.is_inactive());
    CHECK_FALSE(child.is_inactive());
    CHECK(events == std::vector<std::string>{"child:activated", "parent:activated"});
}

TEST_CASE_METHOD(ReactiveFixture, "Component - dispose tears down every watcher and its children", "[component]") {
    std::vector<std::string> events;
    auto options = test::with_data([](Component &) { return make_object({{"a", 1}}); });
    options.name = "root";
    options.render = [](Component &c) { return c.get("a"); };
    options.on(LifecycleHook::BEFORE_DESTROY, record(events, "beforeDestroy"))
        .on(LifecycleHook::DESTROYED, record(events, "destroyed"));
    Component vm{std::move(options)};
    start_component(vm);

    int runs{0};
    vm.watch("a", [&runs](const Value &, const Value &) { ++runs; });

    auto child_options = named("child", &vm);
    child_options.on(LifecycleHook::DESTROYED, record(events, "child:destroyed"));
    Component child{std::move(child_options)};
    start_component(child);

    REQUIRE(vm.data()->observer() != nullptr);
    CHECK(vm.data()->observer()->vm_count() == 1);

    dispose_component(vm);
    CHECK(vm.is_destroyed());
    CHECK(child.is_destroyed());
    CHECK(vm.data()->observer()->vm_count() == 0);
    CHECK(std::none_of(vm.watchers().begin(), vm.watchers().end(), [](const auto &w) { return w->is_active(); }));
    CHECK(events == std::vector<std::string>{"beforeDestroy", "child:destroyed", "destroyed"});

    vm.set("a", 2);
    flush();
    CHECK(runs == 0);
    CHECK(same_value(vm.rendered(), Value{1}));

    // disposing twice is a no-op
    dispose_component(vm);
    CHECK(events.size() == 3);
}

TEST_CASE_METHOD(ReactiveFixture, "Component - a disposed child leaves its parent", "[component]") {
    Component parent;
    start_component(parent);
    Component child{named("child", &parent)};
    start_component(child);
    REQUIRE(parent.children().size() == 1);

    dispose_component(child);
    CHECK(parent.children().empty());
    CHECK(child.parent() == nullptr);
}

// ============================================================================
// Error routing
// ============================================================================

TEST_CASE_METHOD(ReactiveFixture, "Component - hook failures are reported with the hook name", "[component]") {
    ComponentOptions options;
    options.on(LifecycleHook::MOUNTED, [](Component &) { throw std::runtime_error("hook failure"); });
    bool second_ran{false};
    options.on(LifecycleHook::MOUNTED, [&second_ran](Component &) { second_ran = true; });
    Component vm{std::move(options)};
    start_component(vm);

    CHECK(reported("mounted hook"));
    CHECK(second_ran);
    CHECK(vm.is_mounted());
}

TEST_CASE_METHOD(ReactiveFixture, "Component - render failures keep the previous result", "[component]") {
    auto options = test::with_data([](Component &) { return make_object({{"a", 0}}); });
    options.render = [](Component &c) -> Value {
        if (c.get("a").as_number() > 0) { throw std::runtime_error("render failure"); }
        return Value{"ok"};
    };
    Component vm{std::move(options)};
    start_component(vm);

    vm.set("a", 1);
    flush();
    CHECK(reported("render"));
    CHECK(same_value(vm.rendered(), Value{"ok"}));
}

TEST_CASE_METHOD(ReactiveFixture, "Component - error_captured on an ancestor can stop propagation", "[component]") {
    std::vector<std::string> captured;
    bool propagate{false};

    ComponentOptions parent_options;
    parent_options.error_captured.emplace_back(
        [&](const std::exception &error, Component &source, std::string_view info) {
            captured.push_back(fmt::format("{}:{}:{}", error.what(), source.name(), info));
            return propagate;
        });
    Component parent{std::move(parent_options)};
    start_component(parent);

    auto child_options = named("child", &parent);
    child_options.on(LifecycleHook::MOUNTED, [](Component &) { throw std::runtime_error("boom"); });

    SECTION("stopped") {
        Component child{std::move(child_options)};
        start_component(child);
        CHECK(captured == std::vector<std::string>{"boom:child:mounted hook"});
        CHECK(errors.empty());
    }

    SECTION("propagated") {
        propagate = true;
        Component child{std::move(child_options)};
        start_component(child);
        CHECK(captured.size() == 1);
        REQUIRE(errors.size() == 1);
        CHECK(errors[0].info == "mounted hook");
        CHECK(errors[0].vm == &child);
    }
}

TEST_CASE_METHOD(ReactiveFixture, "Component - a failing error_captured hook is reported as well", "[component]") {
    ComponentOptions parent_options;
    parent_options.error_captured.emplace_back(
        [](const std::exception &, Component &, std::string_view) -> bool {
            throw std::runtime_error("capture failure");
        });
    Component parent{std::move(parent_options)};
    start_component(parent);

    auto child_options = named("child", &parent);
    child_options.on(LifecycleHook::MOUNTED, [](Component &) { throw std::runtime_error("boom"); });
    Component child{std::move(child_options)};
    start_component(child);

    CHECK(reported("errorCaptured hook"));
    CHECK(reported("mounted hook"));
}

// ============================================================================
// Diagnostics
// ============================================================================

TEST_CASE_METHOD(ReactiveFixture, "Component - warnings carry the component trace", "[component]") {
    Component root;
    Component item{named("list-item", &root)};
    Component nested{named("list-item", &item)};
    Component anonymous{named("", &root)};

    CHECK(format_component_name(nullptr) == "<Anonymous>");
    CHECK(format_component_name(&root) == "<Root>");
    CHECK(format_component_name(&item) == "<ListItem>");
    CHECK(format_component_name(&anonymous) == "<Anonymous>");

    CHECK(generate_component_trace(nullptr).empty());
    CHECK(generate_component_trace(&root) == "\n\n(found in <Root>)");
    CHECK(generate_component_trace(&item) == "\n\nfound in\n\n---> <ListItem>\n       <Root>");
    CHECK(generate_component_trace(&nested) == "\n\nfound in\n\n---> <ListItem>... (2 recursive calls)\n       <Root>");

    warn("something odd", &item);
    REQUIRE(traces.size() == 1);
    CHECK(traces[0].find("---> <ListItem>") != std::string::npos);
}
