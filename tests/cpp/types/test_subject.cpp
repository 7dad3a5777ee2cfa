/**
 * @file test_subject.cpp
 * @brief Unit tests for Subject and the active-computation stack.
 */

#include <catch2/catch_test_macros.hpp>

#include "../reactive_fixture.h"

#include <reactive/types/subject.h>
#include <reactive/types/watcher.h>

#include <string>
#include <type_traits>
#include <vector>

using namespace reactive;
using reactive::test::ReactiveFixture;

namespace {
    // Computed watchers do not evaluate on construction, which makes them inert subscribers
    watcher_s_ptr inert_watcher(Component &vm) {
        WatcherOptions options;
        options.computed = true;
        return Watcher::create(vm, [](Component &) { return Value{}; }, {}, options);
    }
} // namespace

TEST_CASE_METHOD(ReactiveFixture, "Subject - ids increase monotonically", "[subject]") {
    auto first = Subject::make();
    auto second = Subject::make();
    CHECK(second->id() > first->id());
}

TEST_CASE_METHOD(ReactiveFixture, "Subject - only shared instances can be created", "[subject]") {
    static_assert(!std::is_default_constructible_v<Subject>);
    static_assert(!std::is_copy_constructible_v<Subject>);

    auto subject = Subject::make();
    CHECK_FALSE(subject->weak_from_this().expired());
}

TEST_CASE_METHOD(ReactiveFixture, "Subject - add_sub ignores duplicates and remove_sub ignores absent", "[subject]") {
    Component vm;
    auto w1 = inert_watcher(vm);
    auto w2 = inert_watcher(vm);
    auto subject = Subject::make();

    subject->add_sub(w1.get());
    subject->add_sub(w1.get());
    subject->add_sub(w2.get());
    REQUIRE(subject->size() == 2);
    CHECK(subject->subscribers()[0] == w1.get());
    CHECK(subject->subscribers()[1] == w2.get());

    subject->remove_sub(w1.get());
    subject->remove_sub(w1.get());
    REQUIRE(subject->size() == 1);
    CHECK(subject->subscribers()[0] == w2.get());
}

TEST_CASE_METHOD(ReactiveFixture, "Subject - depend without an active computation is a no-op", "[subject]") {
    auto subject = Subject::make();
    subject->depend();
    CHECK_FALSE(subject->has_subscribers());
}

TEST_CASE_METHOD(ReactiveFixture, "Subject - depend registers the active computation", "[subject]") {
    Component vm;
    auto w = inert_watcher(vm);
    auto subject = Subject::make();
    {
        TargetScope scope{w.get()};
        subject->depend();
        subject->depend();
    }
    REQUIRE(subject->size() == 1);
    CHECK(subject->subscribers()[0] == w.get());
    CHECK(current_target() == nullptr);
}

TEST_CASE_METHOD(ReactiveFixture, "Subject - depend under a null target does not record", "[subject]") {
    Component vm;
    auto w = inert_watcher(vm);
    auto subject = Subject::make();
    {
        TargetScope outer{w.get()};
        TargetScope suspended{nullptr};
        subject->depend();
    }
    CHECK_FALSE(subject->has_subscribers());
}

TEST_CASE_METHOD(ReactiveFixture, "Subject - notify updates subscribers in subscription order", "[subject]") {
    Component vm{test::with_data([](Component &) { return make_object({{"a", 1}}); })};
    initialise_component(vm);

    std::vector<std::string> order;
    vm.watch("a", [&](const Value &, const Value &) { order.emplace_back("first"); }, {.sync = true});
    vm.watch("a", [&](const Value &, const Value &) { order.emplace_back("second"); }, {.sync = true});

    vm.set("a", 2);
    CHECK(order == std::vector<std::string>{"first", "second"});
}

TEST_CASE_METHOD(ReactiveFixture, "Subject - a subscriber torn down during notify is not run", "[subject]") {
    Component vm{test::with_data([](Component &) { return make_object({{"a", 1}}); })};
    initialise_component(vm);

    int second_runs{0};
    Component::unwatch_type unwatch_second;
    vm.watch("a", [&](const Value &, const Value &) { unwatch_second(); }, {.sync = true});
    unwatch_second = vm.watch("a", [&](const Value &, const Value &) { ++second_runs; }, {.sync = true});

    vm.set("a", 2);
    CHECK(second_runs == 0);

    auto &dep = *vm.data()->slot("a")->cell->dep;
    CHECK(dep.size() == 1);
}

TEST_CASE_METHOD(ReactiveFixture, "TargetStack - nested evaluation restores the outer target", "[subject]") {
    Component vm;
    auto outer = inert_watcher(vm);
    auto inner = inert_watcher(vm);

    push_target(outer.get());
    CHECK(current_target() == outer.get());
    push_target(inner.get());
    CHECK(current_target() == inner.get());
    push_target(nullptr);
    CHECK(current_target() == nullptr);
    pop_target();
    CHECK(current_target() == inner.get());
    pop_target();
    CHECK(current_target() == outer.get());
    pop_target();
    CHECK(current_target() == nullptr);
}

TEST_CASE_METHOD(ReactiveFixture, "TargetScope - restores the target when unwinding", "[subject]") {
    Component vm;
    auto w = inert_watcher(vm);
    try {
        TargetScope scope{w.get()};
        throw std::runtime_error("boom");
    } catch (const std::runtime_error &) {
        // expected
    }
    CHECK(current_target() == nullptr);
    CHECK(ReactiveContext::instance().targets().depth() == 0);
}
