#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include "core/DependencyValues.hpp"
#include "core/Environment.hpp"
#include "core/ScopeStack.hpp"
#include "core/WithDependencies.hpp"

using tinydep::core::Classification;
using tinydep::core::DependencyValues;
using tinydep::core::ScopeStack;
using tinydep::core::withDependencies;

namespace env = tinydep::core::environment;

namespace {

struct EndpointKey {
    using Value = std::string;
    static Value productionDefault() { return "https://api.example.com"; }
    static Value testDefault() { return "http://localhost:8080"; }
};

struct TimeoutKey {
    using Value = int;
    static Value productionDefault() { return 30; }
};

std::string endpoint() { return tinydep::core::current<EndpointKey>(); }

// Reached only through nested calls: overrides apply along the call graph.
std::string describeRequest() {
    return "GET " + endpoint() + " timeout=" + std::to_string(tinydep::core::current<TimeoutKey>());
}

int failures = 0;

void expect(bool condition, const std::string& what) {
    if (!condition) {
        std::cerr << "FAILED: " << what << '\n';
        ++failures;
    }
}

}  // namespace

int main() {
    env::OverrideGuard pin(Classification::Test);
    DependencyValues::resetRoot();

    {
        expect(endpoint() == "http://localhost:8080", "root resolves testDefault");

        const std::string inside = withDependencies(
            [](DependencyValues& values) { values.set<EndpointKey>("http://mock"); },
            [] { return endpoint(); });
        expect(inside == "http://mock", "override visible inside the scope");
        expect(endpoint() == "http://localhost:8080", "override gone after the scope");
        expect(ScopeStack::depth() == 0, "stack empty after the scope");
    }

    {
        withDependencies(
            [](DependencyValues& values) { values.set<EndpointKey>("A"); },
            [] {
                expect(endpoint() == "A", "outer scope value");
                expect(ScopeStack::depth() == 1, "one frame inside the outer scope");

                withDependencies(
                    [](DependencyValues& values) {
                        expect(values.get<EndpointKey>() == "A", "mutator starts from the outer scope");
                        values.set<EndpointKey>("B");
                    },
                    [] {
                        expect(endpoint() == "B", "inner scope value");
                        expect(ScopeStack::depth() == 2, "two frames inside the inner scope");
                    });

                expect(endpoint() == "A", "inner exit restores the outer value, not the root");
                expect(ScopeStack::depth() == 1, "inner frame popped");
            });
        expect(endpoint() == "http://localhost:8080", "outer exit restores the root value");
    }

    {
        const auto request = withDependencies(
            [](DependencyValues& values) {
                values.set<EndpointKey>("http://staging");
                values.set<TimeoutKey>(5);
            },
            [] { return describeRequest(); });
        expect(request == "GET http://staging timeout=5", "dynamic scoping reaches nested calls: " + request);
        expect(describeRequest() == "GET http://localhost:8080 timeout=30", "nested calls see the root afterwards");
    }

    {
        bool caught = false;
        try {
            withDependencies(
                [](DependencyValues& values) { values.set<EndpointKey>("http://failing"); },
                []() -> int {
                    expect(endpoint() == "http://failing", "override visible before the failure");
                    throw std::runtime_error("boom");
                });
        } catch (const std::runtime_error& ex) {
            caught = std::string(ex.what()) == "boom";
            expect(endpoint() == "http://localhost:8080", "scope restored before the handler runs");
            expect(ScopeStack::depth() == 0, "frame popped on the failure path");
        }
        expect(caught, "failure propagates unchanged");
    }

    {
        withDependencies(
            [](DependencyValues& values) { values.set<EndpointKey>("outer"); },
            [] {
                try {
                    withDependencies(
                        [](DependencyValues& values) { values.set<EndpointKey>("inner"); },
                        [] { throw std::logic_error("inner failure"); });
                } catch (const std::logic_error&) {
                    expect(endpoint() == "outer", "failing inner scope restores the outer override");
                }
            });
    }

    {
        // Defaults first read inside a scope are cached in that scope's store only.
        DependencyValues::resetRoot();
        withDependencies([](DependencyValues&) {},
                         [] { expect(tinydep::core::current<TimeoutKey>() == 30, "default inside scope"); });
        expect(!DependencyValues::root().contains<TimeoutKey>(), "nested cache does not leak into the parent");

        // Direct writes to the active store stay in the scope.
        withDependencies([](DependencyValues&) {},
                         [] { DependencyValues::current().set<TimeoutKey>(1); });
        expect(tinydep::core::current<TimeoutKey>() == 30, "writes to a scope's store die with the scope");
    }

    {
        int counter = 0;
        int& ref = withDependencies([](DependencyValues&) {}, [&counter]() -> int& { return counter; });
        ref = 3;
        expect(counter == 3, "references are returned as references");
    }

    DependencyValues::resetRoot();

    if (failures != 0) {
        std::cerr << failures << " expectation(s) failed\n";
        return EXIT_FAILURE;
    }
    std::cout << "withDependencies tests passed\n";
    return EXIT_SUCCESS;
}
