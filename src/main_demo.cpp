#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/system/system_error.hpp>

#include "common/Config.hpp"
#include "common/Log.hpp"
#include "core/AsyncScope.hpp"
#include "core/Dependency.hpp"
#include "core/DependencyValues.hpp"
#include "core/Environment.hpp"
#include "core/WithDependencies.hpp"

namespace {

namespace net = boost::asio;
using tinydep::core::DependencyValues;

class Greeter {
public:
    virtual ~Greeter() = default;
    virtual std::string greet(const std::string& who) const = 0;
};

class PlainGreeter : public Greeter {
public:
    explicit PlainGreeter(std::string salutation) : salutation_(std::move(salutation)) {}
    std::string greet(const std::string& who) const override { return salutation_ + ", " + who; }

private:
    std::string salutation_;
};

struct GreeterKey {
    using Value = std::shared_ptr<const Greeter>;
    static Value productionDefault() { return std::make_shared<PlainGreeter>("Hola"); }
    static Value testDefault() { return std::make_shared<PlainGreeter>("[test] Hola"); }
    static Value previewDefault() { return std::make_shared<PlainGreeter>("[preview] Hola"); }
};

struct TenantKey {
    using Value = std::string;
    static Value productionDefault() { return "public"; }
};

class Reception {
public:
    std::string welcome() const { return greeter_->greet(*tenant_); }

private:
    tinydep::core::Dependency<GreeterKey> greeter_;
    tinydep::core::Dependency<TenantKey> tenant_;
};

void printUsage() {
    std::printf(
        "Uso: tinydep_demo [--log-level debug|info|warn|error] [--environment production|test|preview]\n"
        "                  [--threads N] [--tasks N]\n");
}

void runNested() {
    Reception reception;
    LOG_INFO("Raíz: " << reception.welcome());

    tinydep::core::withDependencies(
        [](DependencyValues& values) { values.set<TenantKey>("acme"); },
        [&reception] {
            LOG_INFO("Scope acme: " << reception.welcome());
            tinydep::core::withDependencies(
                [](DependencyValues& values) {
                    values.set<GreeterKey>(std::make_shared<PlainGreeter>("Buenas"));
                },
                [&reception] { LOG_INFO("Scope acme + saludo: " << reception.welcome()); });
            LOG_INFO("De vuelta en acme: " << reception.welcome());
        });

    LOG_INFO("De vuelta en la raíz: " << reception.welcome());
}

void runConcurrent(std::size_t threads, std::size_t tasks) {
    net::io_context ioc;
    auto guard = net::make_work_guard(ioc);
    std::vector<std::thread> workers;
    for (std::size_t i = 0; i < threads; ++i) {
        workers.emplace_back([&ioc] { ioc.run(); });
    }

    std::vector<std::future<std::string>> results;
    results.reserve(tasks);
    for (std::size_t i = 0; i < tasks; ++i) {
        const std::string tenant = "tenant-" + std::to_string(i);
        results.push_back(tinydep::core::withDependenciesAsync<std::string>(
            ioc.get_executor(),
            [tenant](DependencyValues& values) { values.set<TenantKey>(tenant); },
            [&ioc, i](tinydep::core::Resume<std::string> resume) {
                auto timer = std::make_shared<net::steady_timer>(ioc, std::chrono::milliseconds(5 + (i * 3) % 7));
                timer->async_wait(resume.bind([timer, resume](const boost::system::error_code& ec) {
                    if (ec) {
                        throw boost::system::system_error(ec);
                    }
                    resume(Reception{}.welcome());
                }));
            },
            net::use_future));
    }

    std::size_t mismatches = 0;
    for (std::size_t i = 0; i < tasks; ++i) {
        const auto welcome = results[i].get();
        const std::string expected = "tenant-" + std::to_string(i);
        if (welcome.size() < expected.size() ||
            welcome.compare(welcome.size() - expected.size(), expected.size(), expected) != 0) {
            ++mismatches;
            LOG_ERR("Tarea " << i << " observó un scope ajeno: " << welcome);
        } else {
            LOG_DEBUG("Tarea " << i << ": " << welcome);
        }
    }

    guard.reset();
    for (auto& worker : workers) {
        worker.join();
    }

    LOG_INFO("Tareas concurrentes: " << tasks << " en " << threads << " hilos, scopes ajenos=" << mismatches);
    if (mismatches != 0) {
        throw std::runtime_error("Aislamiento de scopes violado");
    }
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        try {
            auto eptr = std::current_exception();
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& ex) {
                    std::fprintf(stderr, "std::terminate: %s\n", ex.what());
                } catch (...) {
                    std::fprintf(stderr, "std::terminate: unknown exception\n");
                }
            } else {
                std::fprintf(stderr, "std::terminate without current_exception\n");
            }
        } catch (...) {
        }
        std::_Exit(1);
    });

    try {
        const auto config = tinydep::common::Config::fromArgs(argc, argv);
        if (config.showHelp) {
            printUsage();
            return EXIT_SUCCESS;
        }

        tinydep::log::setLevel(config.logLevel);
        if (config.environment) {
            tinydep::core::environment::setOverride(*config.environment);
        }

        LOG_INFO("Configuración cargada");
        LOG_INFO("  Nivel de log: " << tinydep::log::levelToString(config.logLevel));
        LOG_INFO("  Entorno: " << tinydep::core::toString(tinydep::core::environment::current()));
        LOG_INFO("  Hilos de trabajo: " << config.threads);
        LOG_INFO("  Tareas: " << config.tasks);

        runNested();
        runConcurrent(config.threads, config.tasks);

        const auto bound = DependencyValues::root().boundKeys();
        for (const auto& key : bound) {
            LOG_DEBUG("Clave en la raíz: " << key);
        }
        LOG_INFO("Demo finalizada (" << bound.size() << " claves en la raíz)");
    } catch (const std::exception& ex) {
        LOG_ERR("Error fatal: " << ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
