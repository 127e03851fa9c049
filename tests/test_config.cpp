#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/Config.hpp"

namespace {

// Saves the variables Config reads and puts them back on exit.
struct EnvGuard {
    EnvGuard() {
        for (const char* name : kNames) {
            const char* current = std::getenv(name);
            saved.push_back(current ? std::optional<std::string>(current) : std::nullopt);
            ::unsetenv(name);
        }
    }

    ~EnvGuard() {
        for (std::size_t i = 0; i < saved.size(); ++i) {
            if (saved[i]) {
                ::setenv(kNames[i], saved[i]->c_str(), 1);
            } else {
                ::unsetenv(kNames[i]);
            }
        }
    }

    void set(const char* name, const std::string& value) { ::setenv(name, value.c_str(), 1); }
    void clear(const char* name) { ::unsetenv(name); }

    static constexpr const char* kNames[] = {"LOG_LEVEL", "TINYDEP_THREADS"};
    std::vector<std::optional<std::string>> saved;
};

tinydep::common::Config runConfig(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    return tinydep::common::Config::fromArgs(static_cast<int>(argv.size()), argv.data());
}

bool throwsRuntimeError(const std::vector<std::string>& args) {
    try {
        runConfig(args);
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
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
    EnvGuard envGuard;
    using tinydep::core::Classification;
    using tinydep::log::Level;

    {
        const auto config = runConfig({"tinydep_demo"});
        expect(config.logLevel == Level::Info, "default log level is info");
        expect(!config.environment.has_value(), "environment left to the probe by default");
        expect(config.threads == 4 && config.tasks == 10, "default pool sizes");
        expect(!config.showHelp, "help off by default");
    }

    {
        const auto config = runConfig({"tinydep_demo", "--log-level", "DEBUG", "--environment=preview",
                                       "--threads=2", "--tasks", "12", "--help"});
        expect(config.logLevel == Level::Debug, "--log-level parsed");
        expect(config.environment == Classification::Preview, "--environment parsed");
        expect(config.threads == 2, "--threads parsed");
        expect(config.tasks == 12, "--tasks parsed");
        expect(config.showHelp, "--help parsed");
    }

    {
        envGuard.set("LOG_LEVEL", "warn");
        envGuard.set("TINYDEP_THREADS", "8");
        auto config = runConfig({"tinydep_demo"});
        expect(config.logLevel == Level::Warn, "LOG_LEVEL read from the environment");
        expect(config.threads == 8, "TINYDEP_THREADS read from the environment");

        config = runConfig({"tinydep_demo", "--log-level=error", "--threads=3"});
        expect(config.logLevel == Level::Error, "flag beats LOG_LEVEL");
        expect(config.threads == 3, "flag beats TINYDEP_THREADS");
        envGuard.clear("LOG_LEVEL");
        envGuard.clear("TINYDEP_THREADS");
    }

    {
        expect(throwsRuntimeError({"tinydep_demo", "--threads=0"}), "zero threads rejected");
        expect(throwsRuntimeError({"tinydep_demo", "--threads=abc"}), "non-numeric threads rejected");
        expect(throwsRuntimeError({"tinydep_demo", "--tasks=4x"}), "trailing garbage rejected");
        expect(throwsRuntimeError({"tinydep_demo", "--threads=-1"}), "negative threads rejected");
        expect(throwsRuntimeError({"tinydep_demo", "--tasks", "-5"}), "negative tasks rejected");
        expect(throwsRuntimeError({"tinydep_demo", "--threads= 3"}), "leading blank rejected");
        expect(throwsRuntimeError({"tinydep_demo", "--threads=+3"}), "explicit sign rejected");
        expect(throwsRuntimeError({"tinydep_demo", "--environment=staging"}), "unknown environment rejected");
        expect(throwsRuntimeError({"tinydep_demo", "--log-level=loud"}), "unknown log level rejected");

        envGuard.set("LOG_LEVEL", "verbose");
        expect(throwsRuntimeError({"tinydep_demo"}), "invalid LOG_LEVEL rejected");
        envGuard.clear("LOG_LEVEL");
    }

    if (failures != 0) {
        std::cerr << failures << " expectation(s) failed\n";
        return EXIT_FAILURE;
    }
    std::cout << "config tests passed\n";
    return EXIT_SUCCESS;
}
