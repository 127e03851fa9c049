#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace tinydep::common {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::size_t parseCount(const std::string& value, const std::string& label) {
    // stoul skips blanks and accepts a sign, so "-1" would wrap around.
    if (value.empty() || !std::isdigit(static_cast<unsigned char>(value.front()))) {
        throw std::runtime_error("Valor inválido para " + label + ": " + value);
    }
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoul(value, &consumed);
        if (consumed != value.size() || parsed == 0U) {
            throw std::out_of_range(label + " must be >= 1");
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Valor inválido para " + label + ": " + value);
    }
}

tinydep::log::Level parseLevel(const std::string& value, const std::string& label) {
    try {
        return tinydep::log::levelFromString(toLower(value));
    } catch (const std::invalid_argument&) {
        throw std::runtime_error("Valor inválido para " + label + ": " + value);
    }
}

tinydep::core::Classification parseEnvironment(const std::string& value, const std::string& label) {
    try {
        return tinydep::core::classificationFromString(value);
    } catch (const std::invalid_argument&) {
        throw std::runtime_error("Valor inválido para " + label + ": " + value);
    }
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

bool hasFlag(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (key == argv[i]) {
            return true;
        }
    }
    return false;
}

}  // namespace

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (const char* envLogLevel = std::getenv("LOG_LEVEL")) {
        config.logLevel = parseLevel(envLogLevel, "LOG_LEVEL");
    }
    if (const char* envThreads = std::getenv("TINYDEP_THREADS")) {
        config.threads = parseCount(envThreads, "TINYDEP_THREADS");
    }
    // TINYDEP_ENVIRONMENT is left to the default probe; only the CLI pins the override.

    if (auto levelArg = valueFromArgs(argc, argv, "--log-level"); !levelArg.empty()) {
        config.logLevel = parseLevel(levelArg, "--log-level");
    }
    if (auto envArg = valueFromArgs(argc, argv, "--environment"); !envArg.empty()) {
        config.environment = parseEnvironment(envArg, "--environment");
    }
    if (auto threadsArg = valueFromArgs(argc, argv, "--threads"); !threadsArg.empty()) {
        config.threads = parseCount(threadsArg, "--threads");
    }
    if (auto tasksArg = valueFromArgs(argc, argv, "--tasks"); !tasksArg.empty()) {
        config.tasks = parseCount(tasksArg, "--tasks");
    }
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        config.showHelp = true;
    }

    return config;
}

}  // namespace tinydep::common
