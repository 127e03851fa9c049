#include "core/Environment.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

#include "common/Log.hpp"

namespace tinydep::core {
namespace {

constexpr int kNoOverride = -1;

std::atomic<int> g_override{kNoOverride};
std::mutex g_probeMutex;
std::shared_ptr<const environment::Probe> g_probe;

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

bool isTruthy(const char* raw) {
    if (raw == nullptr) {
        return false;
    }
    const auto value = toLower(raw);
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

std::shared_ptr<const environment::Probe> installedProbe() {
    std::lock_guard<std::mutex> lock(g_probeMutex);
    return g_probe;
}

}  // namespace

const char* toString(Classification classification) noexcept {
    switch (classification) {
    case Classification::Production:
        return "production";
    case Classification::Test:
        return "test";
    case Classification::Preview:
        return "preview";
    }
    return "production";
}

Classification classificationFromString(std::string_view text) {
    const auto lower = toLower(std::string{text});
    if (lower == "production" || lower == "prod" || lower == "live") {
        return Classification::Production;
    }
    if (lower == "test" || lower == "testing") {
        return Classification::Test;
    }
    if (lower == "preview") {
        return Classification::Preview;
    }
    throw std::invalid_argument("Entorno desconocido: " + std::string{text});
}

namespace environment {

Classification defaultProbe() {
    if (const char* explicitName = std::getenv("TINYDEP_ENVIRONMENT")) {
        try {
            return classificationFromString(explicitName);
        } catch (const std::invalid_argument& ex) {
            LOG_WARN("TINYDEP_ENVIRONMENT ignorado: " << ex.what());
        }
    }
    if (isTruthy(std::getenv("TINYDEP_PREVIEW"))) {
        return Classification::Preview;
    }
    if (isTruthy(std::getenv("TINYDEP_TESTING"))) {
        return Classification::Test;
    }
#if defined(TINYDEP_DEBUG_IMPLIES_TEST) && !defined(NDEBUG)
    return Classification::Test;
#else
    return Classification::Production;
#endif
}

Classification current() {
    const int pinned = g_override.load(std::memory_order_acquire);
    if (pinned != kNoOverride) {
        return static_cast<Classification>(pinned);
    }
    if (auto probe = installedProbe()) {
        return (*probe)();
    }
    return defaultProbe();
}

void setOverride(Classification classification) {
    g_override.store(static_cast<int>(classification), std::memory_order_release);
    LOG_INFO("Entorno fijado a " << toString(classification));
}

void clearOverride() {
    if (g_override.exchange(kNoOverride, std::memory_order_acq_rel) != kNoOverride) {
        LOG_INFO("Entorno sin fijar; se usa la sonda");
    }
}

std::optional<Classification> getOverride() {
    const int pinned = g_override.load(std::memory_order_acquire);
    if (pinned == kNoOverride) {
        return std::nullopt;
    }
    return static_cast<Classification>(pinned);
}

void setProbe(Probe probe) {
    std::shared_ptr<const Probe> next;
    if (probe) {
        next = std::make_shared<const Probe>(std::move(probe));
    }
    std::lock_guard<std::mutex> lock(g_probeMutex);
    g_probe = std::move(next);
}

OverrideGuard::OverrideGuard(Classification classification) : previous_(getOverride()) {
    setOverride(classification);
}

OverrideGuard::~OverrideGuard() {
    if (previous_) {
        setOverride(*previous_);
    } else {
        clearOverride();
    }
}

}  // namespace environment
}  // namespace tinydep::core
