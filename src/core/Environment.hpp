#pragma once

#include <functional>
#include <optional>
#include <string_view>

namespace tinydep::core {

// Execution environment used to pick a key's default value.
enum class Classification { Production, Test, Preview };

const char* toString(Classification classification) noexcept;

// Accepts production|prod|live, test|testing, preview (case-insensitive).
Classification classificationFromString(std::string_view text);

namespace environment {

using Probe = std::function<Classification()>;

// Classification for one resolve: override > injected probe > defaultProbe().
Classification current();

// Reads TINYDEP_ENVIRONMENT, then TINYDEP_PREVIEW, then TINYDEP_TESTING. Preview wins over test.
Classification defaultProbe();

void setOverride(Classification classification);
void clearOverride();
std::optional<Classification> getOverride();

// An empty probe restores defaultProbe().
void setProbe(Probe probe);

// Pins the override for its lifetime and puts back whatever was there before.
class OverrideGuard {
public:
    explicit OverrideGuard(Classification classification);
    ~OverrideGuard();

    OverrideGuard(const OverrideGuard&) = delete;
    OverrideGuard& operator=(const OverrideGuard&) = delete;

private:
    std::optional<Classification> previous_;
};

}  // namespace environment
}  // namespace tinydep::core
