#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "common/Log.hpp"
#include "core/Environment.hpp"

namespace tinydep::common {

struct Config {
    tinydep::log::Level logLevel = tinydep::log::Level::Info;
    // Unset means "let the environment probe decide".
    std::optional<tinydep::core::Classification> environment{};
    std::size_t threads = 4;
    std::size_t tasks = 10;
    bool showHelp = false;

    static Config fromArgs(int argc, char** argv);
};

}  // namespace tinydep::common
