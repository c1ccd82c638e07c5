#pragma once

#include "AppConfig.hpp"
#include "Logger.hpp"

// Everything a component needs from the outside world for one run.
// Both referents must outlive every component constructed with the context.
struct RunContext
{
    const AppConfig& Config;
    Logger& Log;
};
