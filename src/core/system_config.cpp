#include "relativity/core/system_config.hpp"

#include "relativity/core/constants.hpp"

SystemConfig defaultSystemConfig() {
    SystemConfig config;
    config.SecondsPerRealSecond = RelativityConstants::SecondsPerRealSecond;
    config.ScreenWidthPixels  = RelativityConstants::ScreenWidthPixels;
    config.ScreenHeightPixels = RelativityConstants::ScreenHeightPixels;
    return config;
}
