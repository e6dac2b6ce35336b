// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/common.h>

namespace livecap::core {

// Configure the default spdlog logger (stderr, "[time] [level] message")
void init_logging(spdlog::level::level_enum level) noexcept;

} // namespace livecap::core
