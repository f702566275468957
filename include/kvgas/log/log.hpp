#pragma once

#include <quill/LogMacros.h>

#include <kvgas/log/formatter.hpp>
#include <kvgas/log/frontend.hpp>

namespace kvgas::log {

void initialize() noexcept;
logger* instance() noexcept;

} // namespace kvgas::log
