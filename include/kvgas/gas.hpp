#pragma once

#include <kvgas/gas/basic_gas_meter.hpp>
#include <kvgas/gas/error.hpp>
#include <kvgas/gas/gas_config.hpp>
#include <kvgas/gas/gas_meter.hpp>
#include <kvgas/gas/infinite_gas_meter.hpp>
#include <kvgas/gas/types.hpp>
