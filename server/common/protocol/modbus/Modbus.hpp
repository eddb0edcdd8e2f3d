#pragma once

/**
 * @brief Modbus TCP master-side protocol pieces
 *
 * - Modbus.Types.hpp - frame structs, function codes, batch types
 * - Modbus.Utils.hpp - frame building/parsing, value extraction, read batching
 */

#include "Modbus.Types.hpp"
#include "Modbus.Utils.hpp"
