#pragma once
/**
 * @file core.hpp
 * @brief Main include file for the cyclebind core library
 */

#include "../src/logging/Logger.hpp"
#include "../src/errors/Errors.hpp"
#include "../src/value/Value.hpp"
#include "../src/value/TypeConverter.hpp"
#include "../src/value/JsonCodec.hpp"
#include "../src/bindings/FunctionRegistry.hpp"
#include "../src/config/ActivityConfig.hpp"
#include "../src/config/ConfigManager.hpp"
#include "../src/templating/OpTemplate.hpp"
#include "../src/templating/WorkloadLoader.hpp"
#include "../src/command/CompiledCommand.hpp"
