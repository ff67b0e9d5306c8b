#pragma once

#include <quantum/core/config.hpp>
#include <quantum/core/container.hpp>
#include <quantum/core/engine.hpp>
#include <quantum/core/errors.hpp>
#include <quantum/core/logger.hpp>

#include <quantum/ast/nodes.hpp>
#include <quantum/ast/source_unit.hpp>
#include <quantum/parser/parser.hpp>

#include <quantum/runtime/component_runtime.hpp>
#include <quantum/runtime/execution_context.hpp>
#include <quantum/runtime/message_consumer.hpp>
#include <quantum/runtime/options.hpp>
#include <quantum/runtime/rendered_output.hpp>
#include <quantum/runtime/scope.hpp>
#include <quantum/runtime/services.hpp>
#include <quantum/runtime/value.hpp>

#include <quantum/support/env.hpp>
#include <quantum/support/str.hpp>
