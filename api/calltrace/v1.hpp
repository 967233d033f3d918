#pragma once

#include "calltrace/config/v1/config.pb.h"

#include "internal/config/config_loader.hpp"
#include "internal/instrument/module.hpp"
#include "internal/report/trace_dumper.hpp"
#include "internal/runtime/trace_runtime.hpp"
#include "internal/trace/function_info.hpp"
#include "internal/trace/value_formatter.hpp"
#include "internal/util/errors.hpp"

namespace calltrace::v1 {
using ::calltrace::config::ConfigLoader;
using ::calltrace::instrument::DefinitionOptions;
using ::calltrace::instrument::Module;
using ::calltrace::instrument::ModuleRegistry;
using ::calltrace::instrument::Traced;
using ::calltrace::report::TraceDumper;
using ::calltrace::runtime::TraceRuntime;
using ::calltrace::runtime::config::RuntimeConfig;
using ::calltrace::trace::CallKind;
using ::calltrace::trace::ValueFormatter;
using ::calltrace::util::InstrumentationError;
using ::calltrace::util::InvalidState;
} // namespace calltrace::v1
