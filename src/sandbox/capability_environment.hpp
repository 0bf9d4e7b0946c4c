#pragma once

#include <string>
#include <vector>

#include <boost/python.hpp>

#include "config/config_schema.hpp"
#include "sandbox/execution_types.hpp"
#include "sandbox/security_validator.hpp"

namespace pyfence::sandbox {

// Builtins exposed to guest code. An allow-list: names added to the host
// interpreter later stay hidden until listed here.
const std::vector<std::string>& SafeBuiltinNames();

// Only plain data crosses into the environment: no private names, no
// callables, no modules.
bool IsSafeBinding(const std::string& name, const Value& value);

// A replacement for __import__ that refuses anything ImportRules rejects,
// relative imports included, and raises ImportError.
boost::python::object MakeImportGuard(const ImportRules& rules);

// A fresh namespace for one sandboxed run: allow-listed builtins, the guarded
// import hook, the policy's allowed modules and the vetted injected bindings.
boost::python::dict BuildCapabilityEnvironment(const config::Policy& policy,
                                               const ImportRules& rules,
                                               const Bindings& injected);

}  // namespace pyfence::sandbox
