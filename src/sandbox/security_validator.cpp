#include "sandbox/security_validator.hpp"

#include <deque>
#include <unordered_map>

#include "python/interpreter.hpp"
#include "utils/common.hpp"

namespace pyfence::sandbox {
namespace bp = boost::python;
namespace {

std::string NodeTypeName(const bp::object& node) {
    return bp::extract<std::string>(node.attr("__class__").attr("__name__"));
}

bool IsDunder(const std::string& name) {
    return name.size() > 4 && utils::StartsWith(name, "__") &&
           name.compare(name.size() - 2, 2, "__") == 0;
}

std::optional<NodeCategory> CategoryOf(const std::string& type_name) {
    static const std::unordered_map<std::string, NodeCategory> kCategories = {
        {"Import", NodeCategory::kImport},
        {"ImportFrom", NodeCategory::kImportFrom},
        {"Call", NodeCategory::kCall},
        {"Attribute", NodeCategory::kAttribute},
        {"Subscript", NodeCategory::kSubscript}
    };
    auto it = kCategories.find(type_name);
    if (it == kCategories.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace

const std::set<std::string>& DangerousModules() {
    static const std::set<std::string> kModules = {
        "subprocess", "os", "sys", "socket", "urllib",
        "http", "ftplib", "smtplib", "telnetlib",
        "ctypes", "marshal", "pickle", "shelve",
        "builtins", "importlib", "io", "gc", "inspect",
        "multiprocessing", "pty", "resource", "shutil", "signal",
        "posix", "pathlib", "codecs", "tempfile", "fileinput", "glob",
        "mmap", "runpy", "code", "codeop", "pdb", "pkgutil", "zipimport",
        "platform", "sysconfig", "site", "types", "threading", "asyncio",
        "concurrent", "webbrowser", "logging", "tarfile", "zipfile",
        "sqlite3", "dbm"
    };
    return kModules;
}

const std::set<std::string>& DangerousFunctions() {
    static const std::set<std::string> kFunctions = {
        "exec", "eval", "compile", "__import__",
        "open", "file", "input", "raw_input",
        "reload", "exit", "quit", "help", "breakpoint"
    };
    return kFunctions;
}

const std::set<std::string>& DangerousMethods() {
    static const std::set<std::string> kMethods = {
        "system", "popen", "Popen", "spawn", "spawnv",
        "exec", "execv", "execve", "fork",
        "call", "check_call", "check_output", "run",
        "open", "eval", "getattr", "setattr", "delattr",
        "globals", "locals", "vars"
    };
    return kMethods;
}

const std::set<std::string>& DefaultBlockedAttributes() {
    static const std::set<std::string> kAttributes = {
        "__globals__", "__locals__", "__dict__",
        "__class__", "__bases__", "__mro__", "__subclasses__",
        "__import__", "__builtins__", "__code__", "__closure__",
        "__self__", "__func__", "__reduce__", "__reduce_ex__",
        "__traceback__", "__getattribute__", "__objclass__", "__wrapped__",
        "__loader__", "__spec__",
        "gi_frame", "gi_code", "cr_frame", "cr_code", "ag_frame", "ag_code",
        "tb_frame", "tb_next", "f_back", "f_globals", "f_builtins",
        "f_locals", "f_code"
    };
    return kAttributes;
}

const std::set<std::string>& AllowedDunderAttributes() {
    static const std::set<std::string> kAttributes = {
        "__init__", "__name__", "__qualname__", "__doc__"
    };
    return kAttributes;
}

ImportRules::ImportRules(const config::Policy& policy)
    : allowed_(policy.allowed_imports),
      blocked_(policy.blocked_imports) {}

bool ImportRules::IsAllowListed(const std::string& module) const {
    return utils::Contains(allowed_, module) ||
           utils::Contains(allowed_, utils::TopLevelName(module));
}

std::optional<Violation> ImportRules::Check(const std::string& module) const {
    const auto top = utils::TopLevelName(module);
    if (utils::Contains(blocked_, module) || utils::Contains(blocked_, top)) {
        return Violation(ViolationKind::kBlockedImport, "Blocked import: " + module);
    }
    if (!allowed_.empty() && !IsAllowListed(module)) {
        return Violation(ViolationKind::kImportNotAllowed, "Import not in allowed list: " + module);
    }
    // Underscore modules are interpreter internals (_io, _posixsubprocess, ...).
    const auto& dangerous = DangerousModules();
    if ((utils::Contains(dangerous, module) || utils::Contains(dangerous, top) ||
         utils::StartsWith(top, "_")) &&
        !IsAllowListed(module)) {
        return Violation(ViolationKind::kDangerousModule, "Potentially dangerous import: " + module);
    }
    return std::nullopt;
}

SecurityValidator::SecurityValidator(const config::Policy& policy)
    : imports_(policy),
      blocked_attributes_(DefaultBlockedAttributes()) {
    python::EnsureInterpreter();
    blocked_attributes_.insert(policy.blocked_attributes.begin(), policy.blocked_attributes.end());

    RegisterChecker(NodeCategory::kImport, [this](const bp::object& node, std::vector<Violation>& out) {
        CheckImport(node, out);
    });
    RegisterChecker(NodeCategory::kImportFrom, [this](const bp::object& node, std::vector<Violation>& out) {
        CheckImportFrom(node, out);
    });
    RegisterChecker(NodeCategory::kCall, [this](const bp::object& node, std::vector<Violation>& out) {
        CheckCall(node, out);
    });
    RegisterChecker(NodeCategory::kAttribute, [this](const bp::object& node, std::vector<Violation>& out) {
        CheckAttribute(node, out);
    });
    RegisterChecker(NodeCategory::kSubscript, [this](const bp::object& node, std::vector<Violation>& out) {
        CheckSubscript(node, out);
    });
}

void SecurityValidator::RegisterChecker(NodeCategory category, Checker checker) {
    checkers_[category].push_back(std::move(checker));
}

std::vector<Violation> SecurityValidator::Validate(const std::string& code) const {
    std::vector<Violation> violations;
    bp::object ast;
    bp::object tree;
    try {
        ast = bp::import("ast");
        tree = ast.attr("parse")(code, "<sandbox>");
    } catch (const bp::error_already_set&) {
        const auto error = python::FetchError();
        violations.emplace_back(ViolationKind::kSyntaxError, "Syntax error: " + error.message);
        return violations;
    }

    // Same order as ast.walk: breadth-first, children in field order.
    const bp::object iter_child_nodes = ast.attr("iter_child_nodes");
    std::deque<bp::object> pending{tree};
    while (!pending.empty()) {
        bp::object node = pending.front();
        pending.pop_front();
        try {
            bp::stl_input_iterator<bp::object> child(iter_child_nodes(node));
            bp::stl_input_iterator<bp::object> end;
            for (; child != end; ++child) {
                pending.push_back(*child);
            }
        } catch (const bp::error_already_set&) {
            const auto error = python::FetchError();
            violations.emplace_back(ViolationKind::kAnalysisError,
                                    "Security check error: " + error.Describe());
        }
        Inspect(node, violations);
    }
    return violations;
}

void SecurityValidator::Inspect(const bp::object& node, std::vector<Violation>& violations) const {
    try {
        const auto category = CategoryOf(NodeTypeName(node));
        if (!category) {
            return;
        }
        auto it = checkers_.find(*category);
        if (it == checkers_.end()) {
            return;
        }
        for (const auto& checker : it->second) {
            checker(node, violations);
        }
    } catch (const bp::error_already_set&) {
        const auto error = python::FetchError();
        violations.emplace_back(ViolationKind::kAnalysisError,
                                "Security check error: " + error.Describe());
    }
}

void SecurityValidator::CheckImport(const bp::object& node, std::vector<Violation>& violations) const {
    bp::stl_input_iterator<bp::object> alias(node.attr("names"));
    bp::stl_input_iterator<bp::object> end;
    for (; alias != end; ++alias) {
        const std::string module = bp::extract<std::string>((*alias).attr("name"));
        if (auto violation = imports_.Check(module)) {
            violations.push_back(*violation);
        }
    }
}

void SecurityValidator::CheckImportFrom(const bp::object& node, std::vector<Violation>& violations) const {
    // Relative imports carry no module name.
    std::string module = ".";
    const bp::object module_name = node.attr("module");
    if (!module_name.is_none()) {
        module = bp::extract<std::string>(module_name)();
        if (auto violation = imports_.Check(module)) {
            if (violation->Kind() == ViolationKind::kBlockedImport) {
                violation = Violation(ViolationKind::kBlockedImport, "Blocked import from: " + module);
            }
            violations.push_back(*violation);
        }
    }

    bp::stl_input_iterator<bp::object> alias(node.attr("names"));
    bp::stl_input_iterator<bp::object> end;
    for (; alias != end; ++alias) {
        const std::string name = bp::extract<std::string>((*alias).attr("name"));
        if (utils::Contains(DangerousFunctions(), name)) {
            violations.emplace_back(ViolationKind::kDangerousCall,
                                    "Dangerous function import: " + name + " from " + module);
        }
    }
}

void SecurityValidator::CheckCall(const bp::object& node, std::vector<Violation>& violations) const {
    const bp::object func = node.attr("func");
    const auto func_type = NodeTypeName(func);
    if (func_type == "Name") {
        const std::string name = bp::extract<std::string>(func.attr("id"));
        if (utils::Contains(DangerousFunctions(), name)) {
            violations.emplace_back(ViolationKind::kDangerousCall, "Dangerous function call: " + name);
        }
    } else if (func_type == "Attribute") {
        // Receiver is not resolved: the trailing name alone decides.
        const std::string method = bp::extract<std::string>(func.attr("attr"));
        if (utils::Contains(DangerousMethods(), method)) {
            violations.emplace_back(ViolationKind::kDangerousCall, "Dangerous method call: " + method);
        }
    }
}

bool SecurityValidator::IsIntrospectionName(const std::string& name) const {
    if (utils::Contains(blocked_attributes_, name)) {
        return true;
    }
    return IsDunder(name) && !utils::Contains(AllowedDunderAttributes(), name);
}

void SecurityValidator::CheckAttribute(const bp::object& node, std::vector<Violation>& violations) const {
    // Modules re-export what they import, e.g. json.codecs.sys.
    static const std::set<std::string> kReexportedModules = {
        "os", "sys", "builtins", "subprocess", "posix", "importlib", "ctypes",
        "socket", "shutil", "pathlib", "io", "codecs", "pty", "signal",
        "multiprocessing", "marshal", "pickle"
    };
    const std::string name = bp::extract<std::string>(node.attr("attr"));
    if (IsIntrospectionName(name) || utils::Contains(kReexportedModules, name)) {
        violations.emplace_back(ViolationKind::kDangerousAttribute, "Dangerous attribute access: " + name);
    }
}

void SecurityValidator::CheckSubscript(const bp::object& node, std::vector<Violation>& violations) const {
    // Only literal string keys are visible statically, e.g. ns["__builtins__"].
    const bp::object key = node.attr("slice");
    if (NodeTypeName(key) != "Constant") {
        return;
    }
    const bp::object value = key.attr("value");
    if (!PyUnicode_Check(value.ptr())) {
        return;
    }
    const std::string name = bp::extract<std::string>(value);
    if (IsIntrospectionName(name)) {
        violations.emplace_back(ViolationKind::kDangerousAttribute, "Dangerous subscript key: " + name);
    }
}

}  // namespace pyfence::sandbox
