#pragma once

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <boost/python.hpp>

#include "config/config_schema.hpp"
#include "sandbox/violation.hpp"

namespace pyfence::sandbox {

// Syntax-tree node categories the validator dispatches on.
enum class NodeCategory {
    kImport,
    kImportFrom,
    kCall,
    kAttribute,
    kSubscript
};

const std::set<std::string>& DangerousModules();
const std::set<std::string>& DangerousFunctions();
const std::set<std::string>& DangerousMethods();
// Interpreter-introspection attributes blocked unless the policy adds more.
const std::set<std::string>& DefaultBlockedAttributes();
// The only double-underscore attribute names guest code may touch.
const std::set<std::string>& AllowedDunderAttributes();

// Module-level import rules, shared by the static check and the runtime
// import guard installed in the capability environment.
class ImportRules {
public:
    explicit ImportRules(const config::Policy& policy);

    // nullopt when the module may be imported.
    std::optional<Violation> Check(const std::string& module) const;
    bool IsAllowListed(const std::string& module) const;

private:
    std::set<std::string> allowed_;
    std::set<std::string> blocked_;
};

class SecurityValidator {
public:
    // Appends zero or more violations found on one node.
    using Checker = std::function<void(const boost::python::object& node,
                                       std::vector<Violation>& violations)>;

    explicit SecurityValidator(const config::Policy& policy);
    SecurityValidator(const SecurityValidator&) = delete;
    SecurityValidator& operator=(const SecurityValidator&) = delete;

    // Parses and walks the code. An empty result means it is safe to run.
    // Violations are listed in breadth-first syntax-tree order.
    std::vector<Violation> Validate(const std::string& code) const;

    // Adds a checker after the ones already registered for the category.
    void RegisterChecker(NodeCategory category, Checker checker);

    const ImportRules& Imports() const { return imports_; }
    const std::set<std::string>& BlockedAttributes() const { return blocked_attributes_; }

private:
    void Inspect(const boost::python::object& node, std::vector<Violation>& violations) const;
    // Blocked table entries and every dunder name outside the allow-list.
    bool IsIntrospectionName(const std::string& name) const;

    void CheckImport(const boost::python::object& node, std::vector<Violation>& violations) const;
    void CheckImportFrom(const boost::python::object& node, std::vector<Violation>& violations) const;
    void CheckCall(const boost::python::object& node, std::vector<Violation>& violations) const;
    void CheckAttribute(const boost::python::object& node, std::vector<Violation>& violations) const;
    void CheckSubscript(const boost::python::object& node, std::vector<Violation>& violations) const;

    ImportRules imports_;
    std::set<std::string> blocked_attributes_;
    std::map<NodeCategory, std::vector<Checker>> checkers_;
};

}  // namespace pyfence::sandbox
