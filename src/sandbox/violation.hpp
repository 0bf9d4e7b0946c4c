#pragma once

#include <string>
#include <utility>

namespace pyfence::sandbox {

enum class ViolationKind {
    kBlockedImport,
    kImportNotAllowed,
    kDangerousModule,
    kDangerousCall,
    kDangerousAttribute,
    kSyntaxError,
    kAnalysisError
};

inline const char* ToString(ViolationKind kind) {
    switch (kind) {
        case ViolationKind::kBlockedImport: return "blocked_import";
        case ViolationKind::kImportNotAllowed: return "import_not_allowed";
        case ViolationKind::kDangerousModule: return "dangerous_module";
        case ViolationKind::kDangerousCall: return "dangerous_call";
        case ViolationKind::kDangerousAttribute: return "dangerous_attribute";
        case ViolationKind::kSyntaxError: return "syntax_error";
        case ViolationKind::kAnalysisError: return "analysis_error";
    }
    return "unknown";
}

// One static-analysis rejection. Immutable once built.
class Violation {
public:
    Violation(ViolationKind kind, std::string message)
        : kind_(kind), message_(std::move(message)) {}

    ViolationKind Kind() const { return kind_; }
    const std::string& Message() const { return message_; }

    bool operator==(const Violation& other) const {
        return kind_ == other.kind_ && message_ == other.message_;
    }

private:
    ViolationKind kind_;
    std::string message_;
};

}  // namespace pyfence::sandbox
