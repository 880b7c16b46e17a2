#include "redaction/pattern_library.hpp"
#include "core/types.hpp"

#include <format>
#include <stdexcept>

namespace redactor {

namespace {

// Email: local-part @ domain . 2+ letter TLD
constexpr const char* kEmailPattern =
    R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)";

// Phone: optional +country code, optional parens, 3-3-4 digits with optional separators
constexpr const char* kPhonePattern =
    R"((?:\+\d{1,3}[-. ]?)?\(?\b\d{3}\)?[-. ]?\d{3}[-. ]?\d{4}\b)";

// SSN: NNN-NN-NNNN
constexpr const char* kSsnPattern =
    R"(\b\d{3}-\d{2}-\d{4}\b)";

// Credit card: 16 digits in groups of 4 with optional separators
constexpr const char* kCreditCardPattern =
    R"(\b\d{4}[-\s]?\d{4}[-\s]?\d{4}[-\s]?\d{4}\b)";

re2::RE2::Options matcher_options() {
    re2::RE2::Options options;
    options.set_case_sensitive(false);
    options.set_never_capture(true);
    options.set_log_errors(false);
    return options;
}

std::unique_ptr<re2::RE2> compile_builtin(std::string_view name, const char* pattern) {
    auto re = std::make_unique<re2::RE2>(pattern, matcher_options());
    if (!re->ok()) {
        throw std::runtime_error(
            std::format("Built-in {} pattern failed to compile: {}", name, re->error()));
    }
    return re;
}

} // anonymous namespace

PatternLibrary::PatternLibrary() {
    patterns_.reserve(4);
    patterns_.push_back({pattern_types::kEmail, "[EMAIL_REDACTED]",
                         compile_builtin(pattern_types::kEmail, kEmailPattern)});
    patterns_.push_back({pattern_types::kPhone, "[PHONE_REDACTED]",
                         compile_builtin(pattern_types::kPhone, kPhonePattern)});
    patterns_.push_back({pattern_types::kSsn, "[SSN_REDACTED]",
                         compile_builtin(pattern_types::kSsn, kSsnPattern)});
    patterns_.push_back({pattern_types::kCreditCard, "[CC_REDACTED]",
                         compile_builtin(pattern_types::kCreditCard, kCreditCardPattern)});
}

const PatternLibrary& PatternLibrary::instance() {
    static const PatternLibrary library;
    return library;
}

const BuiltinPattern* PatternLibrary::find(std::string_view name) const {
    for (const auto& pattern : patterns_) {
        if (pattern.name == name) {
            return &pattern;
        }
    }
    return nullptr;
}

std::unique_ptr<re2::RE2> PatternLibrary::compile_custom(const std::string& expression) {
    auto options = matcher_options();
    options.set_max_mem(kCustomMaxMem);
    return std::make_unique<re2::RE2>(expression, options);
}

} // namespace redactor
