#include "pattern.hpp"
#include <core/utils.hpp>

// ── Level names ──────────────────────────────────────────────

std::string sensitivity_name(SensitivityLevel level) {
    switch (level) {
        case SensitivityLevel::kLow:     return "LOW";
        case SensitivityLevel::kMedium:  return "MEDIUM";
        case SensitivityLevel::kHigh:    return "HIGH";
        case SensitivityLevel::kMaximum: return "MAXIMUM";
    }
    return "LOW";
}

std::optional<SensitivityLevel> parse_sensitivity(const std::string& name) {
    std::string n = to_lower(trimmed(name));
    if (n == "low")     return SensitivityLevel::kLow;
    if (n == "medium")  return SensitivityLevel::kMedium;
    // "critical" sits between high and maximum in older configs
    if (n == "high" || n == "critical") return SensitivityLevel::kHigh;
    if (n == "maximum" || n == "max") return SensitivityLevel::kMaximum;
    return std::nullopt;
}

SensitivityLevel mode_floor(PrivacyMode mode) {
    switch (mode) {
        case PrivacyMode::kMinimal:  return SensitivityLevel::kMaximum;
        case PrivacyMode::kModerate: return SensitivityLevel::kHigh;
        case PrivacyMode::kStrict:   return SensitivityLevel::kLow;
    }
    return SensitivityLevel::kLow;
}

bool mode_scans(PrivacyMode mode, SensitivityLevel level) {
    return static_cast<int>(level) >= static_cast<int>(mode_floor(mode));
}

std::vector<std::string> MaskResult::pattern_names() const {
    std::vector<std::string> names;
    for (const auto& m : matches) {
        bool seen = false;
        for (const auto& n : names) {
            if (n == m.pattern_name) { seen = true; break; }
        }
        if (!seen) names.push_back(m.pattern_name);
    }
    return names;
}

// ── Built-in patterns ────────────────────────────────────────
// A dash inside a bracket expression is always written first.

std::vector<PatternSpec> default_patterns() {
    using L = SensitivityLevel;
    return {
        // API keys and tokens
        {"OPENAI_API_KEY", R"(sk-[a-z0-9]{48})",
         "OpenAI API key", L::kMaximum, std::nullopt},
        {"ANTHROPIC_API_KEY", R"(ANTHROPIC_API_KEY=[-a-z0-9_]{40,})",
         "Anthropic API key assignment", L::kMaximum, std::string("ANTHROPIC_API_KEY=[REDACTED]")},
        {"GITHUB_TOKEN", R"(ghp_[a-z0-9]{36})",
         "GitHub personal access token", L::kMaximum, std::nullopt},
        {"GITHUB_SECRET", R"(ghs_[a-z0-9]{36})",
         "GitHub app secret", L::kMaximum, std::nullopt},
        {"AWS_ACCESS_KEY", R"(AKIA[0-9A-Z]{16})",
         "AWS access key id", L::kMaximum, std::nullopt},

        // Connection strings and service endpoints
        {"POSTGRES_URL", R"(postgres(?:ql)?://[^@\s]+:[^@\s]+@[^/\s]+/\w+)",
         "PostgreSQL connection string", L::kHigh, std::string("postgresql://[USER]:[PASS]@[HOST]/[DB]")},
        {"MONGODB_URL", R"(mongodb\+srv://[^@\s]+:[^@\s]+@[^/\s]+)",
         "MongoDB connection string", L::kHigh, std::string("mongodb+srv://[USER]:[PASS]@[HOST]")},
        {"MYSQL_URL", R"(mysql://[^@\s]+:[^@\s]+@[^/\s]+/\w+)",
         "MySQL connection string", L::kHigh, std::string("mysql://[USER]:[PASS]@[HOST]/[DB]")},
        {"JWT", R"(eyJ[-a-z0-9_=]+\.[-a-z0-9_=]+\.[-a-z0-9_=]+)",
         "JSON web token", L::kHigh, std::nullopt},
        {"SUPABASE_URL", R"(https://[a-z0-9]+\.supabase\.co)",
         "Supabase project URL", L::kHigh, std::string("https://[PROJECT].supabase.co")},

        // Personal data
        {"PHONE_JP", R"(\b\d{3}-\d{4}-\d{4}\b)",
         "Japanese phone number", L::kHigh, std::nullopt},
        {"PHONE_US", R"(\b\d{3}-\d{3}-\d{4}\b)",
         "US phone number", L::kHigh, std::nullopt},
        {"CREDIT_CARD", R"(\b\d{4}(?:\s|-)?\d{4}(?:\s|-)?\d{4}(?:\s|-)?\d{4}\b)",
         "Payment card number", L::kMaximum, std::nullopt},
        {"SSN", R"(\b\d{3}-\d{2}-\d{4}\b)",
         "US social security number", L::kMaximum, std::nullopt},

        // Secrets assigned in text
        {"PASSWORD", R"(password\s*[:=]\s*["']?[^\s"']{8,})",
         "Password assignment", L::kMaximum, std::string("password=[REDACTED]")},
        {"SECRET", R"(secret\s*[:=]\s*["']?[^\s"']{8,})",
         "Secret assignment", L::kMaximum, std::string("secret=[REDACTED]")},
        {"API_KEY", R"(api_key\s*[:=]\s*["']?[^\s"']{16,})",
         "API key assignment", L::kMaximum, std::string("api_key=[REDACTED]")},

        {"EMAIL", R"(\b[-a-z0-9._%+]+@[-a-z0-9.]+\.[a-z]{2,}\b)",
         "Email address", L::kMedium, std::nullopt},
        {"PRIVATE_IP",
         R"(\b(?:10(?:\.\d{1,3}){3}|172\.(?:1[6-9]|2\d|3[01])(?:\.\d{1,3}){2}|192\.168(?:\.\d{1,3}){2})\b)",
         "Private network address", L::kMedium, std::nullopt},

        // Home directories reveal user names
        {"MACOS_HOME", R"(/Users/[^/\s]+)",
         "macOS user directory", L::kLow, std::string("/Users/[USERNAME]")},
        {"LINUX_HOME", R"(/home/[^/\s]+)",
         "Linux home directory", L::kLow, std::string("/home/[USERNAME]")},
        {"WINDOWS_HOME", R"(C:\\Users\\[^\\\s]+)",
         "Windows user directory", L::kLow, std::string(R"(C:\Users\[USERNAME])")},
    };
}
