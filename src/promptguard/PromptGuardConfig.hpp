#pragma once

#include "security/ContentModerator.hpp"
#include "security/ThreatLevel.hpp"

#include <string>

struct PromptGuardConfig {
    PromptGuardConfig() = default;

    int maxInputLength = 2000;
    // LOW, MEDIUM or HIGH; a higher level blocks lower threat levels.
    std::string securityLevel = "MEDIUM";

    int rateLimitMessages = 10;
    int rateLimitWindow = 60;
    bool enableRateLimiting = true;

    bool enablePromptInjectionDetection = true;
    bool enableContentModeration = true;
    bool strictSanitization = false;

    // Raw "a; b, c" lists.
    std::string customBlacklistPatterns;
    std::string customWhitelistPatterns;

    // Seconds without a message before a session's window is dropped; 0 keeps them.
    int sessionIdleTimeout = 0;

    std::string sessionId = "default";
    std::string loggerConfig;
};

// Reads the command line, then the config file it names. Prints help and exits
// on --help. Throws boost::program_options::error for malformed options and
// std::runtime_error when the config file cannot be opened.
PromptGuardConfig BuildConfiguration(int argc, const char* argv[]);

// Throws ConfigurationException naming every offending setting.
void ValidateConfigOrThrow(const PromptGuardConfig& config);

security::SecurityLevel ResolveSecurityLevel(const PromptGuardConfig& config);
security::ModeratorOptions BuildModeratorOptions(const PromptGuardConfig& config);
