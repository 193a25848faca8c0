#include "PromptGuardConfig.hpp"

#include "StringUtils.hpp"
#include "security/SecurityErrors.hpp"

#include <boost/program_options.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <vector>

void ValidateConfigOrThrow(const PromptGuardConfig& config) {
    std::vector<std::string> invalid;
    if (config.maxInputLength <= 0) {
        invalid.emplace_back("max_input_length");
    }
    if (config.rateLimitMessages <= 0) {
        invalid.emplace_back("rate_limit_messages");
    }
    if (config.rateLimitWindow <= 0) {
        invalid.emplace_back("rate_limit_window");
    }

    if (!invalid.empty()) {
        throw security::ConfigurationException(Join(invalid), "must be positive integers");
    }

    if (config.sessionIdleTimeout < 0) {
        throw security::ConfigurationException("session_idle_timeout",
            "must be zero (disabled) or a positive number of seconds, got: "
                + std::to_string(config.sessionIdleTimeout));
    }

    if (IsBlank(config.sessionId)) {
        throw security::ConfigurationException("session", "session id must not be blank");
    }

    ResolveSecurityLevel(config);
}

security::SecurityLevel ResolveSecurityLevel(const PromptGuardConfig& config) {
    return security::ParseSecurityLevel(TrimUtf8(config.securityLevel));
}

security::ModeratorOptions BuildModeratorOptions(const PromptGuardConfig& config) {
    security::ModeratorOptions options;
    options.rateLimitMessages = config.rateLimitMessages;
    options.rateLimitWindow = std::chrono::seconds{config.rateLimitWindow};
    options.enableRateLimiting = config.enableRateLimiting;
    options.enableContentModeration = config.enableContentModeration;
    options.enableInjectionDetection = config.enablePromptInjectionDetection;
    options.strictSanitization = config.strictSanitization;
    options.blacklistPatterns = SplitPatternList(config.customBlacklistPatterns);
    options.whitelistPatterns = SplitPatternList(config.customWhitelistPatterns);
    return options;
}



PromptGuardConfig BuildConfiguration(int argc, const char* argv[]) {
    namespace po = boost::program_options;
    PromptGuardConfig config;
    std::string configFile;

    auto ResolveDefaultPath = [](const std::vector<std::string>& candidatePaths) {
        for (const auto& candidatePath : candidatePaths) {
            std::ifstream candidate(candidatePath.c_str());
            if (candidate.good()) {
                return candidatePath;
            }
        }

        return candidatePaths.empty() ? std::string{} : candidatePaths.front();
    };

    // Declare a group of options that will be
    // allowed only on command line
    po::options_description generic("Generic options");
    generic.add_options()
        ("help,h", "produces help message")
        ("config,c", po::value<std::string>(&configFile)->default_value("etc/promptguard/promptguard.cfg"),
            "sets path to the configuration file")
        ("logger_config", po::value<std::string>(&config.loggerConfig)->default_value("etc/promptguard/logger.cfg"),
            "sets path to the logger configuration file")
        ("session,s", po::value<std::string>(&config.sessionId)->default_value("default"),
            "session id every message read from stdin is attributed to")
        ;

    po::options_description options("Configuration");
    options.add_options()
        ("max_input_length", po::value<int>(&config.maxInputLength)->default_value(2000),
            "maximum message length in characters after sanitization")
        ("security_level", po::value<std::string>(&config.securityLevel)->default_value("MEDIUM"),
            "LOW|MEDIUM|HIGH; HIGH blocks anything at LOW threat or above, LOW only HIGH and CRITICAL")
        ("rate_limit_messages", po::value<int>(&config.rateLimitMessages)->default_value(10),
            "messages allowed per session within the rate limit window")
        ("rate_limit_window", po::value<int>(&config.rateLimitWindow)->default_value(60),
            "rate limit window in seconds")
        ("enable_rate_limiting", po::value<bool>(&config.enableRateLimiting)->default_value(true),
            "enables the per-session sliding window rate limit")
        ("enable_prompt_injection_detection",
            po::value<bool>(&config.enablePromptInjectionDetection)->default_value(true),
            "enables prompt injection detection on sanitized messages")
        ("enable_content_moderation", po::value<bool>(&config.enableContentModeration)->default_value(true),
            "enables whitelist, blacklist and rate limit checks")
        ("strict_sanitization", po::value<bool>(&config.strictSanitization)->default_value(false),
            "strips everything but word characters, whitespace and basic punctuation")
        ("custom_blacklist_patterns", po::value<std::string>(&config.customBlacklistPatterns)->default_value(""),
            "case-insensitive substrings that block a message, separated by ';' or ','")
        ("custom_whitelist_patterns", po::value<std::string>(&config.customWhitelistPatterns)->default_value(""),
            "case-insensitive substrings that bypass blacklist and rate limit, separated by ';' or ','")
        ("session_idle_timeout", po::value<int>(&config.sessionIdleTimeout)->default_value(0),
            "seconds after which an idle session's rate limit state is dropped (0 keeps it)")
        ;

    po::options_description cmdline_options;
    cmdline_options.add(generic).add(options);

    po::options_description config_file_options;
    config_file_options.add(options);

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).options(cmdline_options).allow_unregistered().run(), vm);
    po::notify(vm);

    if (vm.count("help")) {
        std::cout << cmdline_options << "\n";
        exit(EXIT_SUCCESS);
    }

    if (vm["config"].defaulted()) {
        configFile = ResolveDefaultPath({"promptguard.cfg", configFile});
    }
    if (vm["logger_config"].defaulted()) {
        config.loggerConfig = ResolveDefaultPath({"logger.cfg", config.loggerConfig});
    }

    std::ifstream ifs(configFile.c_str());
    if (!ifs) {
        throw std::runtime_error("Cannot open configuration file: " + configFile);
    }

    po::store(po::parse_config_file(ifs, config_file_options), vm);
    po::notify(vm);

    return config;
}
