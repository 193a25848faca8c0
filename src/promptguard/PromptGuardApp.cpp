#include "PromptGuardApp.hpp"

#include "PromptGuardConfig.hpp"
#include "security/ContentModerator.hpp"
#include "security/InjectionDetector.hpp"
#include "security/InputSanitizer.hpp"
#include "security/SecurityErrors.hpp"

#include "easylogging++.h"

#include <chrono>
#include <istream>
#include <ostream>

PromptGuardApp::PromptGuardApp(const PromptGuardConfig& config)
    : config_{config} {
    ValidateConfigOrThrow(config_);

    sanitizer_ = std::make_unique<security::InputSanitizer>(config_.maxInputLength);
    detector_ = std::make_unique<security::InjectionDetector>(ResolveSecurityLevel(config_));
    moderator_ = std::make_unique<security::ContentModerator>(
        sanitizer_.get(), detector_.get(), BuildModeratorOptions(config_));
}

PromptGuardApp::~PromptGuardApp() = default;

std::size_t PromptGuardApp::Run(std::istream& input, std::ostream& output) {
    std::size_t processed = 0;
    std::string line;

    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        ProcessMessage(line, output);
        ++processed;
    }

    LOG(INFO) << "Processed " << processed << " message(s) for session " << config_.sessionId;
    return processed;
}

void PromptGuardApp::ProcessMessage(const std::string& text, std::ostream& output) {
    try {
        const auto sanitized = moderator_->Validate(text, config_.sessionId);
        output << "ACCEPT\t" << sanitized << '\n';
    } catch (const security::ValidationException& e) {
        output << "REJECT\t" << security::ToString(e.Category()) << '\t' << e.what() << '\n';
    }

    if (config_.sessionIdleTimeout > 0) {
        moderator_->PurgeIdleSessions(std::chrono::seconds{config_.sessionIdleTimeout});
    }
}

security::ContentModerator* PromptGuardApp::GetModerator() { return moderator_.get(); }
