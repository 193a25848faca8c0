#pragma once

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <string>

struct PromptGuardConfig;

namespace security {
class ContentModerator;
class InjectionDetector;
class InputSanitizer;
}

// Line-oriented host for the input-security pipeline: every input line is one
// message for the configured session, every output line one verdict.
class PromptGuardApp {
public:
    // config is held by reference and must outlive the app.
    explicit PromptGuardApp(const PromptGuardConfig& config);
    ~PromptGuardApp();

    std::size_t Run(std::istream& input, std::ostream& output);
    void ProcessMessage(const std::string& text, std::ostream& output);

    security::ContentModerator* GetModerator();

private:
    const PromptGuardConfig& config_;
    std::unique_ptr<security::InputSanitizer> sanitizer_;
    std::unique_ptr<security::InjectionDetector> detector_;
    std::unique_ptr<security::ContentModerator> moderator_;
};
