/**
 * @file StrategyChain.cpp
 * @brief Implementation of StrategyChain.
 */

#include "application/StrategyChain.hpp"
#include <filesystem>
#include <iostream>
#include <sstream>
#include <system_error>

namespace docingest::application {

namespace fs = std::filesystem;

using domain::ErrorKind;
using domain::ExtractionOutcome;
using domain::StrategyResult;

namespace {

struct Cause {
    std::string strategy;
    ErrorKind kind;
    std::string message;
};

ExtractionOutcome FailureFrom(const std::vector<Cause>& causes) {
    if (causes.size() == 1) {
        return ExtractionOutcome::Failure(causes.front().kind, causes.front().message);
    }
    std::ostringstream msg;
    msg << "All extraction strategies failed: ";
    for (size_t i = 0; i < causes.size(); ++i) {
        if (i > 0) msg << "; ";
        msg << causes[i].strategy << " error: " << causes[i].message;
    }
    return ExtractionOutcome::Failure(ErrorKind::CompositeFailure, msg.str());
}

} // namespace

StrategyResult StrategyChain::runGuarded(domain::ExtractionStrategy& strategy, const std::string& localPath) {
    try {
        return strategy.extract(localPath);
    } catch (const std::exception& e) {
        return StrategyResult::Fail(ErrorKind::EngineFailure, e.what());
    }
}

ExtractionOutcome StrategyChain::run(const std::string& localPath) const {
    std::error_code ec;
    if (!fs::is_regular_file(localPath, ec)) {
        return ExtractionOutcome::Failure(ErrorKind::FileNotFound, "File not found: " + localPath);
    }
    auto size = fs::file_size(localPath, ec);
    if (ec) {
        return ExtractionOutcome::Failure(ErrorKind::FileNotFound, "Cannot stat " + localPath + ": " + ec.message());
    }
    if (size == 0) {
        return ExtractionOutcome::Failure(ErrorKind::EmptyFile, "File is empty: " + localPath);
    }
    if (m_steps.empty()) {
        return ExtractionOutcome::Failure(ErrorKind::EngineMissing, "No extraction strategy configured");
    }

    std::vector<Cause> causes;
    std::vector<std::string> warnings;

    for (size_t i = 0; i < m_steps.size(); ++i) {
        const ChainStep& step = m_steps[i];
        const bool isLast = (i + 1 == m_steps.size());
        const std::string name = step.strategy->name();

        StrategyResult attempt = runGuarded(*step.strategy, localPath);
        warnings.insert(warnings.end(), attempt.warnings.begin(), attempt.warnings.end());

        if (!attempt.success) {
            if (step.bestEffort) {
                std::cerr << "[StrategyChain] " << name << " failed, continuing with empty text: " << attempt.error << std::endl;
                warnings.push_back(name + " failed: " + attempt.error);
                return ExtractionOutcome::Success({"", name, warnings});
            }
            causes.push_back({name, attempt.errorKind, attempt.error});
            if (!isLast && step.advanceOnFailure) {
                std::cerr << "[StrategyChain] " << name << " failed: " << attempt.error << ". Trying " << m_steps[i + 1].strategy->name() << std::endl;
                continue;
            }
            return FailureFrom(causes);
        }

        if (!isLast && attempt.text.size() < step.minTextLength) {
            std::cout << "[StrategyChain] " << name << " produced " << attempt.text.size()
                      << " chars (< " << step.minTextLength << "), falling back to " << m_steps[i + 1].strategy->name() << std::endl;
            warnings.push_back(name + " yielded no usable text");
            continue;
        }

        return ExtractionOutcome::Success({std::move(attempt.text), name, std::move(warnings)});
    }

    return FailureFrom(causes);
}

} // namespace docingest::application
