/**
 * @file ExternalToolStrategy.cpp
 * @brief Implementation of ExternalToolStrategy.
 */

#include "infrastructure/ExternalToolStrategy.hpp"
#include <iostream>
#include <memory>
#include <sstream>
#include "infrastructure/ProcessRunner.hpp"

namespace docingest::infrastructure {

using domain::ErrorKind;
using domain::StrategyResult;

ExternalToolStrategy::ExternalToolStrategy(std::string strategyName,
                                           std::string tool,
                                           std::vector<std::string> options,
                                           std::chrono::seconds timeout,
                                           OutputFilter filter)
    : m_name(std::move(strategyName)),
      m_tool(std::move(tool)),
      m_options(std::move(options)),
      m_timeout(timeout),
      m_filter(std::move(filter)) {}

StrategyResult ExternalToolStrategy::extract(const std::string& localPath) {
    if (!ProcessRunner::HasTool(m_tool)) {
        return StrategyResult::Fail(ErrorKind::EngineMissing, m_tool + " is not installed");
    }

    std::vector<std::string> argv;
    argv.reserve(m_options.size() + 2);
    argv.push_back(m_tool);
    argv.insert(argv.end(), m_options.begin(), m_options.end());
    argv.push_back(localPath);

    ProcessResult run = ProcessRunner::Run(argv, m_timeout);
    if (!run.launched) {
        return StrategyResult::Fail(ErrorKind::EngineMissing, "could not start " + m_tool);
    }
    if (run.timedOut) {
        return StrategyResult::Fail(ErrorKind::EngineFailure,
                                    m_tool + " timed out after " + std::to_string(m_timeout.count()) + "s");
    }
    if (run.exitCode != 0) {
        std::string detail = run.err.empty() ? "exit code " + std::to_string(run.exitCode) : run.err;
        while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r')) detail.pop_back();
        std::cerr << "[" << m_name << "] " << m_tool << " failed: " << detail << std::endl;
        return StrategyResult::Fail(ErrorKind::EngineFailure, m_tool + " failed: " + detail);
    }

    return StrategyResult::Ok(m_filter ? m_filter(run.out) : run.out);
}

std::shared_ptr<ExternalToolStrategy> ExternalToolStrategy::Catdoc(std::chrono::seconds timeout) {
    return std::make_shared<ExternalToolStrategy>("catdoc", "catdoc",
                                                  std::vector<std::string>{"-d", "utf-8", "-w"}, timeout);
}

std::shared_ptr<ExternalToolStrategy> ExternalToolStrategy::Antiword(std::chrono::seconds timeout) {
    return std::make_shared<ExternalToolStrategy>("antiword", "antiword",
                                                  std::vector<std::string>{"-m", "UTF-8.txt"}, timeout);
}

std::shared_ptr<ExternalToolStrategy> ExternalToolStrategy::Xls2Csv(std::chrono::seconds timeout) {
    return std::make_shared<ExternalToolStrategy>("xls2csv", "xls2csv",
                                                  std::vector<std::string>{"-q", "0", "-c", "\t", "-d", "utf-8"},
                                                  timeout, &ExternalToolStrategy::NormalizeSheetRows);
}

std::string ExternalToolStrategy::NormalizeSheetRows(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    std::istringstream in(raw);
    std::string line;
    while (std::getline(in, line)) {
        std::string row;
        row.reserve(line.size());
        for (char c : line) {
            if (c != '\f' && c != '\r') row.push_back(c);
        }
        if (row.empty() && line.find('\f') != std::string::npos) continue;
        out += row;
        out += '\n';
    }
    return out;
}

} // namespace docingest::infrastructure
