#include "ClassificationPipeline.hpp"
#include "ExclusiveLock.hpp"
#include "Logger.hpp"
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

namespace TrapWatch {

CommandClassifier::CommandClassifier(const std::string& command, CommandExecutor executor)
    : command_(command), executor_(std::move(executor)) {}

bool CommandClassifier::parseScore(const std::string& output, double& score) {
    std::vector<std::string> lines;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }

    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        std::string trimmed = *it;
        trimmed.erase(0, trimmed.find_first_not_of(" \t\r"));
        trimmed.erase(trimmed.find_last_not_of(" \t\r") + 1);
        if (trimmed.empty()) {
            continue;
        }

        char* end = nullptr;
        double value = std::strtod(trimmed.c_str(), &end);
        if (end != trimmed.c_str() && *end == '\0') {
            score = value;
            return true;
        }
    }
    return false;
}

double CommandClassifier::classify(const std::string& imagePath) {
    if (command_.empty()) {
        throw std::runtime_error("No classification command configured");
    }

    CommandResult result = executor_(command_ + " " + shellQuote(imagePath));
    if (result.exitCode != 0) {
        throw std::runtime_error("Classifier exited with status " + std::to_string(result.exitCode) +
                                 " for " + imagePath);
    }

    double score = 0.0;
    if (!parseScore(result.output, score)) {
        throw std::runtime_error("Classifier produced no score for " + imagePath);
    }
    return score;
}

CommandActuator::CommandActuator(const std::string& command, CommandExecutor executor)
    : command_(command), executor_(std::move(executor)) {}

void CommandActuator::onDetection(const std::string& imagePath, double score) {
    if (command_.empty()) {
        return;
    }

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4) << score;

    LOG_INFO("Running deterrent for " + imagePath);
    CommandResult result = executor_(command_ + " " + shellQuote(imagePath) + " " + ss.str());
    if (result.exitCode != 0) {
        LOG_ERROR("Deterrent command failed with status " + std::to_string(result.exitCode));
    }
}

ClassificationPipeline::ClassificationPipeline(std::shared_ptr<Classifier> classifier,
                                               std::shared_ptr<DetectionActuator> actuator,
                                               const PipelineConfig& config,
                                               ImageEventCallback callback)
    : classifier_(std::move(classifier)), actuator_(std::move(actuator)),
      config_(config), callback_(std::move(callback)) {}

double ClassificationPipeline::process(const std::string& imagePath, const std::string& folder) {
    double score;
    {
        ScopedExclusiveLock lock;
        LOG_DEBUG("Classifying " + imagePath);
        score = classifier_->classify(imagePath);
    }

    if (score < 0.0) {
        LOG_INFO("No animal detected in " + imagePath);
        score = 0.0;
    }

    std::ostringstream pct;
    pct << std::fixed << std::setprecision(2) << score * 100.0;
    LOG_INFO("Chance of puma in " + imagePath + ": " + pct.str() + "%");

    bool isPuma = score > config_.threshold;
    if (isPuma && actuator_) {
        try {
            actuator_->onDetection(imagePath, score);
        } catch (const std::exception& e) {
            LOG_ERROR("Deterrent failed for " + imagePath + ": " + std::string(e.what()));
        }
    }

    std::string destDir = isPuma ? config_.classifiedPumaDir : config_.classifiedOtherDir;
    std::string finalPath = imagePath;
    std::string finalFolder = folder;

    if (!destDir.empty()) {
        try {
            finalPath = moveToClassifiedFolder(imagePath, destDir);
            finalFolder = destDir;
            LOG_INFO("Moved " + imagePath + " to classification folder " + finalPath);
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to move " + imagePath + " into classification folder: " + std::string(e.what()));
            return score;
        }
    }

    if (callback_) {
        try {
            callback_("image_added", {{"path", finalPath}, {"folder", finalFolder}});
        } catch (const std::exception& e) {
            LOG_ERROR("Error calling image callback: " + std::string(e.what()));
        }
    }

    return score;
}

std::string ClassificationPipeline::moveToClassifiedFolder(const std::string& imagePath,
                                                           const std::string& destDir) {
    fs::create_directories(destDir);
    fs::path dest = fs::path(destDir) / fs::path(imagePath).filename();

    std::error_code ec;
    fs::rename(imagePath, dest, ec);
    if (ec) {
        // rename() cannot cross filesystems
        fs::copy_file(imagePath, dest, fs::copy_options::overwrite_existing);
        fs::remove(imagePath);
    }
    return dest.string();
}

} // namespace TrapWatch
