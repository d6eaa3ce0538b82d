#pragma once
#include "CommandRunner.hpp"
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace TrapWatch {

using ImageEventCallback = std::function<void(const std::string& eventType, const nlohmann::json& data)>;

class Classifier {
public:
    virtual ~Classifier() = default;

    // Probability in [0,1] that the image shows a puma. A negative value
    // means nothing was detected.
    virtual double classify(const std::string& imagePath) = 0;
};

// Runs "<command> '<path>'" and reads the score from the last numeric line
// of its output. Throws std::runtime_error on non-zero exit or when no
// score is found.
class CommandClassifier : public Classifier {
public:
    explicit CommandClassifier(const std::string& command, CommandExecutor executor = runCommand);

    double classify(const std::string& imagePath) override;

    static bool parseScore(const std::string& output, double& score);

private:
    std::string command_;
    CommandExecutor executor_;
};

class DetectionActuator {
public:
    virtual ~DetectionActuator() = default;

    virtual void onDetection(const std::string& imagePath, double score) = 0;
};

// Deterrent hook, e.g. a sound player. Failures are logged.
class CommandActuator : public DetectionActuator {
public:
    explicit CommandActuator(const std::string& command, CommandExecutor executor = runCommand);

    void onDetection(const std::string& imagePath, double score) override;

private:
    std::string command_;
    CommandExecutor executor_;
};

struct PipelineConfig {
    double threshold{0.5};
    std::string classifiedPumaDir;
    std::string classifiedOtherDir;
};

class ClassificationPipeline {
public:
    ClassificationPipeline(std::shared_ptr<Classifier> classifier,
                           std::shared_ptr<DetectionActuator> actuator,
                           const PipelineConfig& config,
                           ImageEventCallback callback = nullptr);

    // Classifies one stable image under the process-wide exclusive lock,
    // then actuates and files it. Returns the score. Classifier errors
    // propagate after the lock is released.
    double process(const std::string& imagePath, const std::string& folder);

    const PipelineConfig& config() const { return config_; }

private:
    std::string moveToClassifiedFolder(const std::string& imagePath, const std::string& destDir);

    std::shared_ptr<Classifier> classifier_;
    std::shared_ptr<DetectionActuator> actuator_;
    PipelineConfig config_;
    ImageEventCallback callback_;
};

} // namespace TrapWatch
