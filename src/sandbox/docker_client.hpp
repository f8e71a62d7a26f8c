#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "sandbox/process_runner.hpp"

namespace agentbox::sandbox {

struct DockerCommandOptions {
    std::chrono::milliseconds timeout{30000};
    std::optional<std::string> stdin_data;
};

// Seam over the docker binary so runtimes can be driven by a fake in tests.
class DockerClient {
public:
    virtual ~DockerClient() = default;

    // `args` excludes the docker binary itself.
    virtual ProcessResult Run(const std::vector<std::string>& args,
                              const DockerCommandOptions& options) = 0;
};

class CliDockerClient : public DockerClient {
public:
    explicit CliDockerClient(std::string binary = "docker");

    ProcessResult Run(const std::vector<std::string>& args,
                      const DockerCommandOptions& options) override;

private:
    std::string binary_;
};

}  // namespace agentbox::sandbox
