#include "sandbox/docker_client.hpp"

#include <iostream>

namespace agentbox::sandbox {

CliDockerClient::CliDockerClient(std::string binary)
    : binary_(std::move(binary)) {}

ProcessResult CliDockerClient::Run(const std::vector<std::string>& args,
                                   const DockerCommandOptions& options) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(binary_);
    argv.insert(argv.end(), args.begin(), args.end());

    ProcessOptions process_options{};
    process_options.timeout = options.timeout;
    process_options.stdin_data = options.stdin_data;
    auto result = ProcessRunner::Run(argv, process_options);
    if (result.exit_code != 0) {
        std::cerr << "[docker] " << (args.empty() ? std::string() : args.front())
                  << " exit=" << result.exit_code
                  << (result.timed_out ? " timed_out=true" : "") << std::endl;
    }
    return result;
}

}  // namespace agentbox::sandbox
