#pragma once

#include <map>
#include <string>
#include <vector>

namespace coderun {
namespace provider {

struct CloudProviderConfig {
    bool enabled = true;
    std::string name = "cloud";
    int priority = 10;
    std::string endpoint;  // scheme://host[:port], e.g. "https://sandbox.example.com"
    std::string api_key;   // sent as X-API-Key when non-empty
    std::string execute_path = "/v1/execute";
    std::string health_path = "/v1/health";
    int network_margin_seconds = 5;  // added to the execution timeout for the transport read timeout
    std::vector<std::string> languages{"python", "javascript", "typescript", "bash", "java", "r"};
    size_t max_output_bytes = 1024u * 1024u;
};

// One runnable image per canonical language. "{file}" in command expands to the source path in the unit.
struct ImageSpec {
    std::string image;
    std::string command;
    std::string filename;
};

struct ContainerProviderConfig {
    bool enabled = true;
    std::string name = "container";
    int priority = 20;
    std::string docker_binary = "docker";
    std::string work_root = "/tmp";
    int memory_mb = 256;
    double cpus = 0.5;
    int pids_limit = 100;
    int tmpfs_mb = 64;           // size of the writable /tmp inside the unit
    bool allow_network = false;  // operator-level only
    int teardown_timeout_ms = 10000;
    std::map<std::string, ImageSpec> images;  // canonical language -> image
    size_t max_output_bytes = 1024u * 1024u;
};

// Built-in language -> image table used when none is configured
inline std::map<std::string, ImageSpec> default_container_images() {
    return {
        {"python", {"python:3.11-slim", "python3 {file}", "main.py"}},
        {"javascript", {"node:20-slim", "node {file}", "main.js"}},
        {"typescript", {"node:20-slim", "npx --yes ts-node {file}", "main.ts"}},
        {"bash", {"alpine:3.18", "sh {file}", "main.sh"}},
        {"go", {"golang:1.21-alpine", "go run {file}", "main.go"}},
        {"rust", {"rust:1.74-slim", "rustc -o /tmp/a.out {file} && /tmp/a.out", "main.rs"}},
        {"java", {"openjdk:21-slim", "java {file}", "Main.java"}},
        {"ruby", {"ruby:3.2-slim", "ruby {file}", "main.rb"}},
        {"php", {"php:8.2-cli", "php {file}", "main.php"}},
        {"csharp", {"mcr.microsoft.com/dotnet/sdk:8.0", "dotnet script {file}", "main.csx"}},
    };
}

}  // namespace provider
}  // namespace coderun
