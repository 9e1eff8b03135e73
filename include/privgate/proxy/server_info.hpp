#pragma once

#include <chrono>
#include <string>

namespace privgate {
namespace proxy {

struct ServerInfoPolicy {
    int attempts = 100;
    std::chrono::milliseconds retry_interval{100};
};

// Polls a JSON file written by the proxy until it parses and carries a
// numeric "port". Partial writes are retried. Throws ServerInfoError once
// the attempts are exhausted.
int readServerInfo(const std::string& path, const ServerInfoPolicy& policy = {});

}}
