#pragma once

#include <string>
#include <vector>

#include "pipeline/depth_session.hpp"

// Load KEY=VALUE lines from a .env file into the environment.
// Variables already set in the environment win.
void load_env_file(const std::string& filepath = ".env");

// Comma-separated list, trimmed and lower-cased; empty items dropped.
std::vector<std::string> split_venue_list(const std::string& csv);

// Session settings from DEPTH_* variables, falling back to SessionConfig defaults.
// Throws std::runtime_error for values that cannot be used (empty venue list,
// unknown window label, non-numeric limit).
SessionConfig session_config_from_env();

// DEPTH_HTTP_PORT, default 8080.
unsigned short http_port_from_env();
