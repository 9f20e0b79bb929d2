// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <manifold/core/client_config.hpp>
#include <manifold/core/transfer_driver.hpp>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace manifold::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::string manifest;
    std::optional<std::string> directory;
    std::optional<std::string> priorities;
    std::string config_path;
    bool no_fallback{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::vector<std::string> errors; // Unknown options, missing values
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Config file (if any) overlaid by command line flags
[[nodiscard]] std::expected<core::ClientConfig, std::error_code>
resolve_config(const CliArgs& args) noexcept;

// Process every entry of the manifest; 0 when nothing failed
[[nodiscard]] CliResult transfer(const CliArgs& args) noexcept;

// One line per entry plus totals
void print_summary(const core::TransferReport& report) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace manifold::cli
