// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>

namespace manifold::cli {

// Minimal progress bar for CLI
class ProgressBar {
public:
    explicit ProgressBar(std::uint64_t total, std::string_view label = {}, std::ostream* out = nullptr);

    // Update progress
    void update(std::uint64_t current, std::uint64_t speed_bps = 0) noexcept;

    // Finish the progress bar
    void finish() noexcept;

    // Clear the progress bar line
    void clear() noexcept;

    [[nodiscard]] std::uint64_t total() const noexcept { return total_; }
    void total(std::uint64_t t) noexcept { total_ = t; }

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) noexcept { label_ = l; }

    [[nodiscard]] static std::string render_bar(double percent, int width = 30);
    [[nodiscard]] static std::string format_speed(std::uint64_t bps);
    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes);
    [[nodiscard]] static std::string format_time(std::uint64_t seconds);

private:
    std::ostream& out() const noexcept;

    std::uint64_t total_{0};
    std::uint64_t last_drawn_{0};
    bool drawn_{false};
    std::string label_;
    bool finished_{false};
    std::ostream* out_{nullptr};
};

// Spinner for transfers of unknown size
class Spinner {
public:
    explicit Spinner(std::ostream* out = nullptr) noexcept : out_(out) {}

    void update(std::uint64_t current) noexcept;
    void finish() noexcept;
    void clear() noexcept;

private:
    std::size_t frame_{0};
    std::ostream* out_{nullptr};
};

} // namespace manifold::cli
