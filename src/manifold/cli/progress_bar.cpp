// Copyright (c) 2026 changcheng967. All rights reserved.

#include <manifold/cli/progress_bar.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace manifold::cli {

namespace {

const char* SPINNER_FRAMES[] = {"-", "\\", "|", "/"};

} // namespace

//=============================================================================
// Spinner
//=============================================================================

void Spinner::update(std::uint64_t current) noexcept {
    auto& os = out_ ? *out_ : std::cout;
    os << "\r" << SPINNER_FRAMES[frame_ % 4] << " " << ProgressBar::format_bytes(current) << "   " << std::flush;
    ++frame_;
}

void Spinner::finish() noexcept {
    auto& os = out_ ? *out_ : std::cout;
    os << "\r done" << std::string(20, ' ') << std::endl;
}

void Spinner::clear() noexcept {
    auto& os = out_ ? *out_ : std::cout;
    os << "\r" << std::string(30, ' ') << "\r" << std::flush;
}

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::uint64_t total, std::string_view label, std::ostream* out)
    : total_(total)
    , label_(label)
    , out_(out) {}

std::ostream& ProgressBar::out() const noexcept {
    return out_ ? *out_ : std::cout;
}

void ProgressBar::update(std::uint64_t current, std::uint64_t speed_bps) noexcept {
    if (total_ == 0) return;

    double percent = static_cast<double>(current) * 100.0 / static_cast<double>(total_);
    percent = std::clamp(percent, 0.0, 100.0);

    // Only redraw on whole-percent steps
    auto scaled = static_cast<std::uint64_t>(percent);
    auto last_scaled = static_cast<std::uint64_t>(
        static_cast<double>(last_drawn_) * 100.0 / static_cast<double>(total_));

    if (drawn_ && scaled <= last_scaled && !finished_) return;

    last_drawn_ = current;
    drawn_ = true;

    std::string line = "\r";
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }

    line += render_bar(percent);

    line += " ";
    int pct_int = static_cast<int>(percent);
    if (pct_int < 10) line += "  ";
    else if (pct_int < 100) line += " ";
    line += std::to_string(pct_int) + "%";

    line += " (";
    line += format_bytes(current);
    line += "/";
    line += format_bytes(total_);
    line += ")";

    if (speed_bps > 0) {
        line += " @ ";
        line += format_speed(speed_bps);
    }

    std::uint64_t remaining = current < total_ ? total_ - current : 0;
    if (speed_bps > 0 && remaining > 0) {
        line += " ETA: ";
        line += format_time(remaining / speed_bps);
    }

    // Clear rest of line
    line += std::string(10, ' ');

    out() << line << std::flush;
}

void ProgressBar::finish() noexcept {
    if (finished_) return;
    finished_ = true;
    if (total_ > 0) {
        update(total_, 0);
    }
    out() << std::endl;
}

void ProgressBar::clear() noexcept {
    out() << "\r" << std::string(100, ' ') << "\r" << std::flush;
}

std::string ProgressBar::render_bar(double percent, int width) {
    percent = std::clamp(percent, 0.0, 100.0);
    const int filled = static_cast<int>(std::round(width * percent / 100.0));
    const int empty = width - filled;

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    bar += ">";
    bar.append(static_cast<std::size_t>(empty), ' ');
    bar += "]";
    return bar;
}

std::string ProgressBar::format_speed(std::uint64_t bps) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1);
    if (bps >= GB) {
        ss << (static_cast<double>(bps) / GB) << " GB/s";
    } else if (bps >= MB) {
        ss << (static_cast<double>(bps) / MB) << " MB/s";
    } else if (bps >= KB) {
        ss << (static_cast<double>(bps) / KB) << " KB/s";
    } else {
        return std::to_string(bps) + " B/s";
    }
    return ss.str();
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;
    constexpr std::uint64_t TB = 1024 * GB;

    std::ostringstream ss;
    ss << std::fixed;
    if (bytes >= TB) {
        ss << std::setprecision(2) << (static_cast<double>(bytes) / TB) << " TB";
    } else if (bytes >= GB) {
        ss << std::setprecision(2) << (static_cast<double>(bytes) / GB) << " GB";
    } else if (bytes >= MB) {
        ss << std::setprecision(1) << (static_cast<double>(bytes) / MB) << " MB";
    } else if (bytes >= KB) {
        ss << std::setprecision(0) << (static_cast<double>(bytes) / KB) << " KB";
    } else {
        return std::to_string(bytes) + " B";
    }
    return ss.str();
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    std::ostringstream ss;
    if (hours > 0) {
        ss << hours << "h " << std::setfill('0') << std::setw(2) << minutes;
        return ss.str() + "m " + std::to_string(secs) + "s";
    } else if (minutes > 0) {
        return std::to_string(minutes) + "m " + std::to_string(secs) + "s";
    }
    return std::to_string(secs) + "s";
}

} // namespace manifold::cli
