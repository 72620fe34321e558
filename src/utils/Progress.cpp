/**
 * @file Progress.cpp
 * @brief Progress line for long scans: blob offset, percentage, speed, ETA
 *        and the number of records decoded so far.
 *
 * Written to stderr, so it never mixes with the records on stdout.
 */

#include "Progress.hpp"
#include "common.hpp"

#include <array>
#include <string_view>

static constexpr std::array<std::string_view, 4> SPINNER = {
    "|", "/", "-", "\\"
};

static uint64_t elapsed_ns(const timespec& from, const timespec& to) {
    return (to.tv_sec - from.tv_sec) * 1000000000ULL + to.tv_nsec - from.tv_nsec;
}

/**
 * @brief Redraws the progress line.
 *
 * @param offset Current blob offset.
 * @param final Forces the redraw and ends the line.
 */
void Progress::update(off_t offset, bool final){
    timespec cur_time;
    clock_gettime(CLOCK_MONOTONIC, &cur_time);

    if( elapsed_ns(m_prev_time, cur_time) < 100000000 && !final ){
        return;
    }
    m_prev_time = cur_time;

    uint64_t dt = elapsed_ns(m_start_time, cur_time) / 1000000000;
    if( dt == 0 ) dt = 1;

    const uint64_t done = offset > m_start_offset ? offset - m_start_offset : 0;
    const uint64_t speed = done / dt;
    const uint64_t remain = (size_t)offset < m_fsize ? m_fsize - offset : 0;
    const std::string eta = speed ? seconds2human(remain / speed, 1) : "?";

    fmt::print(m_out, "[{}] {:08x}/{:08x} = {:.1f}%, {}/s, {}, eta: {}, records: {}" ANSI_CLEAR_EOL "{}",
        SPINNER[m_spinner_idx],
        offset,
        m_fsize,
        m_fsize ? 100.0*offset/m_fsize : 100.0,
        bytes2human(speed),
        seconds2human(dt),
        eta,
        m_found,
        final ? "\n" : "\r"
        );
    fflush(m_out);

    m_spinner_idx = (m_spinner_idx + 1) % SPINNER.size();
}
