#pragma once
#include <time.h>
#include <cstdint>
#include <cstdio>
#include <sys/types.h>

// single status line, redrawn at most 10 times per second
class Progress {
    public:
    Progress(size_t fsize, off_t start_offset = 0, FILE* out = stderr) : m_fsize(fsize), m_start_offset(start_offset), m_out(out) {
        clock_gettime(CLOCK_MONOTONIC, &m_start_time);
        m_prev_time = m_start_time;
    }
    void update(off_t offset, bool final = false);
    void found(size_t n = 1) { m_found += n; }
    void finish(off_t offset) { update(offset, true); }

    size_t nfound() const { return m_found; }

    private:
    timespec m_start_time, m_prev_time;
    size_t m_fsize;
    off_t m_start_offset;
    FILE* m_out;
    size_t m_found = 0;
    size_t m_spinner_idx = 0;
};
