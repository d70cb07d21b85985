#ifndef SHUTTERCAL_PULSE_STATS_H
#define SHUTTERCAL_PULSE_STATS_H

// per-pulse photometry.
// For each final segment, relative to a local baseline:
//      peak above baseline and where it occurs
//      area above baseline (metric*seconds; an exposure-equivalent)
//      for each fraction f: first and last frame at or above f*peak
//          (the pulse's own peak, not the global one)
//
// Nothing is dropped here; a segment with no usable peak
// gets undefined fraction timings.

#include <vector>

#include "hysteresis.h"
#include "consolidate.h"

using std::vector;

#define PEAK_EPS    1e-9

struct PULSE_STATS_PARAMS {
    BASELINE_PARAMS baseline;
    vector<double> fracs;

    PULSE_STATS_PARAMS() {
        fracs.push_back(0.10);
        fracs.push_back(0.50);
        fracs.push_back(0.90);
    }
};

struct FRAC_TIMING {
    double frac;
    bool defined;
    int start_frame;
    int end_frame;
    double ms;          // start..end inclusive
};

struct PULSE_RECORD {
    int pulse_id;       // 1-based, in order of start
    SEGMENT seg;
    double start_sec;
    double end_sec;
    double duration_ms;
    double baseline;
    double peak_bs;
    int peak_frame;
    double peak_sec;
    double auc;         // metric*seconds
    vector<FRAC_TIMING> fracs;
};

// column tag for a fraction: 0.1 -> 10
//
extern int frac_tag(double frac);

extern void frac_timing(
    const vector<double>& trace, int first_frame, double peak, double frac,
    double fps, FRAC_TIMING&
);

extern void analyze_pulse(
    const vector<double>& sm, const SEGMENT&, int pulse_id, double fps,
    double global_lo, const PULSE_STATS_PARAMS&, PULSE_RECORD&
);

// segments are numbered by ascending start
//
extern void analyze_pulses(
    const vector<double>& sm, const vector<SEGMENT>& segs, double fps,
    double global_lo, const PULSE_STATS_PARAMS&, vector<PULSE_RECORD>&
);

#endif
