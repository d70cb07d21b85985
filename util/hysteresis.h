#ifndef SHUTTERCAL_HYSTERESIS_H
#define SHUTTERCAL_HYSTERESIS_H

// decide, frame by frame, whether the shutter is open,
// and extract the open runs as segments.
//
// The decision is a two-state machine with two thresholds:
//      CLOSED -> OPEN      when value >= thr_open
//      OPEN -> CLOSED      when value <= thr_close
// Values between the thresholds never change the state,
// so noise near one threshold can't make the state flicker.

#include <vector>

#include "shutter_signal.h"

using std::vector;

typedef enum {
    SHUTTER_CLOSED = 0,
    SHUTTER_OPEN
} SHUTTER_STATE;

// how thresholds are placed within the open/closed range
//
typedef enum {
    THRESH_MIDPOINT = 0,    // mid +- band_frac*swing
    THRESH_PLATEAU          // just below the bright plateau
} THRESH_MODE;

struct HYSTERESIS_PARAMS {
    THRESH_MODE mode;
    double band_frac;           // MIDPOINT: half-band as fraction of swing
    double plateau_frac;        // PLATEAU: thr_open = lo + plateau_frac*swing
    double plateau_hyst_frac;   // PLATEAU: thr_close = thr_open - this*swing

    HYSTERESIS_PARAMS() {
        mode = THRESH_MIDPOINT;
        band_frac = 0.10;
        plateau_frac = 0.97;
        plateau_hyst_frac = 0.03;
    }
};

struct THRESHOLDS {
    double open;
    double close;

    THRESHOLDS() {
        open = close = 0;
    }
    THRESHOLDS(double _open, double _close) {
        open = _open;
        close = _close;
    }
};

// an open run, frames start..end inclusive
//
struct SEGMENT {
    int start;
    int end;

    SEGMENT() {
        start = end = 0;
    }
    SEGMENT(int _start, int _end) {
        start = _start;
        end = _end;
    }
    int nframes() const {
        return end - start + 1;
    }
    bool operator==(const SEGMENT& s) const {
        return start == s.start && end == s.end;
    }
};

extern const char* thresh_mode_name(THRESH_MODE);
extern int parse_thresh_mode(const char*, THRESH_MODE&);
extern const char* shutter_state_name(SHUTTER_STATE);

extern void compute_thresholds(
    const LEVELS&, const HYSTERESIS_PARAMS&, THRESHOLDS&
);

// the transition function
//
extern SHUTTER_STATE next_state(
    SHUTTER_STATE state, double value, const THRESHOLDS&
);

// run the state machine over a series, starting CLOSED
//
extern void hysteresis_states(
    const vector<double>& x, const THRESHOLDS&, vector<SHUTTER_STATE>& states
);

// maximal OPEN runs of at least min_len frames.
// Shorter runs are dropped.
//
extern void find_segments(
    const vector<SHUTTER_STATE>& states, int min_len, vector<SEGMENT>& segs
);

// number of adjacent pairs on different sides of thr
// (a measure of chatter)
//
extern int count_crossings(const vector<double>& x, double thr);

#endif
