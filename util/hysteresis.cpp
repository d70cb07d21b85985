#include <string.h>

#include "hysteresis.h"

const char* thresh_mode_name(THRESH_MODE mode) {
    switch (mode) {
    case THRESH_MIDPOINT: return "midpoint";
    case THRESH_PLATEAU: return "plateau";
    }
    return "unknown";
}

int parse_thresh_mode(const char* s, THRESH_MODE& mode) {
    if (!strcmp(s, "midpoint") || !strcmp(s, "any")) {
        mode = THRESH_MIDPOINT;
    } else if (!strcmp(s, "plateau") || !strcmp(s, "full")) {
        mode = THRESH_PLATEAU;
    } else {
        return -1;
    }
    return 0;
}

const char* shutter_state_name(SHUTTER_STATE state) {
    return state == SHUTTER_OPEN ? "open" : "closed";
}

void compute_thresholds(
    const LEVELS& levels, const HYSTERESIS_PARAMS& params, THRESHOLDS& thr
) {
    double swing = levels.swing();
    if (params.mode == THRESH_PLATEAU) {
        thr.open = levels.lo + params.plateau_frac*swing;
        thr.close = thr.open - params.plateau_hyst_frac*swing;
    } else {
        double band = params.band_frac*swing;
        thr.open = levels.mid + band;
        thr.close = levels.mid - band;
    }
}

SHUTTER_STATE next_state(
    SHUTTER_STATE state, double value, const THRESHOLDS& thr
) {
    switch (state) {
    case SHUTTER_CLOSED:
        if (value >= thr.open) return SHUTTER_OPEN;
        break;
    case SHUTTER_OPEN:
        if (value <= thr.close) return SHUTTER_CLOSED;
        break;
    }
    return state;
}

void hysteresis_states(
    const vector<double>& x, const THRESHOLDS& thr,
    vector<SHUTTER_STATE>& states
) {
    states.resize(x.size());
    SHUTTER_STATE state = SHUTTER_CLOSED;
    for (size_t i=0; i<x.size(); i++) {
        state = next_state(state, x[i], thr);
        states[i] = state;
    }
}

void find_segments(
    const vector<SHUTTER_STATE>& states, int min_len, vector<SEGMENT>& segs
) {
    segs.clear();
    int n = (int)states.size();
    int start = -1;
    for (int i=0; i<=n; i++) {
        bool open = i<n && states[i] == SHUTTER_OPEN;
        if (open && start < 0) {
            start = i;
        } else if (!open && start >= 0) {
            // run ended at i-1 (or at the last frame)
            //
            SEGMENT seg(start, i-1);
            if (seg.nframes() >= min_len) {
                segs.push_back(seg);
            }
            start = -1;
        }
    }
}

int count_crossings(const vector<double>& x, double thr) {
    int n = 0;
    for (size_t i=1; i<x.size(); i++) {
        if ((x[i-1] >= thr) != (x[i] >= thr)) n++;
    }
    return n;
}
