#ifndef SHUTTERCAL_CONSOLIDATE_H
#define SHUTTERCAL_CONSOLIDATE_H

// reduce the raw open segments to one segment per commanded pulse.
// Three passes, done in this order:
//
// 1) merge: join segments separated by a short closed gap
//      (e.g. a single missed bright frame mid-pulse)
// 2) strength filter: drop segments whose peak or area above baseline
//      is too small (chatter that barely crossed thr_open)
// 3) window reduction: group segments belonging to the same
//      pulse window and keep one per group
//
// Segments are kept in flat arrays sorted by start;
// groups refer to them by index.
// No pass ever increases the number of segments.

#include <vector>

#include "hysteresis.h"

using std::vector;

typedef enum {
    GROUP_BY_ANCHOR = 0,    // starts within half the pulse gap of group's 1st
    GROUP_BY_GAP            // new group when start-to-start gap > boundary
} GROUP_MODE;

typedef enum {
    SELECT_LONGEST = 0,     // most frames
    SELECT_STRONGEST        // largest area above baseline
} SELECT_POLICY;

struct BASELINE_PARAMS {
    int window;         // use at most this many frames before a segment
    int min_frames;     // else fall back to the global low level

    BASELINE_PARAMS() {
        window = 50;
        min_frames = 5;
    }
};

struct CONSOLIDATE_PARAMS {
    bool merge;
    int merge_gap_frames;   // merge if closed gap <= this

    bool strength_filter;
    double peak_min;        // min peak above baseline
    double auc_min_sec;     // area above baseline must exceed this
    bool local_baseline;    // else global low level
    BASELINE_PARAMS baseline;

    bool one_per_window;
    GROUP_MODE group_mode;
    double pulse_gap_sec;       // GROUP_BY_ANCHOR: commanded inter-pulse gap
    double boundary_gap_sec;    // GROUP_BY_GAP
    SELECT_POLICY select;

    CONSOLIDATE_PARAMS() {
        merge = true;
        merge_gap_frames = 0;
        strength_filter = true;
        peak_min = 10;
        auc_min_sec = 0.005;
        local_baseline = false;
        one_per_window = true;
        group_mode = GROUP_BY_GAP;
        pulse_gap_sec = 2.0;
        boundary_gap_sec = 2.0;
        select = SELECT_STRONGEST;
    }
};

// strength of a segment relative to a baseline
//
struct STRENGTH {
    double baseline;
    double peak_bs;     // max value minus baseline
    double auc_sec;     // sum of positive excess, times frame period
};

// indices first..last (inclusive) into a sorted segment array
//
struct SEGMENT_GROUP {
    int first;
    int last;
};

extern const char* group_mode_name(GROUP_MODE);
extern int parse_group_mode(const char*, GROUP_MODE&);
extern const char* select_policy_name(SELECT_POLICY);
extern int parse_select_policy(const char*, SELECT_POLICY&);

extern void sort_segments(vector<SEGMENT>&);

extern void merge_close_segments(
    const vector<SEGMENT>& in, int gap_frames, vector<SEGMENT>& out
);

extern void segment_strength(
    const vector<double>& sm, const SEGMENT&, double baseline, double fps,
    STRENGTH&
);

// the baseline a consolidation pass uses for a segment
//
extern double segment_baseline(
    const vector<double>& sm, const SEGMENT&, double global_lo,
    const CONSOLIDATE_PARAMS&
);

extern void filter_segments_by_strength(
    const vector<SEGMENT>& in, const vector<double>& sm, double fps,
    double global_lo, const CONSOLIDATE_PARAMS&, vector<SEGMENT>& out
);

// segs must be sorted by start
//
extern void group_segments(
    const vector<SEGMENT>& segs, double fps, GROUP_MODE mode,
    double gap_sec, vector<SEGMENT_GROUP>& groups
);

// pick one segment per group; ties go to the earliest
//
extern void select_from_groups(
    const vector<SEGMENT>& segs, const vector<SEGMENT_GROUP>& groups,
    const vector<double>& sm, double fps, double global_lo,
    const CONSOLIDATE_PARAMS&, vector<SEGMENT>& out
);

extern void pick_one_segment_per_window(
    const vector<SEGMENT>& in, const vector<double>& sm, double fps,
    double global_lo, const CONSOLIDATE_PARAMS&, vector<SEGMENT>& out
);

#endif
