#include <string.h>
#include <algorithm>

#include "shutter_signal.h"
#include "consolidate.h"

const char* group_mode_name(GROUP_MODE mode) {
    switch (mode) {
    case GROUP_BY_ANCHOR: return "anchor";
    case GROUP_BY_GAP: return "gap";
    }
    return "unknown";
}

int parse_group_mode(const char* s, GROUP_MODE& mode) {
    if (!strcmp(s, "anchor")) {
        mode = GROUP_BY_ANCHOR;
    } else if (!strcmp(s, "gap")) {
        mode = GROUP_BY_GAP;
    } else {
        return -1;
    }
    return 0;
}

const char* select_policy_name(SELECT_POLICY policy) {
    switch (policy) {
    case SELECT_LONGEST: return "longest";
    case SELECT_STRONGEST: return "strongest";
    }
    return "unknown";
}

int parse_select_policy(const char* s, SELECT_POLICY& policy) {
    if (!strcmp(s, "longest")) {
        policy = SELECT_LONGEST;
    } else if (!strcmp(s, "strongest")) {
        policy = SELECT_STRONGEST;
    } else {
        return -1;
    }
    return 0;
}

static bool start_less(const SEGMENT& a, const SEGMENT& b) {
    if (a.start != b.start) return a.start < b.start;
    return a.end < b.end;
}

void sort_segments(vector<SEGMENT>& segs) {
    std::stable_sort(segs.begin(), segs.end(), start_less);
}

void merge_close_segments(
    const vector<SEGMENT>& in, int gap_frames, vector<SEGMENT>& out
) {
    vector<SEGMENT> segs(in);
    sort_segments(segs);
    out.clear();
    for (size_t i=0; i<segs.size(); i++) {
        const SEGMENT& s = segs[i];
        if (out.size()) {
            SEGMENT& prev = out.back();

            // number of closed frames between the two
            //
            int gap = s.start - prev.end - 1;
            if (gap <= gap_frames) {
                prev.end = std::max(prev.end, s.end);
                continue;
            }
        }
        out.push_back(s);
    }
}

void segment_strength(
    const vector<double>& sm, const SEGMENT& seg, double baseline, double fps,
    STRENGTH& st
) {
    double peak = sm[seg.start];
    double auc = 0;
    for (int i=seg.start; i<=seg.end; i++) {
        double v = sm[i];
        if (v > peak) peak = v;
        if (v > baseline) auc += v - baseline;
    }
    st.baseline = baseline;
    st.peak_bs = peak - baseline;
    st.auc_sec = auc/fps;
}

double segment_baseline(
    const vector<double>& sm, const SEGMENT& seg, double global_lo,
    const CONSOLIDATE_PARAMS& params
) {
    if (!params.local_baseline) return global_lo;
    return local_baseline(
        sm, seg.start, global_lo,
        params.baseline.window, params.baseline.min_frames
    );
}

void filter_segments_by_strength(
    const vector<SEGMENT>& in, const vector<double>& sm, double fps,
    double global_lo, const CONSOLIDATE_PARAMS& params, vector<SEGMENT>& out
) {
    out.clear();
    for (size_t i=0; i<in.size(); i++) {
        STRENGTH st;
        double baseline = segment_baseline(sm, in[i], global_lo, params);
        segment_strength(sm, in[i], baseline, fps, st);
        if (st.peak_bs < params.peak_min) continue;
        if (st.auc_sec <= params.auc_min_sec) continue;
        out.push_back(in[i]);
    }
}

void group_segments(
    const vector<SEGMENT>& segs, double fps, GROUP_MODE mode,
    double gap_sec, vector<SEGMENT_GROUP>& groups
) {
    groups.clear();
    if (segs.empty()) return;

    // GROUP_BY_ANCHOR: anything starting within half the commanded gap
    // of the group's first segment is in the same pulse window
    //
    int max_intragap = (int)(0.5*gap_sec*fps);

    SEGMENT_GROUP g;
    g.first = 0;
    for (int i=1; i<(int)segs.size(); i++) {
        bool same;
        if (mode == GROUP_BY_ANCHOR) {
            same = segs[i].start - segs[g.first].start <= max_intragap;
        } else {
            double gap = (segs[i].start - segs[i-1].start)/fps;
            same = gap <= gap_sec;
        }
        if (!same) {
            g.last = i-1;
            groups.push_back(g);
            g.first = i;
        }
    }
    g.last = (int)segs.size()-1;
    groups.push_back(g);
}

void select_from_groups(
    const vector<SEGMENT>& segs, const vector<SEGMENT_GROUP>& groups,
    const vector<double>& sm, double fps, double global_lo,
    const CONSOLIDATE_PARAMS& params, vector<SEGMENT>& out
) {
    out.clear();
    for (size_t ig=0; ig<groups.size(); ig++) {
        const SEGMENT_GROUP& g = groups[ig];
        int best = g.first;
        double best_score = -1;
        for (int i=g.first; i<=g.last; i++) {
            double score;
            if (params.select == SELECT_LONGEST) {
                score = segs[i].end - segs[i].start;
            } else {
                STRENGTH st;
                double baseline = segment_baseline(sm, segs[i], global_lo, params);
                segment_strength(sm, segs[i], baseline, fps, st);
                score = st.auc_sec;
            }
            // strict: on a tie the earlier segment stays
            //
            if (i == g.first || score > best_score) {
                best = i;
                best_score = score;
            }
        }
        out.push_back(segs[best]);
    }
}

void pick_one_segment_per_window(
    const vector<SEGMENT>& in, const vector<double>& sm, double fps,
    double global_lo, const CONSOLIDATE_PARAMS& params, vector<SEGMENT>& out
) {
    vector<SEGMENT> segs(in);
    sort_segments(segs);
    vector<SEGMENT_GROUP> groups;
    double gap_sec = params.group_mode == GROUP_BY_ANCHOR
        ? params.pulse_gap_sec : params.boundary_gap_sec;
    group_segments(segs, fps, params.group_mode, gap_sec, groups);
    select_from_groups(segs, groups, sm, fps, global_lo, params, out);
}
