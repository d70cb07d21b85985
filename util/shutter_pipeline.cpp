#include <stdio.h>

#include "shutter_pipeline.h"

const char* pipeline_status_name(int status) {
    switch (status) {
    case PIPELINE_OK: return "OK";
    case PIPELINE_TOO_SHORT: return "video too short";
    case PIPELINE_NO_SWING: return "no brightness swing";
    }
    return "unknown";
}

void pulse_durations(const vector<PULSE_RECORD>& pulses, vector<double>& ms) {
    ms.clear();
    for (size_t i=0; i<pulses.size(); i++) {
        ms.push_back(pulses[i].duration_ms);
    }
}

int run_pipeline(
    const vector<double>& metrics, double fps, const SHUTTER_CONFIG& config,
    PIPELINE_RESULT& r
) {
    r = PIPELINE_RESULT();
    r.fps = fps;
    if ((int)metrics.size() < config.min_frames) {
        return PIPELINE_TOO_SHORT;
    }

    smooth(metrics, config.smooth_width, r.smoothed);
    robust_levels(r.smoothed, config.lo_pct, config.hi_pct, r.levels);
    if (config.verbose) {
        printf("levels: lo %f mid %f hi %f swing %f\n",
            r.levels.lo, r.levels.mid, r.levels.hi, r.levels.swing()
        );
    }
    if (r.levels.swing() < config.swing_eps) {
        return PIPELINE_NO_SWING;
    }

    compute_thresholds(r.levels, config.hyst, r.thresholds);
    r.ncrossings = count_crossings(r.smoothed, r.thresholds.open);
    if (config.verbose) {
        printf("thresholds: open %f close %f; %d crossings\n",
            r.thresholds.open, r.thresholds.close, r.ncrossings
        );
    }

    vector<SHUTTER_STATE> states;
    hysteresis_states(r.smoothed, r.thresholds, states);
    vector<SEGMENT> segs, tmp;
    find_segments(states, config.min_len_frames, segs);
    r.nraw = (int)segs.size();

    const CONSOLIDATE_PARAMS& cp = config.cons;
    double lo = r.levels.lo;
    r.merge_gap_frames = config.merge_gap(fps);
    if (cp.merge) {
        merge_close_segments(segs, r.merge_gap_frames, tmp);
        segs.swap(tmp);
    }
    r.nmerged = (int)segs.size();
    if (cp.strength_filter) {
        filter_segments_by_strength(segs, r.smoothed, fps, lo, cp, tmp);
        segs.swap(tmp);
    }
    r.nfiltered = (int)segs.size();
    if (cp.one_per_window) {
        pick_one_segment_per_window(segs, r.smoothed, fps, lo, cp, tmp);
        segs.swap(tmp);
    }
    r.nfinal = (int)segs.size();
    if (config.verbose) {
        printf("segments: %d raw, %d merged, %d filtered, %d final\n",
            r.nraw, r.nmerged, r.nfiltered, r.nfinal
        );
    }
    r.segments = segs;

    analyze_pulses(r.smoothed, r.segments, fps, lo, config.stats, r.pulses);

    if (!config.commanded_ms.empty()) {
        r.cal_attempted = true;
        vector<double> measured;
        pulse_durations(r.pulses, measured);
        fit_calibration(config.commanded_ms, measured, r.cal);
    }
    return PIPELINE_OK;
}
