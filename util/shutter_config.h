#ifndef SHUTTERCAL_SHUTTER_CONFIG_H
#define SHUTTERCAL_SHUTTER_CONFIG_H

// the tunables of the pulse pipeline.
// Defaults are set by the constructor; a JSON file can override them,
// and command-line options (analysis/shutter_pulse.cpp) override that.
//
// JSON keys are the same as the field names below, except:
//      metric, topk                -> metric.type, metric.topk
//      mode, band_frac, ...        -> hyst.*
//      merge, strength_filter, peak_min, auc_min_sec, local_baseline,
//      one_per_window, group, pulse_gap_sec, boundary_gap_sec, select
//                                  -> cons.*
//      baseline_window, baseline_min_frames
//                                  -> cons.baseline and stats.baseline
//      fracs                       -> stats.fracs
//      sweep (1..4)                -> commanded_ms from a preset
//
// example:
// {
//     "metric": "topk", "topk": 100,
//     "mode": "plateau",
//     "select": "longest",
//     "commanded_ms": [10, 20, 30]
// }

#include <stdio.h>
#include <string>
#include <vector>

#include "frame_metric.h"
#include "hysteresis.h"
#include "consolidate.h"
#include "pulse_stats.h"

using std::string;
using std::vector;

#define CONFIG_ERROR_OPEN   -1
#define CONFIG_ERROR_PARSE  -2
#define CONFIG_ERROR_KEY    -3      // unknown key
#define CONFIG_ERROR_VALUE  -4      // wrong type or out of range

struct SHUTTER_CONFIG {
    METRIC_PARAMS metric;
    int smooth_width;
    double lo_pct, hi_pct;
    double swing_eps;
    int min_frames;
    HYSTERESIS_PARAMS hyst;
    int min_len_frames;
    int merge_gap_frames;       // -1: use merge_gap_sec
    double merge_gap_sec;
    CONSOLIDATE_PARAMS cons;
    PULSE_STATS_PARAMS stats;
    vector<double> commanded_ms;
    double fallback_fps;
    double fps;                 // 0: use the source's rate
    string dataset;             // HDF5 dataset path; empty = default
    bool verbose;

    SHUTTER_CONFIG() {
        smooth_width = 5;
        lo_pct = 10;
        hi_pct = 90;
        swing_eps = 1e-3;
        min_frames = 10;
        min_len_frames = 3;
        merge_gap_frames = -1;
        merge_gap_sec = 0.06;
        fallback_fps = DEFAULT_FALLBACK_FPS;
        fps = 0;
        verbose = false;
    }

    void set_baseline(int window, int min_frames);

    // merge gap in frames for a given rate
    //
    int merge_gap(double fps) const;

    int parse_json(const char* text);
    int read_file(const char* path);

    // check ranges; print a message and return CONFIG_ERROR_VALUE
    // for the first bad one
    //
    int validate() const;

    void print(FILE*) const;
};

extern const char* config_error_name(int);

#endif
