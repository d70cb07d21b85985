#ifndef SHUTTERCAL_SHUTTER_PIPELINE_H
#define SHUTTERCAL_SHUTTER_PIPELINE_H

// run the stages over one frame metric series:
//      smooth -> levels -> thresholds -> states -> segments
//      -> merge -> strength filter -> one per window
//      -> pulse stats -> calibration fit (if commanded durations given)
//
// The result keeps the intermediate products,
// and the segment count after each pass, for diagnostics.

#include <vector>

#include "shutter_signal.h"
#include "hysteresis.h"
#include "consolidate.h"
#include "pulse_stats.h"
#include "calibration.h"
#include "shutter_config.h"

using std::vector;

#define PIPELINE_OK             0
#define PIPELINE_TOO_SHORT      1   // fewer than min_frames frames; fatal
#define PIPELINE_NO_SWING       2   // swing < swing_eps; no pulses

struct PIPELINE_RESULT {
    double fps;
    vector<double> smoothed;
    LEVELS levels;
    THRESHOLDS thresholds;
    int merge_gap_frames;
    int ncrossings;         // of the open threshold

    // segment counts after each pass
    int nraw;
    int nmerged;
    int nfiltered;
    int nfinal;

    vector<SEGMENT> segments;   // final
    vector<PULSE_RECORD> pulses;

    bool cal_attempted;         // commanded durations were given
    CAL_FIT cal;

    PIPELINE_RESULT() {
        fps = 0;
        merge_gap_frames = 0;
        ncrossings = 0;
        nraw = nmerged = nfiltered = nfinal = 0;
        cal_attempted = false;
    }
};

extern const char* pipeline_status_name(int);

// fps must be valid (see resolve_frame_rate())
//
extern int run_pipeline(
    const vector<double>& metrics, double fps, const SHUTTER_CONFIG&,
    PIPELINE_RESULT&
);

// measured durations (ms) of the pulses
//
extern void pulse_durations(const vector<PULSE_RECORD>&, vector<double>& ms);

#endif
