#include <math.h>

#include "shutter_signal.h"
#include "pulse_stats.h"

int frac_tag(double frac) {
    return (int)floor(frac*100 + 0.5);
}

void frac_timing(
    const vector<double>& trace, int first_frame, double peak, double frac,
    double fps, FRAC_TIMING& ft
) {
    ft.frac = frac;
    ft.defined = false;
    ft.start_frame = ft.end_frame = -1;
    ft.ms = 0;
    if (peak <= PEAK_EPS) return;

    double thr = frac*peak;
    int first = -1, last = -1;
    for (int i=0; i<(int)trace.size(); i++) {
        if (trace[i] >= thr) {
            if (first < 0) first = i;
            last = i;
        }
    }
    if (first < 0) return;
    ft.defined = true;
    ft.start_frame = first_frame + first;
    ft.end_frame = first_frame + last;
    ft.ms = 1000.*(last - first + 1)/fps;
}

void analyze_pulse(
    const vector<double>& sm, const SEGMENT& seg, int pulse_id, double fps,
    double global_lo, const PULSE_STATS_PARAMS& params, PULSE_RECORD& pr
) {
    pr.pulse_id = pulse_id;
    pr.seg = seg;
    pr.start_sec = seg.start/fps;
    pr.end_sec = seg.end/fps;
    pr.duration_ms = 1000.*seg.nframes()/fps;
    pr.baseline = local_baseline(
        sm, seg.start, global_lo,
        params.baseline.window, params.baseline.min_frames
    );

    // baseline-subtracted trace, clamped at zero
    //
    vector<double> trace(seg.nframes());
    double sum = 0;
    int ipeak = 0;
    for (int i=0; i<seg.nframes(); i++) {
        double v = sm[seg.start+i] - pr.baseline;
        if (v < 0) v = 0;
        trace[i] = v;
        sum += v;
        if (v > trace[ipeak]) ipeak = i;
    }
    pr.peak_bs = trace[ipeak];
    pr.peak_frame = seg.start + ipeak;
    pr.peak_sec = pr.peak_frame/fps;
    pr.auc = sum/fps;

    pr.fracs.resize(params.fracs.size());
    for (size_t i=0; i<params.fracs.size(); i++) {
        frac_timing(
            trace, seg.start, pr.peak_bs, params.fracs[i], fps, pr.fracs[i]
        );
    }
}

void analyze_pulses(
    const vector<double>& sm, const vector<SEGMENT>& segs, double fps,
    double global_lo, const PULSE_STATS_PARAMS& params,
    vector<PULSE_RECORD>& pulses
) {
    vector<SEGMENT> sorted(segs);
    sort_segments(sorted);
    pulses.resize(sorted.size());
    for (size_t i=0; i<sorted.size(); i++) {
        analyze_pulse(
            sm, sorted[i], (int)i+1, fps, global_lo, params, pulses[i]
        );
    }
}
