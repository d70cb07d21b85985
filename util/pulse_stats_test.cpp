// test per-pulse photometry and fractional timings

#include "test_util.h"
#include "pulse_stats.h"

// a pulse at frames 60..69, peak 100 at frame 63, on a floor of 0
//
void make_pulse(vector<double>& sm) {
    double p[] = {12, 30, 60, 100, 95, 80, 50, 20, 5, 2};
    sm.assign(100, 0.);
    for (int i=0; i<10; i++) sm[60+i] = p[i];
}

void test_pulse() {
    vector<double> sm;
    make_pulse(sm);
    PULSE_STATS_PARAMS params;
    PULSE_RECORD pr;
    analyze_pulse(sm, SEGMENT(60, 69), 1, 100, 0, params, pr);

    check(pr.pulse_id == 1, "pulse id");
    check(near(pr.duration_ms, 100), "duration");
    check(near(pr.start_sec, 0.6) && near(pr.end_sec, 0.69), "start and end times");
    check(near(pr.baseline, 0), "baseline");
    check(near(pr.peak_bs, 100), "peak");
    check(pr.peak_frame == 63, "peak frame");
    check(near(pr.peak_sec, 0.63), "peak time");
    check(near(pr.auc, 4.54), "area");

    check(pr.fracs.size() == 3, "3 fractions");
    if (pr.fracs.size() != 3) return;
    const FRAC_TIMING& t10 = pr.fracs[0];
    const FRAC_TIMING& t50 = pr.fracs[1];
    const FRAC_TIMING& t90 = pr.fracs[2];
    check(t10.defined && t10.start_frame == 60 && t10.end_frame == 67, "10% frames");
    check(near(t10.ms, 80), "10% ms");
    check(t50.defined && t50.start_frame == 62 && t50.end_frame == 66, "50% frames");
    check(near(t50.ms, 50), "50% ms");
    check(t90.defined && t90.start_frame == 63 && t90.end_frame == 64, "90% frames");
    check(near(t90.ms, 20), "90% ms");
}

// the baseline is the median of preceding frames, if there are enough
//
void test_baseline() {
    vector<double> sm(100, 20.);
    for (int i=60; i<70; i++) sm[i] = 70;
    sm[3] = sm[4] = sm[5] = 70;
    PULSE_STATS_PARAMS params;
    PULSE_RECORD pr;

    analyze_pulse(sm, SEGMENT(60, 69), 1, 100, 0, params, pr);
    check(near(pr.baseline, 20), "local baseline");
    check(near(pr.peak_bs, 50), "peak above local baseline");

    analyze_pulse(sm, SEGMENT(3, 5), 1, 100, 0, params, pr);
    check(near(pr.baseline, 0), "too early: global baseline");
    check(near(pr.peak_bs, 70), "peak above global baseline");
}

// a segment that never rises above its baseline
//
void test_flat() {
    vector<double> sm(100, 5.);
    PULSE_STATS_PARAMS params;
    PULSE_RECORD pr;
    analyze_pulse(sm, SEGMENT(40, 49), 1, 100, 0, params, pr);
    check(near(pr.peak_bs, 0), "flat: no peak");
    check(near(pr.auc, 0), "flat: no area");
    check(pr.peak_frame == 40, "flat: peak at first frame");
    bool any = false;
    for (size_t i=0; i<pr.fracs.size(); i++) {
        if (pr.fracs[i].defined) any = true;
    }
    check(!any, "flat: timings undefined");
}

void test_numbering() {
    vector<double> sm;
    make_pulse(sm);
    vector<SEGMENT> segs;
    segs.push_back(SEGMENT(60, 69));
    segs.push_back(SEGMENT(20, 25));
    PULSE_STATS_PARAMS params;
    vector<PULSE_RECORD> pulses;
    analyze_pulses(sm, segs, 100, 0, params, pulses);
    check(pulses.size() == 2, "one record per segment");
    if (pulses.size() != 2) return;
    check(pulses[0].pulse_id == 1 && pulses[0].seg.start == 20, "first by start");
    check(pulses[1].pulse_id == 2 && pulses[1].seg.start == 60, "second by start");
    check(pulses[0].seg.end < pulses[1].seg.start, "records in order");
}

void test_tags() {
    check(frac_tag(0.1) == 10, "tag 0.1");
    check(frac_tag(0.5) == 50, "tag 0.5");
    check(frac_tag(0.9) == 90, "tag 0.9");
    check(frac_tag(0.05) == 5, "tag 0.05");
}

int main(int, char**) {
    test_pulse();
    test_baseline();
    test_flat();
    test_numbering();
    test_tags();
    return test_result("pulse_stats_test");
}
