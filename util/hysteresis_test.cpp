// test the shutter state machine and segment extraction

#include "test_util.h"
#include "hysteresis.h"

void test_transitions() {
    THRESHOLDS thr(50, 40);
    check(next_state(SHUTTER_CLOSED, 49.9, thr) == SHUTTER_CLOSED, "closed stays below open");
    check(next_state(SHUTTER_CLOSED, 50, thr) == SHUTTER_OPEN, "open at thr_open");
    check(next_state(SHUTTER_OPEN, 45, thr) == SHUTTER_OPEN, "open stays in band");
    check(next_state(SHUTTER_CLOSED, 45, thr) == SHUTTER_CLOSED, "closed stays in band");
    check(next_state(SHUTTER_OPEN, 40, thr) == SHUTTER_CLOSED, "close at thr_close");
}

// 0 for 100 frames except 100 at frames 50..59
//
void test_step() {
    vector<double> x(100, 0.);
    for (int i=50; i<60; i++) x[i] = 100;
    vector<SHUTTER_STATE> states;
    vector<SEGMENT> segs;
    hysteresis_states(x, THRESHOLDS(50, 40), states);
    find_segments(states, 3, segs);
    check(segs.size() == 1, "step: one segment");
    if (segs.size() == 1) {
        check(segs[0] == SEGMENT(50, 59), "step: segment 50..59");
        check(segs[0].nframes() == 10, "step: 10 frames");
    }
}

// rise through thr_close then thr_open, then fall symmetrically
//
void test_ramp() {
    vector<double> x;
    for (int i=0; i<=10; i++) x.push_back(i*10);
    for (int i=9; i>=0; i--) x.push_back(i*10);
    // x[5] = 50 (rise), x[15] = 50, x[16] = 40 (fall)
    vector<SHUTTER_STATE> states;
    vector<SEGMENT> segs;
    hysteresis_states(x, THRESHOLDS(55, 35), states);
    find_segments(states, 1, segs);
    check(segs.size() == 1, "ramp: one segment");
    if (segs.size() == 1) {
        // opens at 60 (frame 6), closes at 30 (frame 17)
        //
        check(segs[0] == SEGMENT(6, 16), "ramp: opens above thr_open, closes below thr_close");
    }
}

// noise around thr_open, within the band, doesn't chatter
//
void test_no_chatter() {
    double a[] = {0, 51, 49, 51, 48, 52, 45, 51, 0, 0};
    vector<double> x(a, a+10);
    vector<SHUTTER_STATE> states;
    vector<SEGMENT> segs;
    hysteresis_states(x, THRESHOLDS(50, 40), states);
    find_segments(states, 1, segs);
    check(segs.size() == 1 && segs[0] == SEGMENT(1, 7), "noise in band: one segment");
    check(count_crossings(x, 50) == 8, "crossings of thr_open");
}

void test_min_len() {
    double a[] = {0, 100, 100, 0, 100, 100, 100, 0, 100};
    vector<double> x(a, a+9);
    vector<SHUTTER_STATE> states;
    vector<SEGMENT> segs;
    hysteresis_states(x, THRESHOLDS(50, 40), states);
    find_segments(states, 3, segs);
    check(segs.size() == 1 && segs[0] == SEGMENT(4, 6), "short runs dropped");
    find_segments(states, 1, segs);
    check(segs.size() == 3, "min_len 1 keeps all runs");
    check(segs.size() == 3 && segs[2] == SEGMENT(8, 8), "run reaching last frame");
}

void test_thresholds() {
    LEVELS lv;
    lv.lo = 10;
    lv.hi = 110;
    lv.mid = 60;
    HYSTERESIS_PARAMS hp;
    THRESHOLDS thr;

    compute_thresholds(lv, hp, thr);
    check(near(thr.open, 70) && near(thr.close, 50), "midpoint thresholds");

    hp.mode = THRESH_PLATEAU;
    compute_thresholds(lv, hp, thr);
    check(near(thr.open, 107) && near(thr.close, 104), "plateau thresholds");

    THRESH_MODE m;
    check(!parse_thresh_mode("full", m) && m == THRESH_PLATEAU, "parse full");
    check(!parse_thresh_mode("midpoint", m) && m == THRESH_MIDPOINT, "parse midpoint");
    check(parse_thresh_mode("bogus", m) != 0, "parse bad mode");
}

int main(int, char**) {
    test_transitions();
    test_step();
    test_ramp();
    test_no_chatter();
    test_min_len();
    test_thresholds();
    return test_result("hysteresis_test");
}
