// test smoothing, percentiles, medians, levels and local baselines

#include "test_util.h"
#include "shutter_signal.h"

void test_smooth() {
    double a[] = {3, 6, 9, 12};
    vector<double> x(a, a+4), out;

    smooth(x, 1, out);
    check(out == x, "smooth w=1 is identity");
    smooth(x, 0, out);
    check(out == x, "smooth w=0 is identity");

    smooth(x, 3, out);
    check(out.size() == 4, "smooth keeps length");
    check(near(out[0], 3), "smooth w=3 left edge zero-padded");
    check(near(out[1], 6), "smooth w=3 interior");
    check(near(out[2], 9), "smooth w=3 interior");
    check(near(out[3], 7), "smooth w=3 right edge zero-padded");

    // even width: window is [i-2, i+1]
    //
    vector<double> y(6, 4.);
    smooth(y, 4, out);
    check(near(out[0], 2), "smooth w=4 frame 0");
    check(near(out[1], 3), "smooth w=4 frame 1");
    check(near(out[2], 4), "smooth w=4 interior");
    check(near(out[4], 4), "smooth w=4 frame 4");
    check(near(out[5], 3), "smooth w=4 last frame");

    // a series shorter than the window
    //
    vector<double> z(2, 5.);
    smooth(z, 5, out);
    check(near(out[0], 2) && near(out[1], 2), "smooth short series");
}

void test_percentile() {
    double a[] = {4, 1, 3, 2};
    vector<double> x(a, a+4);
    check(near(percentile(x, 0), 1), "percentile 0");
    check(near(percentile(x, 100), 4), "percentile 100");
    check(near(percentile(x, 50), 2.5), "percentile 50");
    check(near(percentile(x, 10), 1.3), "percentile 10");
    check(near(percentile(x, 90), 3.7), "percentile 90");

    vector<double> one(1, 7.);
    check(near(percentile(one, 90), 7), "percentile of one value");
}

void test_median() {
    double a[] = {4, 1, 3, 2};
    vector<double> x(a, a+4);
    check(near(median(x, 0, 4), 2.5), "median of even count");
    check(near(median(x, 0, 3), 3), "median of odd count");
    check(near(median(x, 1, 2), 1), "median of one value");
}

void test_levels() {
    // 80 frames at 0, 20 at 100
    //
    vector<double> x(100, 0.);
    for (int i=40; i<60; i++) x[i] = 100;
    LEVELS lv;
    robust_levels(x, 10, 90, lv);
    check(near(lv.lo, 0), "levels lo");
    check(near(lv.hi, 100), "levels hi");
    check(near(lv.mid, 50), "levels mid");
    check(near(lv.swing(), 100), "levels swing");

    vector<double> flat(50, 3.);
    robust_levels(flat, 10, 90, lv);
    check(lv.swing() == 0, "flat series has no swing");
}

void test_local_baseline() {
    vector<double> x(100);
    for (int i=0; i<100; i++) x[i] = i;

    check(local_baseline(x, 3, -1, 50, 5) == -1, "too few frames: fallback");
    check(local_baseline(x, 0, -1, 50, 5) == -1, "first frame: fallback");

    // frames 0..4
    check(near(local_baseline(x, 5, -1, 50, 5), 2), "exactly min_frames");

    // window limits it to frames 10..59
    check(near(local_baseline(x, 60, -1, 50, 5), 34.5), "window of 50");
    check(near(local_baseline(x, 60, -1, 10, 5), 54.5), "window of 10");
}

int main(int, char**) {
    test_smooth();
    test_percentile();
    test_median();
    test_levels();
    test_local_baseline();
    return test_result("signal_test");
}
