#ifndef SHUTTERCAL_SIGNAL_H
#define SHUTTERCAL_SIGNAL_H

// functions on a frame metric series (one value per frame):
// smoothing, percentiles, medians, robust open/closed levels
// and local baselines.
//
// All of these are pure; they don't modify their input.

#include <vector>

using std::vector;

// robust brightness levels of a series
//
struct LEVELS {
    double mid;     // (lo+hi)/2
    double lo;      // "closed" level: low percentile
    double hi;      // "open" level: high percentile

    LEVELS() {
        mid = lo = hi = 0;
    }
    double swing() const {
        return hi>lo ? hi-lo : 0;
    }
};

// centered moving average of width w.
// Samples outside the series count as zero.
// w <= 1: out = x
//
extern void smooth(const vector<double>& x, int w, vector<double>& out);

// p-th percentile (0..100), linear interpolation between ranks.
// x must be nonempty.
//
extern double percentile(const vector<double>& x, double p);

// median of x[start..end)
//
extern double median(const vector<double>& x, size_t start, size_t end);

extern void robust_levels(
    const vector<double>& x, double lo_pct, double hi_pct, LEVELS& levels
);

// the brightness level just before frame "start":
// the median of up to "window" preceding frames,
// or "fallback" if fewer than min_frames precede it
//
extern double local_baseline(
    const vector<double>& x, int start, double fallback,
    int window, int min_frames
);

#endif
