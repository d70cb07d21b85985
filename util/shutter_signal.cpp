#include <math.h>
#include <algorithm>

#include "shutter_signal.h"

void smooth(const vector<double>& x, int w, vector<double>& out) {
    if (w <= 1) {
        out = x;
        return;
    }
    int n = (int)x.size();
    out.assign(n, 0);

    // window for out[i] is x[i-half .. i-half+w-1]
    //
    int half = w/2;
    double sum = 0;
    for (int j=-half; j<w-half-1; j++) {
        if (j >= 0 && j < n) sum += x[j];
    }
    for (int i=0; i<n; i++) {
        int in = i-half+w-1;
        if (in >= 0 && in < n) sum += x[in];
        out[i] = sum/w;
        int drop = i-half;
        if (drop >= 0 && drop < n) sum -= x[drop];
    }
}

double percentile(const vector<double>& x, double p) {
    vector<double> s(x);
    std::sort(s.begin(), s.end());
    int n = (int)s.size();
    if (n == 1) return s[0];
    double pos = p/100.*(n-1);
    if (pos <= 0) return s[0];
    if (pos >= n-1) return s[n-1];
    int i = (int)floor(pos);
    double frac = pos - i;
    return s[i] + frac*(s[i+1]-s[i]);
}

double median(const vector<double>& x, size_t start, size_t end) {
    vector<double> s(x.begin()+start, x.begin()+end);
    size_t n = s.size();
    if (n == 0) return 0;
    size_t mid = n/2;
    std::nth_element(s.begin(), s.begin()+mid, s.end());
    double upper = s[mid];
    if (n&1) return upper;

    // even count: average the two middle values
    //
    double lower = *std::max_element(s.begin(), s.begin()+mid);
    return (lower+upper)/2;
}

void robust_levels(
    const vector<double>& x, double lo_pct, double hi_pct, LEVELS& levels
) {
    levels.lo = percentile(x, lo_pct);
    levels.hi = percentile(x, hi_pct);
    levels.mid = (levels.lo + levels.hi)/2;
}

double local_baseline(
    const vector<double>& x, int start, double fallback,
    int window, int min_frames
) {
    int npre = std::min(window, start);
    if (npre < min_frames || npre <= 0) {
        return fallback;
    }
    return median(x, start-npre, start);
}
