#include <stdlib.h>
#include <math.h>

#include "calibration.h"

const char* cal_status_name(int status) {
    switch (status) {
    case CAL_OK: return "ok";
    case CAL_COUNT_MISMATCH: return "count mismatch";
    case CAL_DEGENERATE: return "degenerate";
    }
    return "unknown";
}

int fit_calibration(
    const vector<double>& cmd, const vector<double>& meas, CAL_FIT& fit
) {
    fit = CAL_FIT();
    fit.npulses = (int)meas.size();
    fit.ncommanded = (int)cmd.size();
    if (meas.size() != cmd.size()) {
        fit.status = CAL_COUNT_MISMATCH;
        return fit.status;
    }
    int n = (int)cmd.size();
    if (n == 0) {
        fit.status = CAL_DEGENERATE;
        return fit.status;
    }

    double sx=0, sy=0;
    for (int i=0; i<n; i++) {
        sx += cmd[i];
        sy += meas[i];
    }
    double mx = sx/n, my = sy/n;
    fit.unit_intercept = my - mx;
    fit.loss = -fit.unit_intercept;

    // centered sums, for numerical stability
    //
    double sxx=0, sxy=0;
    for (int i=0; i<n; i++) {
        double dx = cmd[i] - mx;
        sxx += dx*dx;
        sxy += dx*(meas[i] - my);
    }
    if (n < 2 || sxx <= 0) {
        fit.status = CAL_DEGENERATE;
        return fit.status;
    }
    fit.slope = sxy/sxx;
    fit.intercept = my - fit.slope*mx;

    double ss = 0;
    fit.resid.resize(n);
    for (int i=0; i<n; i++) {
        double r = meas[i] - (fit.slope*cmd[i] + fit.intercept);
        fit.resid[i] = r;
        ss += r*r;
    }
    fit.rms_resid = sqrt(ss/n);
    fit.status = CAL_OK;
    return fit.status;
}

int parse_double_list(const char* s, vector<double>& out) {
    out.clear();
    const char* p = s;
    while (*p) {
        char* end;
        double x = strtod(p, &end);
        if (end == p) return -1;
        out.push_back(x);
        while (*end == ' ') end++;
        if (*end == ',') {
            end++;
            if (!*end) return -1;   // trailing comma
        } else if (*end) {
            return -1;
        }
        p = end;
    }
    return 0;
}

// the sweeps, in ms.
// 1 and 2 were run with 2 and 3 second gaps;
// 3 covers first light; 4 checks around full exposure
//
static const double sweep1[] = {
    10,20,30,50,75,100,150,200,250,260,270,280,287,290,300,310,
    500,750,1000,1500,2000,2500,3000,4000
};
static const double sweep2[] = {
    10,12,15,17,20,22,24,26,28,30,32,34,36,38,40,42,45,50,60,75,80,85,100,150
};
static const double sweep3[] = {
    10,11,12,13,14,15,16,17,18,19,20,22,24,26,28,30
};
static const double sweep4[] = {
    75,76,77,78,79,80,81,82,83,84,85
};

#define NELEM(x) (sizeof(x)/sizeof(x[0]))

int sweep_preset(int n, vector<double>& out) {
    switch (n) {
    case 1: out.assign(sweep1, sweep1+NELEM(sweep1)); break;
    case 2: out.assign(sweep2, sweep2+NELEM(sweep2)); break;
    case 3: out.assign(sweep3, sweep3+NELEM(sweep3)); break;
    case 4: out.assign(sweep4, sweep4+NELEM(sweep4)); break;
    default: return -1;
    }
    return 0;
}
