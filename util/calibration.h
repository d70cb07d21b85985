#ifndef SHUTTERCAL_CALIBRATION_H
#define SHUTTERCAL_CALIBRATION_H

// fit measured pulse durations against commanded durations:
//      measured ~= slope*commanded + intercept      (least squares)
//      measured ~= commanded + unit_intercept       (slope fixed at 1)
// loss = -unit_intercept is the constant time the hardware loses per pulse.
//
// The pulse commander inverts this to pre-compensate a request:
//      commanded = (target_effective + loss)/slope
//
// Pulse k is paired with commanded duration k;
// if the counts differ there's no fit.

#include <vector>

using std::vector;

#define CAL_OK              0
#define CAL_COUNT_MISMATCH  1
#define CAL_DEGENERATE      2   // < 2 points, or all commanded values equal

#define NSWEEP_PRESETS      4

struct CAL_FIT {
    int status;
    int npulses;
    int ncommanded;
    double slope;
    double intercept;
    double unit_intercept;
    double loss;
    double rms_resid;       // of the general fit
    vector<double> resid;   // measured - fitted, per pulse

    CAL_FIT() {
        status = CAL_DEGENERATE;
        npulses = ncommanded = 0;
        slope = intercept = unit_intercept = loss = rms_resid = 0;
    }
};

extern const char* cal_status_name(int);

extern int fit_calibration(
    const vector<double>& commanded_ms, const vector<double>& measured_ms,
    CAL_FIT&
);

// parse "10,20,30"; nonzero if malformed
//
extern int parse_double_list(const char* s, vector<double>&);

// commanded sweeps used on the bench (1..NSWEEP_PRESETS)
//
extern int sweep_preset(int n, vector<double>&);

#endif
