#ifndef SHUTTERCAL_PULSE_CSV_H
#define SHUTTERCAL_PULSE_CSV_H

// CSV output of pulse records, per-frame traces, and calibration fits.
// All return 0 on success, CSV_ERROR_OPEN if the file can't be created.

#include <stdio.h>
#include <vector>

#include "pulse_stats.h"
#include "calibration.h"

using std::vector;

#define CSV_ERROR_OPEN  -1

// one row per pulse. Fraction columns tNN_* follow the fixed ones;
// undefined timings are empty.
// No pulses: an empty file (no header).
//
extern void write_summary(FILE*, const vector<PULSE_RECORD>&);
extern int write_summary_csv(const char* path, const vector<PULSE_RECORD>&);

// one row per frame of each pulse
//
extern void write_trace(
    FILE*, const vector<PULSE_RECORD>&,
    const vector<double>& raw, const vector<double>& sm, double fps
);
extern int write_trace_csv(
    const char* path, const vector<PULSE_RECORD>&,
    const vector<double>& raw, const vector<double>& sm, double fps
);

extern void write_calibration(
    FILE*, const vector<double>& commanded_ms,
    const vector<PULSE_RECORD>&, const CAL_FIT&
);
extern int write_calibration_csv(
    const char* path, const vector<double>& commanded_ms,
    const vector<PULSE_RECORD>&, const CAL_FIT&
);

// create (or truncate) a file with nothing in it
//
extern int write_empty_file(const char* path);

// outputs of a run that found no pulses (no brightness swing):
// the summary, and the trace if path is non-null, are empty
//
extern int write_no_pulse_outputs(const char* summary_path, const char* trace_path);

#endif
