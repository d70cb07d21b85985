// test the CSV writers: pulse summary, per-frame trace,
// calibration, and the empty outputs of a run with no pulses

#include <stdio.h>
#include <string>

#include "test_util.h"
#include "shutter_pipeline.h"
#include "pulse_csv.h"

using std::string;

// read a whole file into a string
//
string slurp(const char* path) {
    string s;
    FILE* f = fopen(path, "r");
    if (!f) return s;
    char buf[1024];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), f)) > 0) {
        s.append(buf, n);
    }
    fclose(f);
    return s;
}

void make_record(PULSE_RECORD& p) {
    p.pulse_id = 1;
    p.seg = SEGMENT(60, 69);
    p.start_sec = 0.6;
    p.end_sec = 0.69;
    p.duration_ms = 100;
    p.baseline = 1.25;
    p.peak_bs = 98.5;
    p.peak_frame = 63;
    p.peak_sec = 0.63;
    p.auc = 4.54;
    FRAC_TIMING ft;
    ft.frac = 0.1;
    ft.defined = true;
    ft.start_frame = 60;
    ft.end_frame = 67;
    ft.ms = 80;
    p.fracs.push_back(ft);
    ft.frac = 0.9;
    ft.defined = false;
    p.fracs.push_back(ft);
}

void test_csv() {
    const char* path = "test_summary.csv";
    vector<PULSE_RECORD> pulses;

    check(write_summary_csv(path, pulses) == 0, "write empty summary");
    check(slurp(path).empty(), "no pulses: empty file");

    PULSE_RECORD p;
    make_record(p);
    pulses.push_back(p);
    check(write_summary_csv(path, pulses) == 0, "write summary");
    string s = slurp(path);
    const char* expected =
        "pulse_id,start_frame,end_frame,start_time_s,end_time_s,segment_ms,"
        "baseline,peak_bs,peak_frame,peak_time_s,auc_bs_metric_s,"
        "t10_start_frame,t10_end_frame,t10_ms,"
        "t90_start_frame,t90_end_frame,t90_ms\n"
        "1,60,69,0.600000,0.690000,100.000,1.250,98.500,63,0.630000,4.540000,"
        "60,67,80.000,,,\n";
    check(s == expected, "summary contents");
    remove(path);

    path = "test_trace.csv";
    vector<double> raw(100, 0.), sm(100, 0.);
    raw[60] = 3;
    sm[60] = 1.5;
    check(write_trace_csv(path, pulses, raw, sm, 100) == 0, "write trace");
    s = slurp(path);
    check(s.find("pulse_id,abs_frame,time_s,metric_raw,metric_sm\n") == 0, "trace header");
    check(s.find("1,60,0.600000,3.000000,1.500000\n") != string::npos, "trace row");
    int nlines = 0;
    for (size_t i=0; i<s.size(); i++) {
        if (s[i] == '\n') nlines++;
    }
    check(nlines == 11, "one trace row per frame");
    remove(path);

    check(write_summary_csv("no_such_dir/x.csv", pulses) == CSV_ERROR_OPEN, "unwritable");
}

void put_text(const char* path, const char* text) {
    FILE* f = fopen(path, "w");
    fputs(text, f);
    fclose(f);
}

void test_calibration_csv() {
    const char* path = "test_cal.csv";
    vector<double> cmd, meas;
    vector<PULSE_RECORD> pulses;
    for (int i=0; i<3; i++) {
        PULSE_RECORD p;
        p.pulse_id = i+1;
        p.duration_ms = 12 + 10*i;
        pulses.push_back(p);
        cmd.push_back(10 + 10*i);
        meas.push_back(p.duration_ms);
    }
    CAL_FIT fit;
    check(fit_calibration(cmd, meas, fit) == CAL_OK, "fit");
    check(write_calibration_csv(path, cmd, pulses, fit) == 0, "write calibration");
    const char* expected =
        "pulse_id,commanded_ms,measured_ms,fit_ms,residual_ms\n"
        "1,10.000,12.000,12.000,0.000\n"
        "2,20.000,22.000,22.000,0.000\n"
        "3,30.000,32.000,32.000,0.000\n"
        "# slope=1.000000 intercept_ms=2.000000 loss_ms=-2.000000\n";
    check(slurp(path) == expected, "calibration contents");
    remove(path);

    check(write_calibration_csv("no_such_dir/c.csv", cmd, pulses, fit) == CSV_ERROR_OPEN,
        "unwritable calibration"
    );
}

void test_empty_file() {
    const char* path = "test_empty.csv";
    put_text(path, "left over from an earlier run\n");
    check(write_empty_file(path) == 0, "write empty file");
    check(slurp(path).empty(), "existing file truncated");
    remove(path);
    check(write_empty_file("no_such_dir/e.csv") == CSV_ERROR_OPEN, "unwritable empty file");
}

// a flat series has no swing; the run's outputs are empty files
//
void test_no_swing_outputs() {
    const char* summary = "test_ns_summary.csv";
    const char* trace = "test_ns_trace.csv";
    SHUTTER_CONFIG config;
    vector<double> metrics(50, 7.0);
    PIPELINE_RESULT r;
    check(run_pipeline(metrics, 100, config, r) == PIPELINE_NO_SWING, "no swing");
    check(r.pulses.empty(), "no pulses");

    put_text(summary, "old summary\n");
    put_text(trace, "old trace\n");
    check(write_no_pulse_outputs(summary, trace) == 0, "write no-pulse outputs");
    check(slurp(summary).empty(), "summary empty");
    check(slurp(trace).empty(), "trace empty");

    // no trace requested: trace file left alone
    //
    put_text(trace, "old trace\n");
    check(write_no_pulse_outputs(summary, NULL) == 0, "no trace path");
    check(slurp(trace) == "old trace\n", "trace untouched");
    remove(summary);
    remove(trace);

    check(write_no_pulse_outputs("no_such_dir/s.csv", NULL) == CSV_ERROR_OPEN,
        "unwritable summary"
    );
}

int main(int, char**) {
    test_csv();
    test_calibration_csv();
    test_empty_file();
    test_no_swing_outputs();
    return test_result("pulse_csv_test");
}
