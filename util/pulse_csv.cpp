#include "pulse_csv.h"

void write_summary(FILE* f, const vector<PULSE_RECORD>& pulses) {
    if (pulses.empty()) return;

    // fractions are the same for all pulses
    //
    const vector<FRAC_TIMING>& fr0 = pulses[0].fracs;
    fprintf(f,
        "pulse_id,start_frame,end_frame,start_time_s,end_time_s,"
        "segment_ms,baseline,peak_bs,peak_frame,peak_time_s,auc_bs_metric_s"
    );
    for (size_t j=0; j<fr0.size(); j++) {
        int tag = frac_tag(fr0[j].frac);
        fprintf(f, ",t%02d_start_frame,t%02d_end_frame,t%02d_ms", tag, tag, tag);
    }
    fprintf(f, "\n");

    for (size_t i=0; i<pulses.size(); i++) {
        const PULSE_RECORD& p = pulses[i];
        fprintf(f, "%d,%d,%d,%.6f,%.6f,%.3f,%.3f,%.3f,%d,%.6f,%.6f",
            p.pulse_id, p.seg.start, p.seg.end, p.start_sec, p.end_sec,
            p.duration_ms, p.baseline, p.peak_bs, p.peak_frame, p.peak_sec,
            p.auc
        );
        for (size_t j=0; j<p.fracs.size(); j++) {
            const FRAC_TIMING& ft = p.fracs[j];
            if (ft.defined) {
                fprintf(f, ",%d,%d,%.3f", ft.start_frame, ft.end_frame, ft.ms);
            } else {
                fprintf(f, ",,,");
            }
        }
        fprintf(f, "\n");
    }
}

int write_summary_csv(const char* path, const vector<PULSE_RECORD>& pulses) {
    FILE* f = fopen(path, "w");
    if (!f) return CSV_ERROR_OPEN;
    write_summary(f, pulses);
    fclose(f);
    return 0;
}

void write_trace(
    FILE* f, const vector<PULSE_RECORD>& pulses,
    const vector<double>& raw, const vector<double>& sm, double fps
) {
    fprintf(f, "pulse_id,abs_frame,time_s,metric_raw,metric_sm\n");
    for (size_t i=0; i<pulses.size(); i++) {
        const PULSE_RECORD& p = pulses[i];
        for (int k=p.seg.start; k<=p.seg.end; k++) {
            fprintf(f, "%d,%d,%.6f,%.6f,%.6f\n",
                p.pulse_id, k, k/fps, raw[k], sm[k]
            );
        }
    }
}

int write_trace_csv(
    const char* path, const vector<PULSE_RECORD>& pulses,
    const vector<double>& raw, const vector<double>& sm, double fps
) {
    FILE* f = fopen(path, "w");
    if (!f) return CSV_ERROR_OPEN;
    write_trace(f, pulses, raw, sm, fps);
    fclose(f);
    return 0;
}

void write_calibration(
    FILE* f, const vector<double>& cmd,
    const vector<PULSE_RECORD>& pulses, const CAL_FIT& fit
) {
    fprintf(f, "pulse_id,commanded_ms,measured_ms,fit_ms,residual_ms\n");
    for (size_t i=0; i<pulses.size() && i<cmd.size(); i++) {
        double fitted = fit.slope*cmd[i] + fit.intercept;
        fprintf(f, "%d,%.3f,%.3f,%.3f,%.3f\n",
            pulses[i].pulse_id, cmd[i], pulses[i].duration_ms,
            fitted, pulses[i].duration_ms - fitted
        );
    }
    fprintf(f, "# slope=%.6f intercept_ms=%.6f loss_ms=%.6f\n",
        fit.slope, fit.intercept, fit.loss
    );
}

int write_calibration_csv(
    const char* path, const vector<double>& cmd,
    const vector<PULSE_RECORD>& pulses, const CAL_FIT& fit
) {
    FILE* f = fopen(path, "w");
    if (!f) return CSV_ERROR_OPEN;
    write_calibration(f, cmd, pulses, fit);
    fclose(f);
    return 0;
}

int write_empty_file(const char* path) {
    FILE* f = fopen(path, "w");
    if (!f) return CSV_ERROR_OPEN;
    fclose(f);
    return 0;
}

int write_no_pulse_outputs(const char* summary_path, const char* trace_path) {
    int retval = write_empty_file(summary_path);
    if (retval) return retval;
    if (trace_path) {
        retval = write_empty_file(trace_path);
        if (retval) return retval;
    }
    return 0;
}
