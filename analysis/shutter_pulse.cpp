// shutter_pulse --infile path [options]
//
// find the shutter (or LED) pulses in a video of a point source,
// measure each one, and optionally fit measured vs. commanded durations.
//
// input is either
//      --infile path       frames: .pff, .fits/.fit/.fz, .h5/.hdf5
//      --metrics path      one frame metric per line (already reduced)
//
// output:
//      summary CSV     one row per pulse (--summary)
//      trace CSV       metric per frame of each pulse (--trace)
//      calibration CSV measured vs. fitted durations (--cal_out)
//
// if the video shows no brightness swing, the summary and trace
// files are written empty and the exit status is 0.
//
// options (see usage()) override those in the --config JSON file.

#include <stdio.h>
#include <string.h>
#include <stdlib.h>

#include "frame_source.h"
#include "frame_metric.h"
#include "calibration.h"
#include "shutter_config.h"
#include "shutter_pipeline.h"
#include "pulse_csv.h"

#define DEFAULT_SUMMARY     "pulse_flux_summary.csv"
#define DEFAULT_TRACE       "pulse_flux_trace.csv"

const char* infile = 0;
const char* metrics_file = 0;
const char* config_file = 0;
const char* summary_file = DEFAULT_SUMMARY;
const char* trace_file = DEFAULT_TRACE;
const char* cal_file = 0;
long nframes = 0;

void usage() {
    printf("options:\n"
        "   --infile x              frame file (.pff, .fits, .h5)\n"
        "   --metrics x             file of frame metrics, one per line\n"
        "   --config x              JSON config file\n"
        "   --nframes n             use only first n frames\n"
        "   --dataset x             HDF5 dataset (default /frames)\n"
        "   --fps x                 frame rate; overrides the file's\n"
        "   --fallback_fps x        rate if the file has none (default 110)\n"
        "   --metric x              topk, mean or sum (default topk)\n"
        "   --topk n                pixels in topk metric (default 200)\n"
        "   --smooth n              moving average width (default 5)\n"
        "   --mode x                threshold mode: midpoint or plateau\n"
        "   --band_frac x           midpoint half-band, fraction of swing\n"
        "   --plateau_frac x        plateau threshold, fraction of swing\n"
        "   --plateau_hyst_frac x   plateau hysteresis, fraction of swing\n"
        "   --lo_pct x              closed level percentile (default 10)\n"
        "   --hi_pct x              open level percentile (default 90)\n"
        "   --swing_eps x           min open-closed swing (default 0.001)\n"
        "   --min_len n             min open run, frames (default 3)\n"
        "   --merge_gap n           merge segments <= n closed frames apart\n"
        "   --merge_gap_sec x       same, in seconds (default 0.06)\n"
        "   --no_merge              don't merge segments\n"
        "   --peak_min x            min peak above baseline (default 10)\n"
        "   --auc_min_sec x         min area above baseline (default 0.005)\n"
        "   --local_baseline        filter with local, not global, baseline\n"
        "   --baseline_window n     frames before a pulse for its baseline\n"
        "   --baseline_min_frames n fewer: use the closed level (default 5)\n"
        "   --no_filter             don't filter segments by strength\n"
        "   --group x               pulse windows: anchor or gap (default gap)\n"
        "   --pulse_gap_sec x       commanded gap between pulses (anchor)\n"
        "   --boundary_gap_sec x    window boundary gap (gap)\n"
        "   --select x              longest or strongest (default strongest)\n"
        "   --all_segments          keep all segments in a window\n"
        "   --fracs x,y,...         fractional timings (default 0.1,0.5,0.9)\n"
        "   --commanded x,y,...     commanded durations, ms\n"
        "   --sweep n               commanded durations from preset 1..4\n"
        "   --summary x             summary CSV (default %s)\n"
        "   --trace x               trace CSV (default %s)\n"
        "   --no_trace              don't write trace CSV\n"
        "   --cal_out x             calibration CSV\n"
        "   --verbose\n",
        DEFAULT_SUMMARY, DEFAULT_TRACE
    );
    exit(1);
}

// value of option i; usage() if missing
//
const char* opt_val(int argc, char** argv, int& i) {
    if (i+1 >= argc) {
        fprintf(stderr, "error: %s needs a value\n", argv[i]);
        usage();
    }
    return argv[++i];
}

void bad_opt(const char* opt, const char* val) {
    fprintf(stderr, "error: bad value for %s: %s\n", opt, val);
    exit(1);
}

void parse_args(int argc, char** argv, SHUTTER_CONFIG& config) {
    int i;
    const char* val;

    // the config file goes first so that options override it
    //
    for (i=1; i<argc; i++) {
        if (!strcmp(argv[i], "--config") && i+1 < argc) {
            config_file = argv[i+1];
        }
    }
    if (config_file) {
        int retval = config.read_file(config_file);
        if (retval) {
            fprintf(stderr, "error: %s: %s\n",
                config_file, config_error_name(retval)
            );
            exit(1);
        }
    }

    for (i=1; i<argc; i++) {
        const char* opt = argv[i];
        if (!strcmp(opt, "--infile")) {
            infile = opt_val(argc, argv, i);
        } else if (!strcmp(opt, "--metrics")) {
            metrics_file = opt_val(argc, argv, i);
        } else if (!strcmp(opt, "--config")) {
            opt_val(argc, argv, i);
        } else if (!strcmp(opt, "--nframes")) {
            nframes = atol(opt_val(argc, argv, i));
        } else if (!strcmp(opt, "--dataset")) {
            config.dataset = opt_val(argc, argv, i);
        } else if (!strcmp(opt, "--fps")) {
            config.fps = atof(opt_val(argc, argv, i));
        } else if (!strcmp(opt, "--fallback_fps")) {
            config.fallback_fps = atof(opt_val(argc, argv, i));
        } else if (!strcmp(opt, "--metric")) {
            val = opt_val(argc, argv, i);
            if (parse_metric_type(val, config.metric.type)) bad_opt(opt, val);
        } else if (!strcmp(opt, "--topk")) {
            config.metric.topk = atoi(opt_val(argc, argv, i));
        } else if (!strcmp(opt, "--smooth")) {
            config.smooth_width = atoi(opt_val(argc, argv, i));
        } else if (!strcmp(opt, "--mode")) {
            val = opt_val(argc, argv, i);
            if (parse_thresh_mode(val, config.hyst.mode)) bad_opt(opt, val);
        } else if (!strcmp(opt, "--band_frac")) {
            config.hyst.band_frac = atof(opt_val(argc, argv, i));
        } else if (!strcmp(opt, "--plateau_frac")) {
            config.hyst.plateau_frac = atof(opt_val(argc, argv, i));
        } else if (!strcmp(opt, "--plateau_hyst_frac")) {
            config.hyst.plateau_hyst_frac = atof(opt_val(argc, argv, i));
        } else if (!strcmp(opt, "--lo_pct")) {
            config.lo_pct = atof(opt_val(argc, argv, i));
        } else if (!strcmp(opt, "--hi_pct")) {
            config.hi_pct = atof(opt_val(argc, argv, i));
        } else if (!strcmp(opt, "--swing_eps")) {
            config.swing_eps = atof(opt_val(argc, argv, i));
        } else if (!strcmp(opt, "--min_len")) {
            config.min_len_frames = atoi(opt_val(argc, argv, i));
        } else if (!strcmp(opt, "--merge_gap")) {
            config.merge_gap_frames = atoi(opt_val(argc, argv, i));
        } else if (!strcmp(opt, "--merge_gap_sec")) {
            config.merge_gap_sec = atof(opt_val(argc, argv, i));
            config.merge_gap_frames = -1;
        } else if (!strcmp(opt, "--no_merge")) {
            config.cons.merge = false;
        } else if (!strcmp(opt, "--peak_min")) {
            config.cons.peak_min = atof(opt_val(argc, argv, i));
        } else if (!strcmp(opt, "--auc_min_sec")) {
            config.cons.auc_min_sec = atof(opt_val(argc, argv, i));
        } else if (!strcmp(opt, "--local_baseline")) {
            config.cons.local_baseline = true;
        } else if (!strcmp(opt, "--baseline_window")) {
            config.set_baseline(
                atoi(opt_val(argc, argv, i)), config.cons.baseline.min_frames
            );
        } else if (!strcmp(opt, "--baseline_min_frames")) {
            config.set_baseline(
                config.cons.baseline.window, atoi(opt_val(argc, argv, i))
            );
        } else if (!strcmp(opt, "--no_filter")) {
            config.cons.strength_filter = false;
        } else if (!strcmp(opt, "--group")) {
            val = opt_val(argc, argv, i);
            if (parse_group_mode(val, config.cons.group_mode)) bad_opt(opt, val);
        } else if (!strcmp(opt, "--pulse_gap_sec")) {
            config.cons.pulse_gap_sec = atof(opt_val(argc, argv, i));
        } else if (!strcmp(opt, "--boundary_gap_sec")) {
            config.cons.boundary_gap_sec = atof(opt_val(argc, argv, i));
        } else if (!strcmp(opt, "--select")) {
            val = opt_val(argc, argv, i);
            if (parse_select_policy(val, config.cons.select)) bad_opt(opt, val);
        } else if (!strcmp(opt, "--all_segments")) {
            config.cons.one_per_window = false;
        } else if (!strcmp(opt, "--fracs")) {
            val = opt_val(argc, argv, i);
            if (parse_double_list(val, config.stats.fracs)) bad_opt(opt, val);
        } else if (!strcmp(opt, "--commanded")) {
            val = opt_val(argc, argv, i);
            if (parse_double_list(val, config.commanded_ms)) bad_opt(opt, val);
        } else if (!strcmp(opt, "--sweep")) {
            val = opt_val(argc, argv, i);
            if (sweep_preset(atoi(val), config.commanded_ms)) bad_opt(opt, val);
        } else if (!strcmp(opt, "--summary")) {
            summary_file = opt_val(argc, argv, i);
        } else if (!strcmp(opt, "--trace")) {
            trace_file = opt_val(argc, argv, i);
        } else if (!strcmp(opt, "--no_trace")) {
            trace_file = 0;
        } else if (!strcmp(opt, "--cal_out")) {
            cal_file = opt_val(argc, argv, i);
        } else if (!strcmp(opt, "--verbose")) {
            config.verbose = true;
        } else {
            printf("unrecognized arg %s\n", opt);
            usage();
        }
    }
    if ((!infile) == (!metrics_file)) {
        fprintf(stderr, "error: give exactly one of --infile and --metrics\n");
        usage();
    }
    if (config.validate()) {
        exit(1);
    }
}

void write_or_die(int retval, const char* path) {
    if (retval) {
        fprintf(stderr, "error: can't write %s\n", path);
        exit(1);
    }
}

void report_calibration(const SHUTTER_CONFIG& config, const PIPELINE_RESULT& r) {
    const CAL_FIT& cal = r.cal;
    if (cal.status == CAL_COUNT_MISMATCH) {
        printf("\nNOTE: %d pulses detected, %d commanded; no fit.\n",
            cal.npulses, cal.ncommanded
        );
        printf("If pulses were missed or merged:\n"
            " - increase the gap between commanded pulses\n"
            " - increase --min_len to ignore chatter\n"
            " - increase --smooth or --plateau_frac to reduce fragmentation\n"
            " - adjust --merge_gap_sec, --peak_min or --auc_min_sec\n"
            " - adjust --topk for the source's size and brightness\n"
        );
        return;
    }
    if (cal.status == CAL_DEGENERATE) {
        printf("\ncalibration: not enough distinct commanded durations for a fit\n");
        if (cal.npulses > 0) {
            printf("constant loss (slope 1): %.3f ms\n", cal.loss);
        }
        return;
    }
    printf("\nfit: measured_ms = %.4f*commanded_ms + %.3f  (rms resid %.3f ms)\n",
        cal.slope, cal.intercept, cal.rms_resid
    );
    printf("constant loss (slope 1): %.3f ms\n", cal.loss);
    printf("to get effective exposure T ms, command (T + %.3f)/%.4f ms\n",
        cal.loss, cal.slope
    );
    if (cal_file) {
        write_or_die(
            write_calibration_csv(cal_file, config.commanded_ms, r.pulses, cal),
            cal_file
        );
        printf("wrote %s\n", cal_file);
    }
}

int main(int argc, char **argv) {
    SHUTTER_CONFIG config;
    vector<double> metrics;
    double nominal_fps = 0;
    int retval;

    parse_args(argc, argv, config);
    if (config.verbose) {
        config.print(stdout);
    }

    if (metrics_file) {
        retval = read_metric_file(metrics_file, metrics);
        if (retval) {
            fprintf(stderr, "error: %s: %s\n",
                metrics_file, frame_error_name(retval)
            );
            exit(1);
        }
        if (nframes > 0 && (long)metrics.size() > nframes) {
            metrics.resize(nframes);
        }
    } else {
        const char* dataset = config.dataset.empty()?NULL:config.dataset.c_str();
        retval = ingest_frames(
            infile, dataset, config.metric, nframes, metrics, nominal_fps
        );
        if (retval) {
            fprintf(stderr, "error: %s: %s\n", infile, frame_error_name(retval));
            exit(1);
        }
    }

    bool used_fallback;
    double fps = resolve_frame_rate(
        config.fps, nominal_fps, config.fallback_fps, used_fallback
    );
    if (used_fallback) {
        fprintf(stderr, "warning: frame rate missing; using %.2f fps\n", fps);
    }
    printf("frames: %d  fps: %.2f\n", (int)metrics.size(), fps);

    PIPELINE_RESULT r;
    retval = run_pipeline(metrics, fps, config, r);
    if (retval == PIPELINE_TOO_SHORT) {
        fprintf(stderr, "error: video too short (%d frames, need %d)\n",
            (int)metrics.size(), config.min_frames
        );
        exit(1);
    }
    printf("metric levels: closed %.3f, open %.3f, swing %.3f\n",
        r.levels.lo, r.levels.hi, r.levels.swing()
    );
    if (retval == PIPELINE_NO_SWING) {
        fprintf(stderr,
            "error: no brightness swing; the metric doesn't distinguish open from closed.\n"
            "Check that the light source is in the frames,\n"
            "or make the metric more sensitive (e.g. --topk 200).\n"
        );
        retval = write_no_pulse_outputs(summary_file, trace_file);
        if (retval) {
            fprintf(stderr, "error: can't write %s or %s\n",
                summary_file, trace_file ? trace_file : "(no trace)"
            );
            exit(1);
        }
        return 0;
    }

    printf("thresholds (%s): open %.3f, close %.3f\n",
        thresh_mode_name(config.hyst.mode),
        r.thresholds.open, r.thresholds.close
    );
    printf("open segments: %d raw, %d after merge (gap %d frames), "
        "%d after filter, %d final\n",
        r.nraw, r.nmerged, r.merge_gap_frames, r.nfiltered, r.nfinal
    );
    printf("crossings of open threshold: %d\n", r.ncrossings);

    write_or_die(write_summary_csv(summary_file, r.pulses), summary_file);
    printf("wrote %s (%d pulses)\n", summary_file, (int)r.pulses.size());
    if (trace_file) {
        write_or_die(
            write_trace_csv(trace_file, r.pulses, metrics, r.smoothed, fps),
            trace_file
        );
        printf("wrote %s\n", trace_file);
    }

    for (size_t i=0; i<r.pulses.size(); i++) {
        const PULSE_RECORD& p = r.pulses[i];
        printf("pulse %d: frames %d-%d  %.3f ms  peak %.3f  auc %.6f\n",
            p.pulse_id, p.seg.start, p.seg.end, p.duration_ms, p.peak_bs, p.auc
        );
    }

    if (r.cal_attempted) {
        report_calibration(config, r);
    }
    return 0;
}
