#include <stdio.h>
#include <string.h>

#include "rapidjson/document.h"

#include "calibration.h"
#include "shutter_config.h"

using namespace rapidjson;

const char* config_error_name(int e) {
    switch (e) {
    case 0: return "no error";
    case CONFIG_ERROR_OPEN: return "can't open config file";
    case CONFIG_ERROR_PARSE: return "config file isn't valid JSON";
    case CONFIG_ERROR_KEY: return "unknown config key";
    case CONFIG_ERROR_VALUE: return "bad config value";
    }
    return "unknown error";
}

void SHUTTER_CONFIG::set_baseline(int window, int _min_frames) {
    cons.baseline.window = window;
    cons.baseline.min_frames = _min_frames;
    stats.baseline.window = window;
    stats.baseline.min_frames = _min_frames;
}

int SHUTTER_CONFIG::merge_gap(double _fps) const {
    if (merge_gap_frames >= 0) return merge_gap_frames;
    return (int)(merge_gap_sec*_fps);
}

////////// JSON ////////////////

static int bad_value(const char* key, const char* what) {
    fprintf(stderr, "error: config: %s must be %s\n", key, what);
    return CONFIG_ERROR_VALUE;
}

static int get_double(const char* key, const Value& v, double& x) {
    if (!v.IsNumber()) return bad_value(key, "a number");
    x = v.GetDouble();
    return 0;
}

static int get_int(const char* key, const Value& v, int& x) {
    if (!v.IsInt()) return bad_value(key, "an integer");
    x = v.GetInt();
    return 0;
}

static int get_bool(const char* key, const Value& v, bool& x) {
    if (!v.IsBool()) return bad_value(key, "true or false");
    x = v.GetBool();
    return 0;
}

static int get_double_list(const char* key, const Value& v, vector<double>& x) {
    if (!v.IsArray()) return bad_value(key, "a list of numbers");
    x.clear();
    for (SizeType i=0; i<v.Size(); i++) {
        if (!v[i].IsNumber()) return bad_value(key, "a list of numbers");
        x.push_back(v[i].GetDouble());
    }
    return 0;
}

int SHUTTER_CONFIG::parse_json(const char* text) {
    Document d;
    if (d.Parse(text).HasParseError()) {
        fprintf(stderr, "error: config: JSON parse error at offset %u\n",
            (unsigned)d.GetErrorOffset()
        );
        return CONFIG_ERROR_PARSE;
    }
    if (!d.IsObject()) {
        fprintf(stderr, "error: config: not a JSON object\n");
        return CONFIG_ERROR_PARSE;
    }

    // baseline_window and baseline_min_frames may come separately
    //
    int bw = cons.baseline.window;
    int bmin = cons.baseline.min_frames;

    for (Value::ConstMemberIterator it = d.MemberBegin();
        it != d.MemberEnd(); ++it
    ) {
        const char* key = it->name.GetString();
        const Value& v = it->value;
        int retval = 0;
        if (!strcmp(key, "metric")) {
            if (!v.IsString() || parse_metric_type(v.GetString(), metric.type)) {
                retval = bad_value(key, "topk, mean or sum");
            }
        } else if (!strcmp(key, "topk")) {
            retval = get_int(key, v, metric.topk);
        } else if (!strcmp(key, "smooth_width")) {
            retval = get_int(key, v, smooth_width);
        } else if (!strcmp(key, "lo_pct")) {
            retval = get_double(key, v, lo_pct);
        } else if (!strcmp(key, "hi_pct")) {
            retval = get_double(key, v, hi_pct);
        } else if (!strcmp(key, "swing_eps")) {
            retval = get_double(key, v, swing_eps);
        } else if (!strcmp(key, "min_frames")) {
            retval = get_int(key, v, min_frames);
        } else if (!strcmp(key, "mode")) {
            if (!v.IsString() || parse_thresh_mode(v.GetString(), hyst.mode)) {
                retval = bad_value(key, "midpoint or plateau");
            }
        } else if (!strcmp(key, "band_frac")) {
            retval = get_double(key, v, hyst.band_frac);
        } else if (!strcmp(key, "plateau_frac")) {
            retval = get_double(key, v, hyst.plateau_frac);
        } else if (!strcmp(key, "plateau_hyst_frac")) {
            retval = get_double(key, v, hyst.plateau_hyst_frac);
        } else if (!strcmp(key, "min_len_frames")) {
            retval = get_int(key, v, min_len_frames);
        } else if (!strcmp(key, "merge")) {
            retval = get_bool(key, v, cons.merge);
        } else if (!strcmp(key, "merge_gap_frames")) {
            retval = get_int(key, v, merge_gap_frames);
        } else if (!strcmp(key, "merge_gap_sec")) {
            retval = get_double(key, v, merge_gap_sec);
        } else if (!strcmp(key, "strength_filter")) {
            retval = get_bool(key, v, cons.strength_filter);
        } else if (!strcmp(key, "peak_min")) {
            retval = get_double(key, v, cons.peak_min);
        } else if (!strcmp(key, "auc_min_sec")) {
            retval = get_double(key, v, cons.auc_min_sec);
        } else if (!strcmp(key, "local_baseline")) {
            retval = get_bool(key, v, cons.local_baseline);
        } else if (!strcmp(key, "one_per_window")) {
            retval = get_bool(key, v, cons.one_per_window);
        } else if (!strcmp(key, "group")) {
            if (!v.IsString() || parse_group_mode(v.GetString(), cons.group_mode)) {
                retval = bad_value(key, "anchor or gap");
            }
        } else if (!strcmp(key, "pulse_gap_sec")) {
            retval = get_double(key, v, cons.pulse_gap_sec);
        } else if (!strcmp(key, "boundary_gap_sec")) {
            retval = get_double(key, v, cons.boundary_gap_sec);
        } else if (!strcmp(key, "select")) {
            if (!v.IsString() || parse_select_policy(v.GetString(), cons.select)) {
                retval = bad_value(key, "longest or strongest");
            }
        } else if (!strcmp(key, "baseline_window")) {
            retval = get_int(key, v, bw);
        } else if (!strcmp(key, "baseline_min_frames")) {
            retval = get_int(key, v, bmin);
        } else if (!strcmp(key, "fracs")) {
            retval = get_double_list(key, v, stats.fracs);
        } else if (!strcmp(key, "commanded_ms")) {
            retval = get_double_list(key, v, commanded_ms);
        } else if (!strcmp(key, "sweep")) {
            int n;
            retval = get_int(key, v, n);
            if (!retval && sweep_preset(n, commanded_ms)) {
                retval = bad_value(key, "1..4");
            }
        } else if (!strcmp(key, "fallback_fps")) {
            retval = get_double(key, v, fallback_fps);
        } else if (!strcmp(key, "fps")) {
            retval = get_double(key, v, fps);
        } else if (!strcmp(key, "dataset")) {
            if (!v.IsString()) {
                retval = bad_value(key, "a string");
            } else {
                dataset = v.GetString();
            }
        } else if (!strcmp(key, "verbose")) {
            retval = get_bool(key, v, verbose);
        } else {
            fprintf(stderr, "error: config: unknown key %s\n", key);
            retval = CONFIG_ERROR_KEY;
        }
        if (retval) return retval;
    }
    set_baseline(bw, bmin);
    return 0;
}

int SHUTTER_CONFIG::read_file(const char* path) {
    FILE* f = fopen(path, "r");
    if (!f) {
        fprintf(stderr, "error: can't open config file %s\n", path);
        return CONFIG_ERROR_OPEN;
    }
    string s;
    char buf[4096];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), f)) > 0) {
        s.append(buf, n);
    }
    fclose(f);
    return parse_json(s.c_str());
}

////////// VALIDATION ////////////////

int SHUTTER_CONFIG::validate() const {
    if (metric.topk < 1) return bad_value("topk", ">= 1");
    if (smooth_width < 1) return bad_value("smooth_width", ">= 1");
    if (lo_pct < 0 || hi_pct > 100 || lo_pct >= hi_pct) {
        return bad_value("lo_pct, hi_pct", "0 <= lo_pct < hi_pct <= 100");
    }
    if (swing_eps < 0) return bad_value("swing_eps", ">= 0");
    if (min_frames < 1) return bad_value("min_frames", ">= 1");
    // a zero band puts both thresholds at the same level
    //
    if (hyst.band_frac <= 0) return bad_value("band_frac", "> 0");
    if (hyst.plateau_frac < 0 || hyst.plateau_frac > 1) {
        return bad_value("plateau_frac", "in 0..1");
    }
    if (hyst.plateau_hyst_frac <= 0) return bad_value("plateau_hyst_frac", "> 0");
    if (min_len_frames < 1) return bad_value("min_len_frames", ">= 1");
    if (merge_gap_frames < -1) return bad_value("merge_gap_frames", ">= 0, or -1");
    if (merge_gap_sec < 0) return bad_value("merge_gap_sec", ">= 0");
    if (cons.auc_min_sec < 0) return bad_value("auc_min_sec", ">= 0");
    if (cons.pulse_gap_sec <= 0) return bad_value("pulse_gap_sec", "> 0");
    if (cons.boundary_gap_sec < 0) return bad_value("boundary_gap_sec", ">= 0");
    if (cons.baseline.window < 1) return bad_value("baseline_window", ">= 1");
    if (cons.baseline.min_frames < 1
        || cons.baseline.min_frames > cons.baseline.window
    ) {
        return bad_value("baseline_min_frames", "in 1..baseline_window");
    }
    for (size_t i=0; i<stats.fracs.size(); i++) {
        double f = stats.fracs[i];
        if (f <= 0 || f > 1) return bad_value("fracs", "in (0, 1]");
    }
    for (size_t i=0; i<commanded_ms.size(); i++) {
        if (commanded_ms[i] <= 0) return bad_value("commanded_ms", "> 0");
    }
    if (!frame_rate_valid(fallback_fps)) return bad_value("fallback_fps", "> 1");
    if (fps != 0 && !frame_rate_valid(fps)) return bad_value("fps", "> 1");
    return 0;
}

void SHUTTER_CONFIG::print(FILE* f) const {
    fprintf(f, "metric: %s", metric_type_name(metric.type));
    if (metric.type == METRIC_TOPK) fprintf(f, " (k=%d)", metric.topk);
    fprintf(f, "\nsmooth_width: %d\n", smooth_width);
    fprintf(f, "levels: %g/%g percentile, swing_eps %g\n",
        lo_pct, hi_pct, swing_eps
    );
    fprintf(f, "threshold mode: %s", thresh_mode_name(hyst.mode));
    if (hyst.mode == THRESH_MIDPOINT) {
        fprintf(f, " (band_frac %g)\n", hyst.band_frac);
    } else {
        fprintf(f, " (plateau_frac %g, hyst %g)\n",
            hyst.plateau_frac, hyst.plateau_hyst_frac
        );
    }
    fprintf(f, "min_len_frames: %d\n", min_len_frames);
    if (cons.merge) {
        if (merge_gap_frames >= 0) {
            fprintf(f, "merge gap: %d frames\n", merge_gap_frames);
        } else {
            fprintf(f, "merge gap: %g sec\n", merge_gap_sec);
        }
    } else {
        fprintf(f, "merge: off\n");
    }
    if (cons.strength_filter) {
        fprintf(f, "strength filter: peak >= %g, auc > %g (%s baseline)\n",
            cons.peak_min, cons.auc_min_sec,
            cons.local_baseline?"local":"global"
        );
    } else {
        fprintf(f, "strength filter: off\n");
    }
    if (cons.one_per_window) {
        fprintf(f, "window: group by %s (%g sec), select %s\n",
            group_mode_name(cons.group_mode),
            cons.group_mode==GROUP_BY_ANCHOR?cons.pulse_gap_sec:cons.boundary_gap_sec,
            select_policy_name(cons.select)
        );
    } else {
        fprintf(f, "window: off\n");
    }
    fprintf(f, "baseline: window %d, min %d frames\n",
        cons.baseline.window, cons.baseline.min_frames
    );
    fprintf(f, "fracs:");
    for (size_t i=0; i<stats.fracs.size(); i++) {
        fprintf(f, " %g", stats.fracs[i]);
    }
    fprintf(f, "\ncommanded_ms:");
    for (size_t i=0; i<commanded_ms.size(); i++) {
        fprintf(f, " %g", commanded_ms[i]);
    }
    fprintf(f, "\n");
}
