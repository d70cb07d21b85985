#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <algorithm>
#include <functional>

#include "shutter_signal.h"
#include "frame_metric.h"

const char* metric_type_name(METRIC_TYPE type) {
    switch (type) {
    case METRIC_TOPK: return "topk";
    case METRIC_MEAN: return "mean";
    case METRIC_SUM: return "sum";
    }
    return "unknown";
}

int parse_metric_type(const char* s, METRIC_TYPE& type) {
    if (!strcmp(s, "topk")) {
        type = METRIC_TOPK;
    } else if (!strcmp(s, "mean")) {
        type = METRIC_MEAN;
    } else if (!strcmp(s, "sum")) {
        type = METRIC_SUM;
    } else {
        return -1;
    }
    return 0;
}

double topk_metric(const vector<double>& pix, int k) {
    int n = (int)pix.size();
    if (n == 0) return 0;
    if (k < 1) k = 1;
    if (k > n) k = n;

    double med = median(pix, 0, n);

    vector<double> s(pix);
    std::nth_element(s.begin(), s.begin()+(k-1), s.end(), std::greater<double>());
    double sum = 0;
    for (int i=0; i<k; i++) {
        sum += s[i];
    }
    return sum/k - med;
}

double frame_metric(const FRAME& frame, const METRIC_PARAMS& params) {
    int n = frame.npixels();
    if (n == 0) return 0;
    if (params.type == METRIC_TOPK) {
        return topk_metric(frame.pix, params.topk);
    }
    double sum = 0;
    for (int i=0; i<n; i++) {
        sum += frame.pix[i];
    }
    if (params.type == METRIC_SUM) return sum;
    return sum/n;
}

int reduce_frames(
    FRAME_SOURCE& fs, const METRIC_PARAMS& params, long max_frames,
    vector<double>& metrics
) {
    vector<FRAME> batch(REDUCE_BATCH_SIZE);
    metrics.clear();
    bool done = false;
    while (!done) {
        int n = 0;
        while (n < REDUCE_BATCH_SIZE) {
            if (max_frames > 0 && (long)metrics.size() + n >= max_frames) {
                done = true;
                break;
            }
            int retval = fs.next_frame(batch[n]);
            if (retval == FRAME_SOURCE_EOF) {
                done = true;
                break;
            }
            if (retval) {
                fprintf(stderr, "frame %ld: %s\n",
                    (long)metrics.size() + n, frame_error_name(retval)
                );
                return retval;
            }
            n++;
        }

        // each frame's metric goes in its own slot, so order is kept
        //
        size_t base = metrics.size();
        metrics.resize(base + n);
        #pragma omp parallel for schedule(static)
        for (int i=0; i<n; i++) {
            metrics[base+i] = frame_metric(batch[i], params);
        }
    }
    return 0;
}

int ingest_frames(
    const char* path, const char* dataset, const METRIC_PARAMS& params,
    long max_frames, vector<double>& metrics, double& nominal_fps
) {
    FRAME_SOURCE_HOLDER holder(make_frame_source(path, dataset));
    if (!holder.fs) {
        return FRAME_ERROR_TYPE;
    }
    int retval = holder.fs->open(path);
    if (retval) return retval;
    nominal_fps = holder.fs->nominal_frame_rate();
    return reduce_frames(*holder.fs, params, max_frames, metrics);
}

int read_metric_file(const char* path, vector<double>& metrics) {
    FILE* f = fopen(path, "r");
    if (!f) return FRAME_ERROR_OPEN;
    metrics.clear();
    char buf[256];
    int lineno = 0;
    int retval = 0;
    while (fgets(buf, sizeof(buf), f)) {
        lineno++;
        char* p = buf;
        while (*p == ' ' || *p == '\t') p++;
        if (*p == '#' || *p == '\n' || *p == '\r' || *p == 0) continue;
        char* end;
        double x = strtod(p, &end);
        if (end == p) {
            fprintf(stderr, "%s line %d: not a number\n", path, lineno);
            retval = FRAME_ERROR_FORMAT;
            break;
        }
        metrics.push_back(x);
    }
    fclose(f);
    return retval;
}
