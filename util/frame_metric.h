#ifndef SHUTTERCAL_FRAME_METRIC_H
#define SHUTTERCAL_FRAME_METRIC_H

// reduce each frame to one number: higher means more light.
//
// METRIC_TOPK: mean of the K brightest pixels minus the median pixel.
//      Good for a small bright spot anywhere in the frame.
// METRIC_MEAN: mean pixel value
// METRIC_SUM: sum of pixel values

#include <vector>

#include "frame_source.h"

using std::vector;

typedef enum {
    METRIC_TOPK = 0,
    METRIC_MEAN,
    METRIC_SUM
} METRIC_TYPE;

#define REDUCE_BATCH_SIZE   256     // frames read before reducing in parallel

struct METRIC_PARAMS {
    METRIC_TYPE type;
    int topk;

    METRIC_PARAMS() {
        type = METRIC_TOPK;
        topk = 200;
    }
};

extern const char* metric_type_name(METRIC_TYPE);
extern int parse_metric_type(const char*, METRIC_TYPE&);

extern double topk_metric(const vector<double>& pix, int k);

// a frame with no pixels has metric 0
//
extern double frame_metric(const FRAME&, const METRIC_PARAMS&);

// read all frames (or the first max_frames if > 0) and reduce them.
// Frames are read in order, reduced in parallel a batch at a time;
// metrics[i] is the metric of frame i.
//
extern int reduce_frames(
    FRAME_SOURCE&, const METRIC_PARAMS&, long max_frames,
    vector<double>& metrics
);

// open a frame file, reduce it, close it.
// nominal_fps gets the source's nominal rate
//
extern int ingest_frames(
    const char* path, const char* dataset, const METRIC_PARAMS&,
    long max_frames, vector<double>& metrics, double& nominal_fps
);

// read already-reduced metrics, one number per line.
// Blank lines and lines starting with '#' are skipped.
//
extern int read_metric_file(const char* path, vector<double>& metrics);

#endif
