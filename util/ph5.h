#ifndef SHUTTERCAL_PH5_H
#define SHUTTERCAL_PH5_H

// a FRAME_SOURCE that gets images from an HDF5 file
//
// integer return values are error codes; nonzero = error
//
// terminology:
// 'frame set': a sequence of frames stored as one 3-D HDF5 dataset
//      (frames x rows x columns; a 2-D dataset is a single frame).
//
// Frames are read one at a time, as a 1 x rows x columns hyperslab.
//
// A file holds either a single frame set (default name "/frames")
// or numbered frame sets <name>000000000, <name>000000001, ...
// which are read in order.
// The frame rate is the "frame_rate" attribute of the
// (first) dataset, or of the root group.

#include <string>
#include <vector>

#include "hdf5.h"

#include "frame_source.h"

using std::string;
using std::vector;

#define PH5_DEFAULT_DATASET "/frames"

struct FRAME_SET {
    hid_t dataset_id;
    hid_t space_id;
    int rank;
    int nframes;
    int ny, nx;

    FRAME_SET() {
        dataset_id = space_id = -1;
        rank = 0;
        nframes = ny = nx = 0;
    }
    ~FRAME_SET() {
        close();
    }
    int open(hid_t file_id, const char* name);
    int read_frame(int iframe, double* p);
    void close();
};

struct PH5_SOURCE : FRAME_SOURCE {
    hid_t file_id;
    string dataset;
    bool numbered;      // numbered frame sets
    int iset;           // current frame set, if numbered
    int iframe;         // next frame within current set
    FRAME_SET fs;
    double fps;

    PH5_SOURCE() {
        file_id = -1;
        dataset = PH5_DEFAULT_DATASET;
        numbered = false;
        iset = 0;
        iframe = 0;
        fps = 0;
    }
    ~PH5_SOURCE() {
        close();
    }
    bool exists(const char* name);
    int get_attr(const char* obj_name, const char* name, double&);

    int open(const char* path);
    double nominal_frame_rate() {
        return fps;
    }
    int next_frame(FRAME&);
    void close();
};

// name of frame set i
//
extern string frame_set_name(const string& base, int i);

#endif
