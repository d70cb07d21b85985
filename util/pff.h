// functions for reading/writing PanoSETI file format (.pff) files,
// and a FRAME_SOURCE that reads images from them.
//
// A PFF file is a sequence of blocks,
// each of which is either text (e.g. a JSON doc) or a binary image.
// Each block starts with a "block type" byte (see values below).
// Text blocks are terminated with a blank line (two newlines in a row)
//
// A PFF file is not self-describing; the image size and pixel type
// come from the file name (dp=, bpp=).
// The frame rate comes from data_config.json in the same directory:
//      {"image": {"integration_time_usec": 100, ...}, ...}

#ifndef SHUTTERCAL_PFF_H
#define SHUTTERCAL_PFF_H

#include <stdio.h>
#include <string>
#include <vector>

#include "frame_source.h"

using std::string;
using std::vector;

// block types
#define PFF_JSON_START '{'
#define PFF_IMAGE_START '*'

#define PFF_ERROR_BAD_TYPE  -1
#define PFF_ERROR_READ      -2

#define PFF_DATA_CONFIG     "data_config.json"

extern void pff_start_json(FILE* f);
extern void pff_end_json(FILE* f);
extern void pff_write_image(FILE* f, int nbytes, void* image);
extern int pff_read_json(FILE* f, string &s);
extern int pff_read_image(FILE* f, int nbytes, void* img);

typedef enum {
    DP_BIT16_IMG = 1,       // this must be first
    DP_BIT8_IMG,
    DP_PH_256_IMG,
    DP_PH_1024_IMG,
    DP_NONE                 // this must be last
} DATA_PRODUCT;

inline int bytes_per_pixel(DATA_PRODUCT dp) {
    if (dp == DP_BIT8_IMG) return 1;
    return 2;
}

// images are square
//
inline int image_dim(DATA_PRODUCT dp) {
    if (dp == DP_PH_256_IMG) return 16;
    return 32;
}

// the info encoded in a file name, e.g.
// start=2022-06-28T19:39:38Z,dp=img16,bpp=2,module=1,seqno=0.pff
// Unknown or missing fields keep their defaults.
//
struct FILENAME_INFO {
    DATA_PRODUCT data_product;
    int bytes_per_pixel;
    int module;
    int seqno;

    FILENAME_INFO() {
        data_product = DP_BIT16_IMG;
        bytes_per_pixel = 2;
        module = 0;
        seqno = 0;
    }
    int parse_filename(const char* name);
};

extern bool is_pff_file(const char*);

// directory part of a path ("." if none)
//
extern string dir_of(const char* path);

// read image.integration_time_usec from a data_config.json;
// return frame rate, or 0 if missing
//
extern double pff_config_frame_rate(const char* path);

struct PFF_SOURCE : FRAME_SOURCE {
    FILE* f;
    FILENAME_INFO fi;
    double fps;
    int dim;
    string header;          // JSON header of the last frame read
    vector<unsigned char> buf;

    PFF_SOURCE() {
        f = NULL;
        fps = 0;
        dim = 0;
    }
    ~PFF_SOURCE() {
        close();
    }
    int open(const char* path);
    double nominal_frame_rate() {
        return fps;
    }
    int next_frame(FRAME&);
    void close();
};

#endif
