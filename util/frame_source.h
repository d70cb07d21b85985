#ifndef SHUTTERCAL_FRAME_SOURCE_H
#define SHUTTERCAL_FRAME_SOURCE_H

// a FRAME_SOURCE supplies an ordered, finite sequence of images
// and (maybe) a nominal frame rate.
// Implementations: PFF_SOURCE (pff.h), PFITS_SOURCE (pfits.h),
// PH5_SOURCE (ph5.h).
//
// integer return values are error codes; nonzero = error

#include <vector>

using std::vector;

#define FRAME_SOURCE_EOF        1
#define FRAME_ERROR_OPEN        -1
#define FRAME_ERROR_READ        -2
#define FRAME_ERROR_FORMAT      -3
#define FRAME_ERROR_TYPE        -4      // unknown file type

#define DEFAULT_FALLBACK_FPS    110.

// one image, row-major
//
struct FRAME {
    int nx, ny;
    vector<double> pix;

    FRAME() {
        nx = ny = 0;
    }
    void resize(int _nx, int _ny) {
        nx = _nx;
        ny = _ny;
        pix.resize(nx*ny);
    }
    int npixels() const {
        return nx*ny;
    }
};

struct FRAME_SOURCE {
    virtual ~FRAME_SOURCE() {}
    virtual int open(const char* path) = 0;

    // frames/sec from file metadata; 0 if unknown
    //
    virtual double nominal_frame_rate() = 0;

    // read the next frame; return FRAME_SOURCE_EOF if there are no more
    //
    virtual int next_frame(FRAME&) = 0;

    // OK to call more than once
    //
    virtual void close() = 0;
};

// closes and deletes a source when it goes out of scope
//
struct FRAME_SOURCE_HOLDER {
    FRAME_SOURCE* fs;

    FRAME_SOURCE_HOLDER(FRAME_SOURCE* _fs) {
        fs = _fs;
    }
    ~FRAME_SOURCE_HOLDER() {
        if (fs) {
            fs->close();
            delete fs;
        }
    }
};

extern const char* frame_error_name(int);

// pick a source type from the file extension; NULL if unknown.
// For HDF5, "dataset" is the dataset path (NULL: default)
//
extern FRAME_SOURCE* make_frame_source(const char* path, const char* dataset);

extern bool ends_with(const char* s, const char* suffix);

// NaN, 0, and <= 1 aren't usable frame rates
//
extern bool frame_rate_valid(double fps);

// the rate to analyze with:
// override if valid, else nominal if valid, else fallback.
// "used_fallback" says whether the last case happened
//
extern double resolve_frame_rate(
    double override_fps, double nominal, double fallback, bool& used_fallback
);

#endif
