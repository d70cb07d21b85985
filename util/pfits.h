#ifndef SHUTTERCAL_PFITS_H
#define SHUTTERCAL_PFITS_H

// a FRAME_SOURCE that reads images from a FITS file.
// This encapsulates cfitsio.
//
// Two layouts are accepted:
// 1) one 3-D image; frame i is plane i (NAXIS3 = number of frames)
// 2) a sequence of 2-D image HDUs, one per frame.
//      The primary HDU may be header-only.
// The frame rate is the primary header's FPS or FRAMERATE keyword.
//
// NOTE: cfitsio converts all names into uppercase,
// and FITS arrays are 1-offset.

#include "fitsio.h"

#include "frame_source.h"

struct PFITS_SOURCE : FRAME_SOURCE {
    fitsfile *f;
    double fps;
    bool cube;          // layout 1
    long dims[3];
    long nframes;       // layout 1 only
    long iframe;
    bool need_move;     // layout 2: advance to next HDU before reading

    PFITS_SOURCE() {
        f = NULL;
        fps = 0;
        cube = false;
        dims[0] = dims[1] = dims[2] = 0;
        nframes = 0;
        iframe = 0;
        need_move = false;
    }
    ~PFITS_SOURCE() {
        close();
    }

    // report a cfitsio error; return the status
    //
    inline int check(int status, const char* where) {
        if (status) {
            fprintf(stderr, "FITS error in %s:\n", where);
            fits_report_error(stderr, status);
        }
        return status;
    }
    bool get_double(const char* name, double& val);

    int open(const char* path);
    double nominal_frame_rate() {
        return fps;
    }
    int next_frame(FRAME&);
    void close();
    int read_plane(long first_elem, FRAME&);
};

#endif
