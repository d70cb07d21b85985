#include <stdio.h>

#include "pfits.h"

bool PFITS_SOURCE::get_double(const char* name, double& val) {
    int status = 0;
    fits_read_key(f, TDOUBLE, name, &val, NULL, &status);
    if (status) {
        // a missing key isn't an error; forget it
        //
        fits_clear_errmsg();
        return false;
    }
    return true;
}

int PFITS_SOURCE::open(const char* path) {
    int status = 0;
    int bitpix, naxis;

    fits_open_file(&f, path, READONLY, &status);
    if (check(status, "open_file")) {
        f = NULL;
        return FRAME_ERROR_OPEN;
    }
    if (!get_double("FPS", fps) && !get_double("FRAMERATE", fps)) {
        fps = 0;
    }
    fits_get_img_param(f, 3, &bitpix, &naxis, dims, &status);
    if (check(status, "get_img_param")) {
        return FRAME_ERROR_FORMAT;
    }
    switch (naxis) {
    case 3:
        cube = true;
        nframes = dims[2];
        break;
    case 2:
        cube = false;
        need_move = false;      // primary HDU is the first frame
        break;
    case 0:
        cube = false;
        need_move = true;
        break;
    default:
        fprintf(stderr, "%s: unexpected NAXIS %d\n", path, naxis);
        return FRAME_ERROR_FORMAT;
    }
    iframe = 0;
    return 0;
}

int PFITS_SOURCE::read_plane(long first_elem, FRAME& frame) {
    int status = 0;
    int anynull;
    double nullval = 0;
    frame.resize((int)dims[0], (int)dims[1]);
    fits_read_img(
        f, TDOUBLE, first_elem, (LONGLONG)frame.npixels(), &nullval,
        &frame.pix[0], &anynull, &status
    );
    if (check(status, "read_img")) {
        return FRAME_ERROR_READ;
    }
    return 0;
}

int PFITS_SOURCE::next_frame(FRAME& frame) {
    int status = 0;
    int retval;

    if (cube) {
        if (iframe >= nframes) return FRAME_SOURCE_EOF;
        retval = read_plane(1 + iframe*dims[0]*dims[1], frame);
        if (retval) return retval;
        iframe++;
        return 0;
    }

    // one image per HDU; skip HDUs that aren't 2-D images
    //
    while (1) {
        if (need_move) {
            int hdutype;
            fits_movrel_hdu(f, 1, &hdutype, &status);
            if (status == END_OF_FILE) {
                fits_clear_errmsg();
                return FRAME_SOURCE_EOF;
            }
            if (check(status, "movrel_hdu")) {
                return FRAME_ERROR_READ;
            }
            need_move = false;
            if (hdutype != IMAGE_HDU) {
                need_move = true;
                continue;
            }
        }
        int bitpix, naxis;
        fits_get_img_param(f, 3, &bitpix, &naxis, dims, &status);
        if (check(status, "get_img_param")) {
            return FRAME_ERROR_FORMAT;
        }
        need_move = true;
        if (naxis == 0) continue;
        if (naxis != 2) {
            fprintf(stderr, "frame %ld: unexpected NAXIS %d\n", iframe, naxis);
            return FRAME_ERROR_FORMAT;
        }
        break;
    }
    retval = read_plane(1, frame);
    if (retval) return retval;
    iframe++;
    return 0;
}

void PFITS_SOURCE::close() {
    if (f) {
        int status = 0;
        fits_close_file(f, &status);
        check(status, "close_file");
        f = NULL;
    }
}
