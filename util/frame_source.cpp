#include <string.h>
#include <cmath>

#include "frame_source.h"
#include "pff.h"
#include "pfits.h"
#include "ph5.h"

const char* frame_error_name(int retval) {
    switch (retval) {
    case 0: return "ok";
    case FRAME_SOURCE_EOF: return "end of file";
    case FRAME_ERROR_OPEN: return "can't open";
    case FRAME_ERROR_READ: return "read error";
    case FRAME_ERROR_FORMAT: return "bad format";
    case FRAME_ERROR_TYPE: return "unknown file type";
    }
    return "unknown error";
}

bool ends_with(const char* s, const char* suffix) {
    size_t n = strlen(s);
    size_t m = strlen(suffix);
    if (n<m) return false;
    return (strcmp(s+n-m, suffix)) == 0;
}

FRAME_SOURCE* make_frame_source(const char* path, const char* dataset) {
    if (is_pff_file(path)) {
        return new PFF_SOURCE;
    }
    if (ends_with(path, ".fits") || ends_with(path, ".fit")
        || ends_with(path, ".fz")
    ) {
        return new PFITS_SOURCE;
    }
    if (ends_with(path, ".h5") || ends_with(path, ".hdf5")) {
        PH5_SOURCE* ph5 = new PH5_SOURCE;
        if (dataset) ph5->dataset = dataset;
        return ph5;
    }
    return NULL;
}

bool frame_rate_valid(double fps) {
    if (std::isnan(fps)) return false;
    return fps > 1;
}

double resolve_frame_rate(
    double override_fps, double nominal, double fallback, bool& used_fallback
) {
    used_fallback = false;
    if (frame_rate_valid(override_fps)) return override_fps;
    if (frame_rate_valid(nominal)) return nominal;
    used_fallback = true;
    return fallback;
}
